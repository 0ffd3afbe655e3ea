#include "Action.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace foobar {

    ChangingTaskAction::ChangingTaskAction(Action action)
        : next(std::make_unique<Action>(std::move(action)))
    {
    }

    ChangingTaskAction::ChangingTaskAction(ChangingTaskAction&& other) noexcept = default;
    ChangingTaskAction& ChangingTaskAction::operator=(ChangingTaskAction&& other) noexcept = default;
    ChangingTaskAction::~ChangingTaskAction() = default;

    Action::Action(Payload payload, Tick remaining)
        : payload_(std::move(payload))
        , remaining_(remaining)
    {
    }

    Action Action::idle(std::optional<ActionKind> previous) {
        return Action(IdleAction{ previous }, 0);
    }

    Action Action::changingTask(Action next) {
        return Action(ChangingTaskAction(std::move(next)), CHANGING_TASK_TICKS);
    }

    Action Action::miningFoo() {
        return Action(MiningFooAction{}, MINING_FOO_TICKS);
    }

    Action Action::miningBar(double draw) {
        auto extra = static_cast<Tick>(std::lround(draw * MINING_BAR_SPREAD_TICKS));
        return Action(MiningBarAction{}, extra + MINING_BAR_MIN_TICKS);
    }

    Action Action::assemblingFoobar(Foo foo, Bar bar) {
        return Action(AssemblingFoobarAction{ foo, bar }, ASSEMBLING_TICKS);
    }

    Action Action::sellingFoobars(std::vector<Foobar> foobars) {
        if (foobars.size() > MAX_FOOBARS_PER_SALE) {
            throw std::invalid_argument("Cannot sell " + std::to_string(foobars.size()) +
                " foobars at once (max " + std::to_string(MAX_FOOBARS_PER_SALE) + ")");
        }
        return Action(SellingFoobarsAction{ std::move(foobars) }, SELLING_TICKS);
    }

    Action Action::buyingRobot(std::vector<Foo> foos) {
        if (foos.size() != FOOS_PER_ROBOT) {
            throw std::invalid_argument("Buying a robot takes exactly " +
                std::to_string(FOOS_PER_ROBOT) + " foos, got " + std::to_string(foos.size()));
        }
        return Action(BuyingRobotAction{ std::move(foos) }, BUYING_ROBOT_TICKS);
    }

    ActionKind Action::getKind() const {
        switch (payload_.index()) {
        case 0: return ActionKind::IDLE;
        case 1: return ActionKind::CHANGING_TASK;
        case 2: return ActionKind::MINING_FOO;
        case 3: return ActionKind::MINING_BAR;
        case 4: return ActionKind::ASSEMBLING_FOOBAR;
        case 5: return ActionKind::SELLING_FOOBARS;
        default: return ActionKind::BUYING_ROBOT;
        }
    }

    bool Action::tickDown() {
        if (remaining_ > 0) {
            remaining_--;
        }
        return remaining_ == 0;
    }

    const Action& Action::pending() const {
        if (auto* changing = as<ChangingTaskAction>()) {
            return *changing->next;
        }
        return *this;
    }

    std::string Action::describe() const {
        std::string text = toString(getKind());

        if (auto* idle = as<IdleAction>()) {
            text += " (previous: " + toString(idle->previous) + ")";
        }
        else if (auto* changing = as<ChangingTaskAction>()) {
            text += " -> " + changing->next->describe();
        }
        else if (auto* assembling = as<AssemblingFoobarAction>()) {
            text += " (foo #" + std::to_string(assembling->foo.id) +
                ", bar #" + std::to_string(assembling->bar.id) + ")";
        }
        else if (auto* selling = as<SellingFoobarsAction>()) {
            text += " (" + std::to_string(selling->foobars.size()) + " foobars)";
        }
        else if (auto* buying = as<BuyingRobotAction>()) {
            text += " (" + std::to_string(buying->foos.size()) + " foos)";
        }

        return text + " [" + std::to_string(remaining_) + " ticks left]";
    }

} // namespace foobar
