#include "ProgressEngine.hpp"
#include "utils/Logger.hpp"
#include <utility>

namespace foobar {

    ProgressEngine::ProgressEngine(WorldState& world, SuccessDraw draw, EventLog* events)
        : world_(world)
        , draw_(std::move(draw))
        , events_(events)
    {
    }

    void ProgressEngine::advance() {
        // Robots bought during this pass join the list idle and are not advanced
        size_t count = world_.getFleetSize();
        for (size_t i = 0; i < count; ++i) {
            advanceRobot(i);
        }
    }

    void ProgressEngine::advanceRobot(size_t index) {
        Action& action = world_.getRobot(index).getMutableAction();
        if (action.isIdle()) {
            return;
        }

        if (!action.tickDown()) {
            return;
        }

        resolve(index);
    }

    void ProgressEngine::resolve(size_t index) {
        while (true) {
            Robot& robot = world_.getRobot(index);
            Action& action = robot.getMutableAction();

            if (action.isIdle() || !action.isDone()) {
                return;
            }

            if (auto* changing = action.as<ChangingTaskAction>()) {
                Action next = std::move(*changing->next);
                Logger::debug("Robot {} finished changing task, starting {}", index, next.describe());
                robot.setAction(std::move(next));
                continue;
            }

            complete(index);
            return;
        }
    }

    void ProgressEngine::complete(size_t index) {
        Robot& robot = world_.getRobot(index);
        const Action& action = robot.getAction();
        ActionKind kind = action.getKind();

        switch (kind) {
        case ActionKind::MINING_FOO: {
            Foo foo = world_.mintFoo();
            robot.complete(kind);
            record(EventType::FOO_MINED, index, static_cast<int64_t>(foo.id));
            break;
        }
        case ActionKind::MINING_BAR: {
            Bar bar = world_.mintBar();
            robot.complete(kind);
            record(EventType::BAR_MINED, index, static_cast<int64_t>(bar.id));
            break;
        }
        case ActionKind::ASSEMBLING_FOOBAR:
            completeAssembly(index, *action.as<AssemblingFoobarAction>());
            break;
        case ActionKind::SELLING_FOOBARS:
            completeSale(index, *action.as<SellingFoobarsAction>());
            break;
        case ActionKind::BUYING_ROBOT:
            completePurchase(index, *action.as<BuyingRobotAction>());
            break;
        case ActionKind::IDLE:
        case ActionKind::CHANGING_TASK:
            break;
        }
    }

    void ProgressEngine::completeAssembly(size_t index, const AssemblingFoobarAction& assembly) {
        Foo foo = assembly.foo;
        Bar bar = assembly.bar;
        auto& metrics = world_.getMutableMetrics();
        std::string pair = fmt::format("(foo #{}, bar #{})", foo.id, bar.id);

        if (draw_() < ASSEMBLY_SUCCESS_RATE) {
            world_.putFoobar(Foobar{ foo, bar });
            metrics.foobarsAssembled++;
            world_.getRobot(index).complete(ActionKind::ASSEMBLING_FOOBAR);
            record(EventType::FOOBAR_ASSEMBLED, index, static_cast<int64_t>(world_.getFoobars().size()), pair);
        }
        else {
            // The foo is lost, the bar goes back to the pool
            world_.putBar(bar);
            metrics.assemblyFailures++;
            metrics.foosDiscarded++;
            world_.getRobot(index).complete(ActionKind::ASSEMBLING_FOOBAR);
            record(EventType::ASSEMBLY_FAILED, index, static_cast<int64_t>(foo.id), pair);
        }
    }

    void ProgressEngine::completeSale(size_t index, const SellingFoobarsAction& sale) {
        auto sold = static_cast<Money>(sale.foobars.size());
        world_.credit(sold * FOOBAR_PRICE);
        world_.getMutableMetrics().foobarsSold += static_cast<uint64_t>(sold);
        world_.getRobot(index).complete(ActionKind::SELLING_FOOBARS);
        record(EventType::FOOBARS_SOLD, index, sold, fmt::format("balance {}", world_.getMoney()));
    }

    void ProgressEngine::completePurchase(size_t index, const BuyingRobotAction& purchase) {
        auto& metrics = world_.getMutableMetrics();
        metrics.foosSpentOnRobots += purchase.foos.size();
        metrics.robotsBought++;

        // Complete before growing the fleet: adding a robot may move the list
        world_.getRobot(index).complete(ActionKind::BUYING_ROBOT);
        world_.debit(ROBOT_PRICE);
        if (world_.getMoney() < 0) {
            Logger::error("Money went negative ({}) after robot {} bought a robot at tick {}",
                world_.getMoney(), index, world_.getTick());
        }
        world_.addRobot();

        record(EventType::ROBOT_BOUGHT, index, static_cast<int64_t>(world_.getFleetSize()));
    }

    void ProgressEngine::record(EventType type, size_t robot, int64_t amount, std::string detail) {
        if (events_) {
            events_->record(world_.getTick(), type, robot, amount, std::move(detail));
        }
    }

} // namespace foobar
