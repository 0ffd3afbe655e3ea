#include "Projection.hpp"

namespace foobar {

    FutureState Projection::project(const WorldState& world) {
        FutureState state;
        state.foos = static_cast<double>(world.getFoos().size());
        state.bars = static_cast<double>(world.getBars().size());
        state.foobars = static_cast<double>(world.getFoobars().size());
        state.money = static_cast<double>(world.getMoney());
        state.robots = static_cast<double>(world.getFleetSize());

        for (const auto& robot : world.getRobots()) {
            addExpected(robot.getAction(), state);
        }

        return state;
    }

    void Projection::addExpected(const Action& action, FutureState& state) {
        const Action& real = action.pending();

        switch (real.getKind()) {
        case ActionKind::MINING_FOO:
            state.foos += 1.0;
            break;
        case ActionKind::MINING_BAR:
            state.bars += 1.0;
            break;
        case ActionKind::ASSEMBLING_FOOBAR:
            // A failed assembly hands the bar back
            state.foobars += ASSEMBLY_SUCCESS_RATE;
            state.bars += 1.0 - ASSEMBLY_SUCCESS_RATE;
            break;
        case ActionKind::SELLING_FOOBARS:
            state.money += static_cast<double>(
                static_cast<Money>(real.as<SellingFoobarsAction>()->foobars.size()) * FOOBAR_PRICE);
            break;
        case ActionKind::BUYING_ROBOT:
            state.money -= static_cast<double>(ROBOT_PRICE);
            state.robots += 1.0;
            break;
        case ActionKind::IDLE:
        case ActionKind::CHANGING_TASK:
            break;
        }
    }

} // namespace foobar
