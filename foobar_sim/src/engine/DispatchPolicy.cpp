#include "DispatchPolicy.hpp"
#include "engine/Projection.hpp"
#include "utils/Logger.hpp"
#include <utility>

namespace foobar {

    DispatchPolicy::DispatchPolicy(WorldState& world, SuccessDraw draw)
        : world_(world)
        , draw_(std::move(draw))
    {
    }

    void DispatchPolicy::dispatch() {
        for (size_t i = 0; i < world_.getFleetSize(); ++i) {
            if (world_.getRobot(i).isIdle()) {
                dispatchRobot(i);
            }
        }
    }

    void DispatchPolicy::dispatchRobot(size_t index) {
        if (canBuyRobot() && shouldThisRobotDoThatAction(index, ActionKind::BUYING_ROBOT)) {
            start(index, Action::buyingRobot(world_.takeFoos(FOOS_PER_ROBOT)));
            return;
        }

        if (canSellFoobars() && shouldThisRobotDoThatAction(index, ActionKind::SELLING_FOOBARS)) {
            start(index, Action::sellingFoobars(world_.takeFoobars(MAX_FOOBARS_PER_SALE)));
            return;
        }

        if (canAssembleFoobar() && shouldThisRobotDoThatAction(index, ActionKind::ASSEMBLING_FOOBAR)) {
            Foo foo = world_.takeFoo();
            Bar bar = world_.takeBar();
            start(index, Action::assemblingFoobar(foo, bar));
            return;
        }

        if (chooseMiningKind() == ActionKind::MINING_FOO) {
            start(index, Action::miningFoo());
        }
        else {
            start(index, Action::miningBar(draw_()));
        }
    }

    bool DispatchPolicy::shouldThisRobotDoThatAction(size_t index, ActionKind kind) const {
        if (world_.getRobot(index).getPreviousAction() == kind) {
            return true;
        }

        const auto& robots = world_.getRobots();
        for (size_t i = 0; i < robots.size(); ++i) {
            if (i != index && robots[i].getLastCompleted() == kind) {
                return false;
            }
        }
        return true;
    }

    bool DispatchPolicy::canBuyRobot() const {
        return getUncommittedMoney() > ROBOT_PRICE
            && world_.getFoos().size() > FOOS_PER_ROBOT;
    }

    bool DispatchPolicy::canSellFoobars() const {
        return world_.getFoobars().size() >= MAX_FOOBARS_PER_SALE;
    }

    bool DispatchPolicy::canAssembleFoobar() const {
        return world_.getFoos().size() > FOOS_PER_ROBOT
            && !world_.getBars().empty();
    }

    Money DispatchPolicy::getUncommittedMoney() const {
        Money committed = 0;
        for (const auto& robot : world_.getRobots()) {
            if (robot.getAction().getPendingKind() == ActionKind::BUYING_ROBOT) {
                committed += ROBOT_PRICE;
            }
        }
        return world_.getMoney() - committed;
    }

    ActionKind DispatchPolicy::chooseMiningKind() const {
        FutureState future = Projection::project(world_);
        Logger::trace("Projection at tick {}: {:.1f} foos, {:.1f} bars, {:.1f} foobars",
            world_.getTick(), future.foos, future.bars, future.foobars);

        return future.getFooSurplus() < FOO_SURPLUS_TARGET
            ? ActionKind::MINING_FOO
            : ActionKind::MINING_BAR;
    }

    void DispatchPolicy::start(size_t index, Action action) {
        Robot& robot = world_.getRobot(index);
        auto previous = robot.getPreviousAction();

        if (previous && *previous != action.getKind()) {
            Logger::debug("Robot {} switching from {} to {}",
                index, toString(*previous), action.describe());
            world_.getMutableMetrics().taskSwitches++;
            robot.setAction(Action::changingTask(std::move(action)));
        }
        else {
            Logger::debug("Robot {} starts {}", index, action.describe());
            robot.setAction(std::move(action));
        }
    }

} // namespace foobar
