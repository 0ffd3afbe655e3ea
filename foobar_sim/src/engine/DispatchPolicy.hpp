#pragma once

#include "core/Types.hpp"
#include "engine/WorldState.hpp"

namespace foobar {

    // Second phase of a tick: gives every idle robot its next action.
    //
    // Tiers, first match wins:
    //   1. buy a robot      (money > 3 and more than 6 foos)
    //   2. sell foobars     (at least 5 foobars)
    //   3. assemble foobar  (more than 6 foos and at least one bar)
    //   4. mine foo or bar, whichever the projection says is short
    // Tiers 1-3 also need shouldThisRobotDoThatAction() to agree.
    class DispatchPolicy {
    public:
        DispatchPolicy(WorldState& world, SuccessDraw draw);

        // All idle robots, in collection order
        void dispatch();

        // Choose and start the next action for one idle robot
        void dispatchRobot(size_t index);

        // A robot may take a contested action if it did that action last, or
        // if no other robot was the last to do it. Plain scan over the fleet.
        bool shouldThisRobotDoThatAction(size_t index, ActionKind kind) const;

        bool canBuyRobot() const;
        bool canSellFoobars() const;
        bool canAssembleFoobar() const;

        // Money minus the price of every purchase already under way
        Money getUncommittedMoney() const;

        // MINING_FOO while the projected foo surplus is below target, else MINING_BAR
        ActionKind chooseMiningKind() const;

    private:
        WorldState& world_;
        SuccessDraw draw_;

        // Starts the action, behind a ChangingTask when it differs from what
        // the robot just finished
        void start(size_t index, Action action);
    };

} // namespace foobar
