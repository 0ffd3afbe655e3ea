#pragma once

#include "core/Types.hpp"
#include "engine/WorldState.hpp"
#include "engine/EventLog.hpp"

namespace foobar {

    // First phase of a tick: runs down every robot's action and applies the
    // effect of the ones that finish.
    class ProgressEngine {
    public:
        ProgressEngine(WorldState& world, SuccessDraw draw, EventLog* events = nullptr);

        // All robots, in collection order
        void advance();

        // One tick of work for a single robot
        void advanceRobot(size_t index);

    private:
        WorldState& world_;
        SuccessDraw draw_;
        EventLog* events_ = nullptr;

        // Unwraps finished ChangingTasks until a running or idle action is reached
        void resolve(size_t index);

        // Apply the effect of a finished action and put the robot to rest
        void complete(size_t index);

        void completeAssembly(size_t index, const AssemblingFoobarAction& assembly);
        void completeSale(size_t index, const SellingFoobarsAction& sale);
        void completePurchase(size_t index, const BuyingRobotAction& purchase);

        void record(EventType type, size_t robot, int64_t amount, std::string detail = "");
    };

} // namespace foobar
