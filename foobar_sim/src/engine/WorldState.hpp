#pragma once

#include "core/Types.hpp"
#include "core/SimClock.hpp"
#include "agents/Robot.hpp"
#include <vector>

namespace foobar {

    // The simulated world: clock, robots, resource pools and money.
    // Pools are stacks; every take pops the most recently added unit.
    class WorldState {
    public:
        explicit WorldState(size_t initialRobots = INITIAL_ROBOTS);

        // Clock
        SimClock& getClock() { return clock_; }
        const SimClock& getClock() const { return clock_; }
        Tick getTick() const { return clock_.getTotalTicks(); }

        // Robots (append-only)
        const std::vector<Robot>& getRobots() const { return robots_; }
        std::vector<Robot>& getMutableRobots() { return robots_; }
        Robot& getRobot(size_t index) { return robots_.at(index); }
        const Robot& getRobot(size_t index) const { return robots_.at(index); }
        size_t getFleetSize() const { return robots_.size(); }
        void addRobot();

        // Minting assigns the next serial of its kind and puts the unit in the pool
        Foo mintFoo();
        Bar mintBar();

        // Pool contents
        const std::vector<Foo>& getFoos() const { return foos_; }
        const std::vector<Bar>& getBars() const { return bars_; }
        const std::vector<Foobar>& getFoobars() const { return foobars_; }

        // Draining an empty pool throws std::logic_error
        Foo takeFoo();
        Bar takeBar();
        std::vector<Foo> takeFoos(size_t count);
        std::vector<Foobar> takeFoobars(size_t count);

        void putBar(Bar bar) { bars_.push_back(bar); }
        void putFoobar(Foobar foobar) { foobars_.push_back(foobar); }

        // Money
        Money getMoney() const { return money_; }
        void credit(Money amount);
        void debit(Money amount);

        // Serial counters, never reset
        SerialId getNextFooId() const { return nextFooId_; }
        SerialId getNextBarId() const { return nextBarId_; }

        // Metrics
        const SimulationMetrics& getMetrics() const { return metrics_; }
        SimulationMetrics& getMutableMetrics() { return metrics_; }

    private:
        SimClock clock_;
        std::vector<Robot> robots_;

        std::vector<Foo> foos_;
        std::vector<Bar> bars_;
        std::vector<Foobar> foobars_;
        Money money_ = 0;

        SerialId nextFooId_ = 0;
        SerialId nextBarId_ = 0;

        SimulationMetrics metrics_;
    };

} // namespace foobar
