#pragma once

#include "engine/WorldState.hpp"

namespace foobar {

    // Expected pool sizes once every in-flight action has completed.
    // Assembly counts by its success rate, not by a sampled outcome.
    struct FutureState {
        double foos = 0.0;
        double bars = 0.0;
        double foobars = 0.0;
        double money = 0.0;
        double robots = 0.0;

        double getFooSurplus() const { return foos - bars; }
    };

    class Projection {
    public:
        // Not cached; computed from the world as it is right now
        static FutureState project(const WorldState& world);

        // Expected contribution of a single action, ChangingTask unwrapped once
        static void addExpected(const Action& action, FutureState& state);
    };

} // namespace foobar
