#pragma once

#include <cstdint>
#include <string>
#include "Types.hpp"

namespace foobar {

    // Counts simulation ticks; one tick is 100ms of simulated time
    class SimClock {
    public:
        SimClock();

        // Advance by one tick, returns the new tick count
        Tick tick();

        // Back to tick 0
        void reset() { totalTicks_ = 0; }

        // Get total ticks elapsed
        Tick getTotalTicks() const { return totalTicks_; }

        // Get milliseconds per tick in simulated time
        static constexpr Tick getSimMsPerTick() { return TICK_MS; }

        // Simulated time elapsed since tick 0
        uint64_t getElapsedMs() const { return totalTicks_ * TICK_MS; }
        double getElapsedSeconds() const { return static_cast<double>(totalTicks_) / 10.0; }

        // Format a tick count as HH:MM:SS.s of simulated time
        static std::string formatElapsed(Tick ticks);

        // Convenience: current elapsed time as HH:MM:SS.s
        std::string currentElapsedString() const { return formatElapsed(totalTicks_); }

    private:
        Tick totalTicks_ = 0;
    };

} // namespace foobar
