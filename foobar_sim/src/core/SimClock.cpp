#include "SimClock.hpp"
#include <sstream>
#include <iomanip>

namespace foobar {

    SimClock::SimClock() {}

    Tick SimClock::tick() {
        totalTicks_++;
        return totalTicks_;
    }

    std::string SimClock::formatElapsed(Tick ticks) {
        uint64_t tenths = ticks * TICK_MS / 100;
        uint64_t totalSeconds = tenths / 10;
        uint64_t hours = totalSeconds / 3600;
        uint64_t minutes = (totalSeconds / 60) % 60;
        uint64_t seconds = totalSeconds % 60;

        std::ostringstream ss;
        ss << std::setfill('0')
            << std::setw(2) << hours << ':'
            << std::setw(2) << minutes << ':'
            << std::setw(2) << seconds << '.'
            << (tenths % 10);
        return ss.str();
    }

} // namespace foobar
