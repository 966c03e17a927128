#include "SimClock.hpp"
#include <algorithm>

namespace merchant {

    SimClock::SimClock() {}

    void SimClock::initialize(int ticksPerDay, int daysPerSeason) {
        ticksPerDay_ = std::max(1, ticksPerDay);
        daysPerSeason_ = std::max(1, daysPerSeason);
        tickInDay_ = 0;
        currentDay_ = 1;
        totalTicks_ = 0;
    }

    uint64_t SimClock::tick() {
        totalTicks_++;
        tickInDay_++;

        if (tickInDay_ >= ticksPerDay_) {
            tickInDay_ = 0;
            currentDay_++;
        }

        return totalTicks_;
    }

    TemporalContext SimClock::context() const {
        TemporalContext ctx = TemporalContext::withSeason(currentSeason());
        ctx.set("day", std::to_string(currentDay_));
        return ctx;
    }

    std::string SimClock::seasonForDay(int day, int daysPerSeason) {
        static const char* seasons[] = { "spring", "summer", "autumn", "winter" };
        if (day < 1) day = 1;
        if (daysPerSeason < 1) daysPerSeason = 1;
        int index = ((day - 1) / daysPerSeason) % 4;
        return seasons[index];
    }

} // namespace merchant
