#pragma once

#include <cstdint>
#include <string>
#include "TemporalContext.hpp"

namespace merchant {

    // Maps simulation ticks to in-game days and seasons.
    // Days are numbered from 1; seasons change every daysPerSeason days and
    // cycle spring -> summer -> autumn -> winter.
    class SimClock {
    public:
        SimClock();

        void initialize(int ticksPerDay = 1, int daysPerSeason = 30);

        // Advance by one tick, returns total ticks elapsed
        uint64_t tick();

        int getTicksPerDay() const { return ticksPerDay_; }
        int getDaysPerSeason() const { return daysPerSeason_; }
        int getTickInDay() const { return tickInDay_; }
        int getCurrentDay() const { return currentDay_; }
        uint64_t getTotalTicks() const { return totalTicks_; }

        // Check if a new day just started
        bool isNewDay() const { return tickInDay_ == 0 && totalTicks_ > 0; }

        std::string currentSeason() const { return seasonForDay(currentDay_, daysPerSeason_); }

        // Context handed to strategies for the current tick
        TemporalContext context() const;

        static std::string seasonForDay(int day, int daysPerSeason);

    private:
        int ticksPerDay_ = 1;
        int daysPerSeason_ = 30;
        int tickInDay_ = 0;
        int currentDay_ = 1;
        uint64_t totalTicks_ = 0;
    };

} // namespace merchant
