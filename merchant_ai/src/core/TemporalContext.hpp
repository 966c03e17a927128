#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <string>

namespace merchant {

    // Ambient key-value context for a turn. Only "season" is read today.
    class TemporalContext {
    public:
        static constexpr const char* SEASON_KEY = "season";
        static constexpr const char* DEFAULT_SEASON = "spring";

        TemporalContext() = default;

        static TemporalContext withSeason(const std::string& season) {
            TemporalContext ctx;
            ctx.set(SEASON_KEY, season);
            return ctx;
        }

        void set(const std::string& key, const std::string& value) { values_[key] = value; }

        bool has(const std::string& key) const { return values_.count(key) > 0; }

        std::string get(const std::string& key, const std::string& fallback = "") const {
            auto it = values_.find(key);
            return it != values_.end() ? it->second : fallback;
        }

        // Lower-cased season, "spring" when absent or blank
        std::string season() const {
            std::string s = get(SEASON_KEY);
            if (s.empty()) return DEFAULT_SEASON;
            std::transform(s.begin(), s.end(), s.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

    private:
        std::map<std::string, std::string> values_;
    };

} // namespace merchant
