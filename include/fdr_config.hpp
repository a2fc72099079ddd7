#pragma once

#include "fdr.hpp"
#include <cstddef>
#include <limits>
#include <string>

namespace fdr {

    // Header names of the four columns every mission file must carry
    struct CoreColumns {
        std::string timestamp = "Timestamp";
        std::string latitude = "POS_Latitude_deg";
        std::string longitude = "POS_Longitude_deg";
        std::string altitude = "POS_Altitude_ft";

        bool contains(const std::string& name) const {
            return name == timestamp || name == latitude || name == longitude || name == altitude;
        }
    };

    struct ValidatorConfig {
        CoreColumns columns;
        double redacted_sentinel = REDACTED_SENTINEL;
        double min_latitude_deg = -90.0;
        double max_latitude_deg = 90.0;
        double min_longitude_deg = -180.0;
        double max_longitude_deg = 180.0;

        // Counters are always exact; this only caps the per-row detail kept in the report
        size_t max_recorded_rejections = 1000;
    };

    struct PlaybackConfig {
        double min_speed = MIN_SPEED_MULTIPLIER;
        double max_speed = MAX_SPEED_MULTIPLIER;
        double initial_speed = 1.0;
    };

    struct OutageConfig {
        double default_threshold_db = 3.0;
    };

    struct MissionConfig {
        ValidatorConfig validator;
        PlaybackConfig playback;
        OutageConfig outage;
    };

    // Factory methods for MissionConfig
    // Common configurations for typical hosts
    namespace config {

        inline MissionConfig defaults() {
            return MissionConfig{};
        }

        // Keeps every row rejection in the report, for offline audits of bad logs
        inline MissionConfig strict() {
            MissionConfig config;
            config.validator.max_recorded_rejections = std::numeric_limits<size_t>::max();
            return config;
        }

        // Multi-hour missions reviewed at one simulated minute per second
        inline MissionConfig fast_scrub() {
            MissionConfig config;
            config.playback.initial_speed = 60.0;
            return config;
        }

    } // namespace config

} // namespace fdr
