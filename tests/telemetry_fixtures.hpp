#pragma once

#include "fdr.hpp"
#include "ingest/csv_table.hpp"
#include "ingest/schema_validator.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace fdr_test {

inline const char* CORE_HEADER = "Timestamp,POS_Latitude_deg,POS_Longitude_deg,POS_Altitude_ft";

// Second-resolution timestamps on 2025-09-19
inline std::string ts(int seconds_after_nine) {
    return fdr::format_timestamp(*fdr::parse_timestamp("2025-09-19T09:00:00Z") +
                                 std::chrono::seconds(seconds_after_nine));
}

inline fdr::Timestamp at(int seconds_after_nine) {
    return *fdr::parse_timestamp(ts(seconds_after_nine));
}

inline std::string row(int seconds, const std::string& extra = "") {
    std::string line = ts(seconds) + ",34.05,-118.25,12000";
    if (!extra.empty()) line += "," + extra;
    return line;
}

// Full CSV line with custom position cells
inline std::string ts_line_with(int seconds, const std::string& rest) {
    return ts(seconds) + "," + rest + "\n";
}

inline fdr::RawTable table(const std::string& csv) {
    return fdr::parse_csv(csv).unwrap();
}

// Store with one COMM_LEO_dB column, one row per second starting at 09:00:00
inline std::shared_ptr<const fdr::TimeSeriesStore> leo_store(const std::vector<std::string>& margins) {
    std::string csv = std::string(CORE_HEADER) + ",COMM_LEO_dB\n";
    for (size_t i = 0; i < margins.size(); ++i) {
        csv += row(static_cast<int>(i), margins[i]) + "\n";
    }
    fdr::SchemaValidator validator;
    return validator.validate(table(csv)).unwrap().store;
}

// `count` records spaced `step_s` seconds apart, no subsystem fields
inline std::shared_ptr<const fdr::TimeSeriesStore> position_store(int count, int step_s) {
    std::string csv = std::string(CORE_HEADER) + "\n";
    for (int i = 0; i < count; ++i) {
        csv += row(i * step_s) + "\n";
    }
    fdr::SchemaValidator validator;
    return validator.validate(table(csv)).unwrap().store;
}

} // namespace fdr_test
