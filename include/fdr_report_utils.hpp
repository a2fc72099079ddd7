#pragma once

#include "fdr.hpp"
#include "analysis/outage_analyzer.hpp"
#include "ingest/schema_validator.hpp"
#include "playback/playback_engine.hpp"
#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

namespace fdr {

inline std::ostream& operator<<(std::ostream& os, fdr::Error error) {
    return os << to_str(error);
}

inline std::ostream& operator<<(std::ostream& os, PlaybackStatus status) {
    return os << to_str(status);
}

inline std::string join_names(const std::vector<std::string>& names) {
    if (names.empty()) {
        return "-";
    }
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ", ";
        out += names[i];
    }
    return out;
}

inline void print_validation_report(const ValidationReport& report, size_t max_rejections = 10) {
    printf("\n=== Validation Report ===\n");
    printf("  - Rows: %zu total, %zu accepted, %zu rejected (%zu duplicate timestamps)\n",
        report.total_rows, report.accepted_rows, report.rejected_rows, report.duplicate_rows);
    printf("  - Redacted cells: %zu (%zu unparseable)\n",
        report.redacted_cell_count, report.unparseable_cell_count);
    if (report.empty_dataset) {
        printf("  - WARNING: no rows survived validation\n");
    }
    printf("  - Subsystems: %s\n", join_names(report.detected_subsystems).c_str());
    printf("  - Payloads: %s\n", join_names(report.detected_payloads).c_str());
    printf("  - Links: %s\n", join_names(report.detected_links).c_str());
    printf("  - Fields with redactions: %s\n", join_names(report.redacted_fields).c_str());

    if (report.rejections.empty()) {
        return;
    }

    printf("\n%-8s | %-28s | %s\n", "Row", "Error", "Detail");
    printf("%s\n", std::string(72, '-').c_str());
    size_t shown = 0;
    for (const auto& r : report.rejections) {
        if (shown++ == max_rejections) {
            printf("... %zu more\n", report.rejections.size() - max_rejections);
            break;
        }
        printf("%-8zu | %-28s | %s\n", r.row, to_str(r.error), r.detail.c_str());
    }
}

inline void print_outage_summaries(const std::vector<OutageSummary>& summaries) {
    printf("\n=== Link Outages ===\n");
    if (summaries.empty()) {
        printf("No communication links detected.\n");
        return;
    }

    printf("%-16s | %8s | %6s | %12s | %12s | %s\n",
        "Link", "Thr(dB)", "Count", "Total(s)", "Longest(s)", "Ongoing");
    printf("%s\n", std::string(80, '-').c_str());
    for (const auto& s : summaries) {
        printf("%-16s | %8.2f | %6zu | %12.1f | %12.1f | %s\n",
            s.link_id.c_str(),
            s.threshold_db,
            s.count,
            to_seconds(s.total_duration),
            to_seconds(s.longest_duration),
            s.ongoing_at_end ? "YES" : "no");
    }
}

inline void print_outages(const std::vector<OutageInterval>& intervals, Timestamp mission_end) {
    for (const auto& o : intervals) {
        printf("  %s  %s -> %s (%.1f s)\n",
            o.link_id.c_str(),
            format_timestamp(o.start_time).c_str(),
            o.ongoing() ? "ongoing" : format_timestamp(*o.end_time).c_str(),
            to_seconds(o.duration(mission_end)));
    }
}

// One status line per playback tick
inline void print_frame(const PlaybackFrame& frame) {
    printf("[%-7s x%-6.1f] %s", to_str(frame.state.status), frame.state.speed_multiplier,
        format_timestamp(frame.state.current_time).c_str());
    if (frame.record) {
        printf("  lat %9.4f lon %10.4f alt %8.0f ft",
            frame.record->latitude_deg, frame.record->longitude_deg, frame.record->altitude_ft);
    }
    if (frame.link) {
        if (frame.link->margin.is_measured()) {
            printf("  %s %6.2f dB%s", frame.link->link_id.c_str(), frame.link->margin.value(),
                frame.link->in_outage ? " OUTAGE" : "");
        } else {
            printf("  %s redacted%s", frame.link->link_id.c_str(), frame.link->in_outage ? " OUTAGE" : "");
        }
    }
    printf("\n");
}

} // namespace fdr
