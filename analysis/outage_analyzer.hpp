#pragma once

#include "fdr.hpp"
#include "store/time_series_store.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fdr {

// Contiguous run of below-threshold (or redacted) margin samples.
// end_time is empty when the mission ends during the outage.
struct OutageInterval {
    std::string link_id;
    Timestamp start_time;
    std::optional<Timestamp> end_time;

    bool ongoing() const { return !end_time.has_value(); }

    // Ongoing outages are measured up to mission_end
    Duration duration(Timestamp mission_end) const {
        return end_time.value_or(mission_end) - start_time;
    }

    bool operator==(const OutageInterval& other) const {
        return link_id == other.link_id && start_time == other.start_time && end_time == other.end_time;
    }
};

// Per-link statistics handed to report generation
struct OutageSummary {
    std::string link_id;
    double threshold_db = 0.0;
    size_t count = 0;
    Duration total_duration{0};
    Duration longest_duration{0};
    bool ongoing_at_end = false;
};

struct LinkStatus {
    std::string link_id;
    bool in_outage = false;
    Sample margin;
};

class OutageAnalyzer {
public:
    // Throws std::invalid_argument on a null store
    explicit OutageAnalyzer(std::shared_ptr<const TimeSeriesStore> store);

    // One linear pass over the link's margin series. Redacted samples count as
    // outage: no data is never assumed healthy. Nothing is cached, so a new
    // threshold is simply a new call.
    Result<std::vector<OutageInterval>, Error> compute_outages(std::string_view link_id, double threshold_db) const;

    Result<OutageSummary, Error> summarize_link(std::string_view link_id, double threshold_db) const;

    // Every detected link, in registry order
    Result<std::vector<OutageSummary>, Error> summarize_all(double threshold_db) const;

    static OutageSummary summarize(const std::string& link_id, double threshold_db,
                                   const std::vector<OutageInterval>& intervals, Timestamp mission_end);

    // True when t falls inside one of the (time-ordered) intervals
    static bool in_outage(const std::vector<OutageInterval>& intervals, Timestamp t);

    static bool is_valid_threshold(double threshold_db);

    const TimeSeriesStore& store() const { return *_store; }

private:
    std::shared_ptr<const TimeSeriesStore> _store;
};

} // namespace fdr
