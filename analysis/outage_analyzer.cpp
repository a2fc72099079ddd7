#include "outage_analyzer.hpp"
#include "zf_log.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace fdr {

OutageAnalyzer::OutageAnalyzer(std::shared_ptr<const TimeSeriesStore> store)
    : _store(std::move(store))
{
    if (!_store) {
        throw std::invalid_argument("OutageAnalyzer requires a store.");
    }
}

bool OutageAnalyzer::is_valid_threshold(double threshold_db) {
    return std::isfinite(threshold_db) && threshold_db >= 0.0;
}

Result<std::vector<OutageInterval>, Error> OutageAnalyzer::compute_outages(std::string_view link_id, double threshold_db) const {
    if (!is_valid_threshold(threshold_db)) {
        ZF_LOGW("Rejected outage threshold %f dB", threshold_db);
        return Error::InvalidParameter;
    }

    const LinkDescriptor* link = _store->registry().find_link(link_id);
    if (!link) {
        return Error::UnknownLink;
    }

    auto series_result = _store->value_series(link->margin_field());
    if (series_result.is_err()) {
        return series_result.unwrap_err();
    }
    const ValueSeries& series = series_result.unwrap();

    std::vector<OutageInterval> intervals;
    bool in_outage = false;
    Timestamp start{};
    Timestamp last_outage_sample{};
    size_t samples = 0;

    for (const SeriesPoint& point : series) {
        ++samples;
        const bool below = point.value.is_redacted() || point.value.value() < threshold_db;
        if (below) {
            if (!in_outage) {
                in_outage = true;
                start = point.timestamp;
            }
            last_outage_sample = point.timestamp;
        } else if (in_outage) {
            intervals.push_back(OutageInterval{link->id, start, last_outage_sample});
            in_outage = false;
        }
    }
    if (in_outage) {
        // A one-sample mission has nothing after its only sample, so the outage closes on it
        std::optional<Timestamp> end;
        if (samples == 1) {
            end = start;
        }
        intervals.push_back(OutageInterval{link->id, start, end});
    }

    ZF_LOGD("Link %s: %zu outages below %.2f dB", link->id.c_str(), intervals.size(), threshold_db);
    return intervals;
}

OutageSummary OutageAnalyzer::summarize(const std::string& link_id, double threshold_db,
                                        const std::vector<OutageInterval>& intervals, Timestamp mission_end) {
    OutageSummary summary;
    summary.link_id = link_id;
    summary.threshold_db = threshold_db;
    summary.count = intervals.size();
    for (const auto& interval : intervals) {
        const Duration d = interval.duration(mission_end);
        summary.total_duration += d;
        summary.longest_duration = std::max(summary.longest_duration, d);
        if (interval.ongoing()) {
            summary.ongoing_at_end = true;
        }
    }
    return summary;
}

Result<OutageSummary, Error> OutageAnalyzer::summarize_link(std::string_view link_id, double threshold_db) const {
    auto intervals = compute_outages(link_id, threshold_db);
    if (intervals.is_err()) {
        return intervals.unwrap_err();
    }

    const LinkDescriptor* link = _store->registry().find_link(link_id);
    auto range = _store->time_range();
    // An empty store has no intervals, so the mission end is never read
    const Timestamp mission_end = range.is_ok() ? range.unwrap().max : Timestamp{};
    return summarize(link->id, threshold_db, intervals.unwrap(), mission_end);
}

Result<std::vector<OutageSummary>, Error> OutageAnalyzer::summarize_all(double threshold_db) const {
    if (!is_valid_threshold(threshold_db)) {
        return Error::InvalidParameter;
    }

    std::vector<OutageSummary> summaries;
    for (const auto* link : _store->registry().links()) {
        auto summary = summarize_link(link->id, threshold_db);
        if (summary.is_err()) {
            return summary.unwrap_err();
        }
        summaries.push_back(summary.unwrap());
    }
    return summaries;
}

bool OutageAnalyzer::in_outage(const std::vector<OutageInterval>& intervals, Timestamp t) {
    auto it = std::upper_bound(intervals.begin(), intervals.end(), t,
        [](Timestamp value, const OutageInterval& interval) { return value < interval.start_time; });
    if (it == intervals.begin()) {
        return false;
    }
    --it;
    return it->ongoing() || t <= *it->end_time;
}

} // namespace fdr
