#pragma once

#include "fdr.hpp"
#include "fdr_config.hpp"
#include "analysis/outage_analyzer.hpp"
#include "ingest/csv_table.hpp"
#include "ingest/schema_validator.hpp"
#include "playback/playback_engine.hpp"
#include "store/time_series_store.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace fdr {

// Everything derived from one successful load. Immutable once published.
struct Mission {
    std::string source;
    std::shared_ptr<const TimeSeriesStore> store;
    ValidationReport report;
};

// Structured, printable outcome of a failed load
struct LoadFailure {
    Error error = Error::Unknown;
    std::string code;
    std::string detail;

    std::string message() const;
};

// Owns the currently loaded mission. A load either publishes a complete new
// mission together with a fresh playback engine, or leaves the previous one
// untouched. Readers holding a mission() snapshot keep it alive across reloads.
class MissionSession {
public:
    explicit MissionSession(MissionConfig config = config::defaults());

    Result<std::shared_ptr<const Mission>, LoadFailure> load_file(const std::string& path);
    Result<std::shared_ptr<const Mission>, LoadFailure> load_table(const RawTable& table,
                                                                   const std::string& source = "<memory>");

    std::shared_ptr<const Mission> mission() const;
    bool has_mission() const;
    void unload();

    // Engine of the current mission, nullptr when nothing is loaded. A held
    // engine outlives later reloads together with the store it plays.
    // Single writer: the caller serializes transitions.
    std::shared_ptr<PlaybackEngine> playback();

    Result<OutageAnalyzer, Error> outages() const;

    const MissionConfig& config() const { return _config; }

private:
    static LoadFailure to_failure(const SchemaError& error);

    MissionConfig _config;
    SchemaValidator _validator;

    mutable std::mutex _mutex;
    std::shared_ptr<const Mission> _mission;
    std::shared_ptr<PlaybackEngine> _playback;
};

} // namespace fdr
