#pragma once

#include "fdr.hpp"
#include "fdr_config.hpp"
#include "analysis/outage_analyzer.hpp"
#include "store/time_series_store.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fdr {

enum class PlaybackStatus {
    Stopped,
    Playing,
    Paused
};

const char* to_str(PlaybackStatus status);

struct PlaybackState {
    Timestamp current_time;
    PlaybackStatus status = PlaybackStatus::Stopped;
    double speed_multiplier = 1.0;
    size_t cursor_index = 0;

    bool operator==(const PlaybackState& other) const {
        return current_time == other.current_time && status == other.status &&
               speed_multiplier == other.speed_multiplier && cursor_index == other.cursor_index;
    }
    bool operator!=(const PlaybackState& other) const { return !(*this == other); }
};

// What a renderer needs per tick. `record` is the latest sample at or before
// current_time (never interpolated) and points into the engine's store.
struct PlaybackFrame {
    PlaybackState state;
    const TelemetryRecord* record = nullptr;
    std::optional<LinkStatus> link;
};

// Pure state transition: moves a Playing state forward by delta_s * speed of
// simulated time, clamping at the end of the mission and stopping there.
// Non-playing states come back unchanged. Time accumulates in whole
// microseconds, so splitting a delta into equal parts gives the same result.
Result<PlaybackState, Error> advance(const PlaybackState& state, double delta_s, const TimeSeriesStore& store);

// Cursor over one mission. All transitions must come from a single writer
// (e.g. the UI thread); the engine itself never sleeps or blocks, the host
// owns the tick source and feeds elapsed wall-clock time into advance().
class PlaybackEngine {
public:
    // Throws std::invalid_argument on a null store or an unusable speed range
    explicit PlaybackEngine(std::shared_ptr<const TimeSeriesStore> store, PlaybackConfig config = {});

    Result<Empty, Error> play();
    void pause();
    void stop();
    Result<Empty, Error> seek(Timestamp t);
    Result<Empty, Error> set_speed(double multiplier);

    // Computes and caches the link's outage intervals for per-frame status
    Result<Empty, Error> select_link(std::string_view link_id, double threshold_db);
    void clear_link();

    Result<PlaybackFrame, Error> advance(double delta_s);

    PlaybackFrame frame() const;
    const PlaybackState& state() const { return _state; }
    const PlaybackConfig& config() const { return _config; }
    const TimeSeriesStore& store() const { return *_store; }

    const std::string& selected_link() const { return _link_id; }
    double selected_threshold_db() const { return _threshold_db; }
    const std::vector<OutageInterval>& selected_outages() const { return _outages; }

private:
    void rewind();

    std::shared_ptr<const TimeSeriesStore> _store;
    PlaybackConfig _config;
    PlaybackState _state;

    std::string _link_id;               // empty when no link is selected
    std::string _margin_field;
    double _threshold_db = 0.0;
    std::vector<OutageInterval> _outages;
};

} // namespace fdr
