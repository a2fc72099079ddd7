#include "playback_engine.hpp"
#include "zf_log.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace fdr {

const char* to_str(PlaybackStatus status) {
    switch (status) {
        case PlaybackStatus::Stopped: return "Stopped";
        case PlaybackStatus::Playing: return "Playing";
        case PlaybackStatus::Paused: return "Paused";
        default: return "Unknown";
    }
}

Result<PlaybackState, Error> advance(const PlaybackState& state, double delta_s, const TimeSeriesStore& store) {
    if (!std::isfinite(delta_s) || delta_s < 0.0) {
        return Error::InvalidParameter;
    }
    if (state.status != PlaybackStatus::Playing) {
        return state;
    }

    auto range_result = store.time_range();
    if (range_result.is_err()) {
        return range_result.unwrap_err();
    }
    const TimeRange range = range_result.unwrap();

    PlaybackState next = state;
    const Timestamp current = range.clamp(state.current_time);
    const double step_s = delta_s * state.speed_multiplier;
    // Steps reaching past the end are never converted, so huge deltas cannot overflow
    if (step_s >= to_seconds(range.max - current) || current + from_seconds(step_s) >= range.max) {
        // End of mission: clamp and stop, never wrap around
        next.current_time = range.max;
        next.status = PlaybackStatus::Stopped;
    } else {
        next.current_time = current + from_seconds(step_s);
    }
    next.cursor_index = store.nearest_index_for_time(next.current_time);
    return next;
}

PlaybackEngine::PlaybackEngine(std::shared_ptr<const TimeSeriesStore> store, PlaybackConfig config)
    : _store(std::move(store)),
      _config(config)
{
    if (!_store) {
        throw std::invalid_argument("PlaybackEngine requires a store.");
    }
    if (!std::isfinite(_config.min_speed) || !std::isfinite(_config.max_speed) ||
        _config.min_speed <= 0.0 || _config.min_speed > _config.max_speed) {
        throw std::invalid_argument("Speed bounds must satisfy 0 < min_speed <= max_speed.");
    }
    if (!std::isfinite(_config.initial_speed) || _config.initial_speed <= 0.0) {
        throw std::invalid_argument("Initial speed must be greater than zero.");
    }

    _state.speed_multiplier = std::clamp(_config.initial_speed, _config.min_speed, _config.max_speed);
    rewind();
}

void PlaybackEngine::rewind() {
    auto range = _store->time_range();
    _state.current_time = range.is_ok() ? range.unwrap().min : Timestamp{};
    _state.cursor_index = 0;
}

Result<Empty, Error> PlaybackEngine::play() {
    if (_store->empty()) {
        return Error::EmptyDataset;
    }
    if (_state.status == PlaybackStatus::Playing) {
        return Empty{};
    }
    // Replaying after the end-of-mission stop starts over
    if (_state.status == PlaybackStatus::Stopped &&
        _state.current_time >= _store->time_range().unwrap().max) {
        rewind();
    }
    ZF_LOGD("Playback %s -> Playing at x%.1f", to_str(_state.status), _state.speed_multiplier);
    _state.status = PlaybackStatus::Playing;
    return Empty{};
}

void PlaybackEngine::pause() {
    if (_state.status != PlaybackStatus::Playing) {
        return;
    }
    ZF_LOGD("Playback Playing -> Paused");
    _state.status = PlaybackStatus::Paused;
}

void PlaybackEngine::stop() {
    ZF_LOGD("Playback %s -> Stopped", to_str(_state.status));
    _state.status = PlaybackStatus::Stopped;
    rewind();
}

Result<Empty, Error> PlaybackEngine::seek(Timestamp t) {
    auto range = _store->time_range();
    if (range.is_err()) {
        return range.unwrap_err();
    }
    _state.current_time = range.unwrap().clamp(t);
    _state.cursor_index = _store->nearest_index_for_time(_state.current_time);
    return Empty{};
}

Result<Empty, Error> PlaybackEngine::set_speed(double multiplier) {
    if (!std::isfinite(multiplier) || multiplier <= 0.0) {
        ZF_LOGW("Rejected playback speed %f, keeping x%.1f", multiplier, _state.speed_multiplier);
        return Error::InvalidParameter;
    }
    _state.speed_multiplier = std::clamp(multiplier, _config.min_speed, _config.max_speed);
    return Empty{};
}

Result<Empty, Error> PlaybackEngine::select_link(std::string_view link_id, double threshold_db) {
    OutageAnalyzer analyzer(_store);
    auto outages = analyzer.compute_outages(link_id, threshold_db);
    if (outages.is_err()) {
        return outages.unwrap_err();
    }

    const LinkDescriptor* link = _store->registry().find_link(link_id);
    _link_id = link->id;
    _margin_field = link->margin_field();
    _threshold_db = threshold_db;
    _outages = std::move(outages.unwrap());
    return Empty{};
}

void PlaybackEngine::clear_link() {
    _link_id.clear();
    _margin_field.clear();
    _threshold_db = 0.0;
    _outages.clear();
}

Result<PlaybackFrame, Error> PlaybackEngine::advance(double delta_s) {
    auto next = fdr::advance(_state, delta_s, *_store);
    if (next.is_err()) {
        return next.unwrap_err();
    }

    const PlaybackState& state = next.unwrap();
    if (_state.status == PlaybackStatus::Playing && state.status == PlaybackStatus::Stopped) {
        ZF_LOGI("End of mission reached at %s", format_timestamp(state.current_time).c_str());
    }
    _state = state;
    return frame();
}

PlaybackFrame PlaybackEngine::frame() const {
    PlaybackFrame frame;
    frame.state = _state;
    if (_store->empty()) {
        return frame;
    }

    frame.record = &_store->record_at(_state.cursor_index);
    if (!_link_id.empty()) {
        LinkStatus status;
        status.link_id = _link_id;
        status.in_outage = OutageAnalyzer::in_outage(_outages, frame.record->timestamp);
        auto margin = _store->value(_state.cursor_index, _margin_field);
        if (margin.is_ok()) {
            status.margin = margin.unwrap();
        }
        frame.link = status;
    }
    return frame;
}

} // namespace fdr
