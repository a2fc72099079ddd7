#include "mission_session.hpp"
#include "zf_log.h"

namespace fdr {

std::string LoadFailure::message() const {
    std::string msg = to_str(error);
    if (!detail.empty()) {
        msg += ": ";
        msg += detail;
    }
    return msg;
}

MissionSession::MissionSession(MissionConfig config)
    : _config(std::move(config)),
      _validator(_config.validator)
{}

LoadFailure MissionSession::to_failure(const SchemaError& error) {
    return LoadFailure{error.error, error.code(), error.field};
}

Result<std::shared_ptr<const Mission>, LoadFailure> MissionSession::load_file(const std::string& path) {
    auto table = read_csv_file(path);
    if (table.is_err()) {
        ZF_LOGE("Load of %s failed: %s", path.c_str(), table.unwrap_err().message().c_str());
        return to_failure(table.unwrap_err());
    }
    return load_table(table.unwrap(), path);
}

Result<std::shared_ptr<const Mission>, LoadFailure> MissionSession::load_table(const RawTable& table,
                                                                               const std::string& source) {
    // Validation runs outside the lock; nothing is visible until the swap below
    auto dataset = _validator.validate(table);
    if (dataset.is_err()) {
        ZF_LOGE("Load of %s failed: %s, keeping previous mission",
            source.c_str(), dataset.unwrap_err().message().c_str());
        return to_failure(dataset.unwrap_err());
    }

    auto mission = std::make_shared<Mission>();
    mission->source = source;
    mission->store = dataset.unwrap().store;
    mission->report = std::move(dataset.unwrap().report);

    auto engine = std::make_shared<PlaybackEngine>(mission->store, _config.playback);

    std::shared_ptr<const Mission> published = mission;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _mission = published;
        _playback = std::move(engine);
    }
    ZF_LOGI("Mission %s loaded: %zu records, %zu links",
        source.c_str(), published->store->size(), published->report.detected_links.size());
    return published;
}

std::shared_ptr<const Mission> MissionSession::mission() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _mission;
}

bool MissionSession::has_mission() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _mission != nullptr;
}

void MissionSession::unload() {
    std::lock_guard<std::mutex> lock(_mutex);
    _mission.reset();
    _playback.reset();
}

std::shared_ptr<PlaybackEngine> MissionSession::playback() {
    std::lock_guard<std::mutex> lock(_mutex);
    return _playback;
}

Result<OutageAnalyzer, Error> MissionSession::outages() const {
    std::shared_ptr<const Mission> current = mission();
    if (!current) {
        return Error::EmptyDataset;
    }
    return OutageAnalyzer(current->store);
}

} // namespace fdr
