#include "fdr.hpp"
#include "fdr_config.hpp"
#include "fdr_report_utils.hpp"
#include "logger/fdr_logger.hpp"
#include "session/mission_session.hpp"
#include "zf_log.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>

static std::atomic<bool> g_should_exit{false};

void signal_handler(int signum) {
    (void)signum;
    g_should_exit = true;
}

void print_usage(const char* prog_name) {
    printf("Usage: %s <csv> [link] [threshold_db] [speed] [tick_s]\n", prog_name);
    printf("  Loads a recorded mission, prints the validation report and link outages,\n");
    printf("  then replays it with one status line per tick.\n");
    printf("\nArguments:\n");
    printf("  csv           Mission log with Timestamp and POS_* columns\n");
    printf("  link          Link to follow during replay, e.g. LEO or COMM_GEO (default: first detected)\n");
    printf("  threshold_db  Outage threshold in dB (default: 3.0)\n");
    printf("  speed         Playback speed multiplier, 1 to %.0f (default: 60)\n", fdr::MAX_SPEED_MULTIPLIER);
    printf("  tick_s        Wall-clock seconds per tick (default: 0.5)\n");
    printf("\nEnvironment:\n");
    printf("  FDR_LOG_FILE  Also write the log to this file\n");
    printf("\nExample:\n");
    printf("  %s flight_042.csv LEO 3.0 120 0.25\n", prog_name);
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (argc < 2 || argc > 6 || std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h") {
        print_usage(argv[0]);
        return argc < 2 ? 1 : 0;
    }

    fdr::MissionConfig config = fdr::config::fast_scrub();
    const std::string csv_path = argv[1];
    std::string link = argc > 2 ? argv[2] : "";
    double threshold_db = config.outage.default_threshold_db;
    double speed = config.playback.initial_speed;
    double tick_s = 0.5;

    try {
        if (argc > 3) threshold_db = std::stod(argv[3]);
        if (argc > 4) speed = std::stod(argv[4]);
        if (argc > 5) tick_s = std::stod(argv[5]);
    } catch (const std::exception& e) {
        fprintf(stderr, "Invalid numeric argument: %s\n", e.what());
        print_usage(argv[0]);
        return 1;
    }
    if (!(tick_s > 0.0)) {
        fprintf(stderr, "tick_s must be greater than zero\n");
        return 1;
    }

    const char* log_path = std::getenv("FDR_LOG_FILE");
    fdr::logger_retval_enum log_ret = fdr::start_logging(log_path);
    if (log_ret != fdr::LOGGER_SUCCESS) {
        char err[fdr::LOGGER_MAX_ENUM_STR_LEN];
        fdr::logger_enum_to_cstr(log_ret, err);
        fprintf(stderr, "Could not open log file %s: %s\n", log_path, err);
    }
    fdr::set_log_level(fdr::LOG_INFO);

    fdr::MissionSession session(config);
    auto loaded = session.load_file(csv_path);
    if (loaded.is_err()) {
        fprintf(stderr, "Load failed [%s]: %s\n",
            loaded.unwrap_err().code.c_str(), loaded.unwrap_err().message().c_str());
        return 2;
    }
    const std::shared_ptr<const fdr::Mission> mission = loaded.unwrap();

    fdr::print_validation_report(mission->report);
    if (mission->store->empty()) {
        printf("\nNothing to replay.\n");
        return 0;
    }

    const fdr::Timestamp mission_end = mission->store->time_range().unwrap().max;
    auto analyzer = session.outages();
    if (analyzer.is_ok()) {
        auto summaries = analyzer.unwrap().summarize_all(threshold_db);
        if (summaries.is_err()) {
            fprintf(stderr, "Outage analysis failed: %s\n", fdr::to_str(summaries.unwrap_err()));
            return 1;
        }
        fdr::print_outage_summaries(summaries.unwrap());
    }

    std::shared_ptr<fdr::PlaybackEngine> engine = session.playback();
    if (link.empty() && !mission->report.detected_links.empty()) {
        link = mission->report.detected_links.front();
    }
    if (!link.empty()) {
        auto selected = engine->select_link(link, threshold_db);
        if (selected.is_err()) {
            fprintf(stderr, "Cannot follow link %s: %s\n", link.c_str(), fdr::to_str(selected.unwrap_err()));
            return 1;
        }
        printf("\nOutages of %s below %.2f dB:\n", engine->selected_link().c_str(), threshold_db);
        fdr::print_outages(engine->selected_outages(), mission_end);
    }

    if (engine->set_speed(speed).is_err()) {
        ZF_LOGW("Keeping playback speed x%.1f", engine->state().speed_multiplier);
    }

    printf("\n=== Replay ===\n");
    if (engine->play().is_err()) {
        return 1;
    }
    fdr::print_frame(engine->frame());

    const auto tick = std::chrono::duration<double>(tick_s);
    while (!g_should_exit && engine->state().status == fdr::PlaybackStatus::Playing) {
        std::this_thread::sleep_for(tick);
        auto frame = engine->advance(tick_s);
        if (frame.is_err()) {
            ZF_LOGE("Playback failed: %s", fdr::to_str(frame.unwrap_err()));
            return 1;
        }
        fdr::print_frame(frame.unwrap());
    }

    if (g_should_exit) {
        engine->pause();
        printf("\nInterrupted at %s\n", fdr::format_timestamp(engine->state().current_time).c_str());
    }
    return 0;
}
