#include "fdr_logger.hpp"
#include "zf_log.h"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <string>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

struct LogSink {
    FILE* file = nullptr;
    std::string path;
    bool started = false;
    fdr::LogRotationConfig rotation;
};

LogSink _sink;
std::mutex _sink_mutex;
std::atomic<bool> _shutting_down{false};

void close_unguarded() noexcept {
    if (_sink.file) {
        fclose(_sink.file);
    }
    _sink.file = nullptr;
}

std::string backup_name(int index) {
    return _sink.path + "." + std::to_string(index);
}

// mission.log -> mission.log.1 -> mission.log.2 ... oldest dropped
void rotate_unguarded() noexcept {
    close_unguarded();
    try {
        std::remove(backup_name(_sink.rotation.max_backup_files).c_str());
        for (int i = _sink.rotation.max_backup_files - 1; i > 0; --i) {
            std::rename(backup_name(i).c_str(), backup_name(i + 1).c_str());
        }
        std::rename(_sink.path.c_str(), backup_name(1).c_str());
    } catch (const std::bad_alloc&) {
        // keep appending to the current file
    }

    _sink.file = fopen(_sink.path.c_str(), "a");
    if (!_sink.file) {
        _sink.rotation.enabled = false;
    }
}

void rotate_if_needed_unguarded() noexcept {
    if (!_sink.rotation.enabled || !_sink.file) return;

    fflush(_sink.file);
    struct stat st;
    if (fstat(fileno(_sink.file), &st) != 0) return;
    if (static_cast<size_t>(st.st_size) >= _sink.rotation.max_file_size) {
        rotate_unguarded();
    }
}

void close_at_exit() noexcept {
    _shutting_down = true;
    std::lock_guard<std::mutex> lock(_sink_mutex);
    close_unguarded();
}

void level_style(int lvl, const char*& color, const char*& tag) noexcept {
    switch (lvl) {
        case ZF_LOG_VERBOSE: color = fdr::COLOR_GREEN; tag = "v"; break;
        case ZF_LOG_DEBUG: color = fdr::COLOR_BLUE; tag = "d"; break;
        case ZF_LOG_INFO: color = fdr::COLOR_WHITE; tag = "I"; break;
        case ZF_LOG_WARN: color = fdr::COLOR_YELLOW; tag = "W"; break;
        case ZF_LOG_ERROR: color = fdr::COLOR_RED; tag = "E"; break;
        case ZF_LOG_FATAL: color = fdr::COLOR_DARK_RED; tag = "F"; break;
        default: color = fdr::COLOR_WHITE; tag = "N"; break;
    }
}

void output_callback(const zf_log_message* msg, void* arg) {
    (void)arg;
    if (_shutting_down.load(std::memory_order_relaxed)) {
        return;
    }

    // Wall clock of the host, in UTC like every mission timestamp we print
    thread_local char time_str[32];
    thread_local struct tm tm_buf;
    time_t now = time(nullptr);
    if (gmtime_r(&now, &tm_buf) == nullptr) {
        time_str[0] = '\0';
    } else {
        strftime(time_str, sizeof(time_str), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    }

    const char* color;
    const char* tag;
    level_style(msg->lvl, color, tag);
    const int len = static_cast<int>(msg->p - msg->msg_b);

    // Warnings and worse go to stderr so stdout stays usable for reports
    FILE* console = msg->lvl >= ZF_LOG_WARN ? stderr : stdout;
    fprintf(console, "%s[%s] [%s] %.*s%s\n", color, time_str, tag, len, msg->msg_b, fdr::COLOR_RESET);
    fflush(console);

    std::lock_guard<std::mutex> lock(_sink_mutex);
    rotate_if_needed_unguarded();
    if (_sink.file) {
        fprintf(_sink.file, "[%s] [%s] %.*s\n", time_str, tag, len, msg->msg_b);
        fflush(_sink.file);
    }
}

} // namespace

namespace fdr {

logger_retval_enum start_logging(const char* log_filepath) noexcept {
    {
        std::lock_guard<std::mutex> lock(_sink_mutex);
        if (_sink.started) {
            return LOGGER_ALREADY_STARTED;
        }
        zf_log_set_output_v(ZF_LOG_PUT_STD, nullptr, output_callback);
        _sink.started = true;
        atexit(close_at_exit);
    }

    if (log_filepath == nullptr) {
        return LOGGER_SUCCESS;
    }
    return reset_logfile(log_filepath);
}

logger_retval_enum reset_logfile(const char* log_filepath) noexcept {
    if (!log_filepath || log_filepath[0] == '\0') return LOGGER_FILEPATH_EMPTY;

    std::lock_guard<std::mutex> lock(_sink_mutex);
    if (!_sink.started) return LOGGER_NOT_STARTED;

    close_unguarded();
    _sink.file = fopen(log_filepath, "a");
    if (!_sink.file) {
        _sink.path.clear();
        return LOGGER_COULD_NOT_OPEN_FILE;
    }
    _sink.path = log_filepath;
    return LOGGER_SUCCESS;
}

void close_log_file() noexcept {
    std::lock_guard<std::mutex> lock(_sink_mutex);
    close_unguarded();
}

logger_retval_enum verify_logfile() noexcept {
    std::lock_guard<std::mutex> lock(_sink_mutex);
    if (!_sink.file) {
        return LOGGER_FILE_PTR_IS_NULL;
    }

    logger_retval_enum status = LOGGER_SUCCESS;
    const int fd = fileno(_sink.file);
    if (fflush(_sink.file) != 0) {
        status = LOGGER_FILE_FAILED_FLUSH;
    } else if (fd < 0 || fcntl(fd, F_GETFL) == -1) {
        status = LOGGER_FILE_INVALID_FD;
    } else if (fsync(fd) != 0) {
        status = LOGGER_FILE_NOT_SYNCED;
    }

    if (status != LOGGER_SUCCESS) {
        close_unguarded();
    }
    return status;
}

void logger_enum_to_cstr(logger_retval_enum enum_val, char* out_str) noexcept {
    if (!out_str) return;

    const char* str;
    switch (enum_val) {
        case LOGGER_SUCCESS: str = "LOGGER_SUCCESS"; break;
        case LOGGER_FILEPATH_EMPTY: str = "LOGGER_FILEPATH_EMPTY"; break;
        case LOGGER_ALREADY_STARTED: str = "LOGGER_ALREADY_STARTED"; break;
        case LOGGER_NOT_STARTED: str = "LOGGER_NOT_STARTED"; break;
        case LOGGER_COULD_NOT_OPEN_FILE: str = "LOGGER_COULD_NOT_OPEN_FILE"; break;
        case LOGGER_FILE_PTR_IS_NULL: str = "LOGGER_FILE_PTR_IS_NULL"; break;
        case LOGGER_FILE_FAILED_FLUSH: str = "LOGGER_FILE_FAILED_FLUSH"; break;
        case LOGGER_FILE_INVALID_FD: str = "LOGGER_FILE_INVALID_FD"; break;
        case LOGGER_FILE_NOT_SYNCED: str = "LOGGER_FILE_NOT_SYNCED"; break;
        default: str = "UNKNOWN"; break;
    }
    std::snprintf(out_str, LOGGER_MAX_ENUM_STR_LEN, "%s", str);
}

void set_log_level(int level) noexcept {
    if (level < LOG_VERBOSE) level = LOG_VERBOSE;
    if (level > LOG_FATAL) level = LOG_FATAL;
    zf_log_set_output_level(level);
}

bool is_logging_started() noexcept {
    std::lock_guard<std::mutex> lock(_sink_mutex);
    return _sink.started;
}

void enable_log_rotation(size_t max_file_size, int max_backups) noexcept {
    std::lock_guard<std::mutex> lock(_sink_mutex);
    _sink.rotation.max_file_size = max_file_size > 0 ? max_file_size : 4 * 1024 * 1024;
    _sink.rotation.max_backup_files = max_backups > 0 ? max_backups : 1;
    _sink.rotation.enabled = true;
}

void disable_log_rotation() noexcept {
    std::lock_guard<std::mutex> lock(_sink_mutex);
    _sink.rotation.enabled = false;
}

} // namespace fdr
