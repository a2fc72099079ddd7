#ifndef FDR_LOGGER_HPP
#define FDR_LOGGER_HPP

#include <cstddef>

/**
 * fdr logger - zf_log output sink for console and an optional mission log file
 *
 * Basic Usage:
 *   auto ret = fdr::start_logging("/tmp/mission_replay.log");
 *   fdr::set_log_level(fdr::LOG_INFO);
 *
 *   ZF_LOGI("Mission loaded");
 *
 * Console lines are coloured by level, file lines are plain. With rotation
 * enabled the file is moved to <path>.1, <path>.2, ... once it grows past
 * the configured size; the oldest backup is dropped.
 */

namespace fdr {

// === Colors for terminal ===
constexpr const char* COLOR_RED = "\x1b[31m";
constexpr const char* COLOR_YELLOW = "\x1b[33m";
constexpr const char* COLOR_WHITE = "\x1b[37m";
constexpr const char* COLOR_GREEN = "\x1b[32m";
constexpr const char* COLOR_BLUE = "\x1b[34m";
constexpr const char* COLOR_RESET = "\x1b[0m";
constexpr const char* COLOR_DARK_RED = "\x1b[31;1m";

constexpr int LOGGER_MAX_ENUM_STR_LEN = 255;

struct LogRotationConfig {
    size_t max_file_size = 4 * 1024 * 1024;
    int max_backup_files = 3;
    bool enabled = false;
};

// === Return codes ===
enum logger_retval_enum {
    LOGGER_SUCCESS = 0,
    LOGGER_FILEPATH_EMPTY,
    LOGGER_ALREADY_STARTED,
    LOGGER_NOT_STARTED,
    LOGGER_COULD_NOT_OPEN_FILE,
    LOGGER_FILE_PTR_IS_NULL,
    LOGGER_FILE_FAILED_FLUSH,
    LOGGER_FILE_INVALID_FD,
    LOGGER_FILE_NOT_SYNCED,
};

// Same values as ZF_LOG_VERBOSE .. ZF_LOG_FATAL
constexpr int LOG_VERBOSE = 1;
constexpr int LOG_DEBUG   = 2;
constexpr int LOG_INFO    = 3;
constexpr int LOG_WARN    = 4;
constexpr int LOG_ERROR   = 5;
constexpr int LOG_FATAL   = 6;

logger_retval_enum start_logging(const char *log_filepath = nullptr) noexcept;
logger_retval_enum reset_logfile(const char *log_filepath) noexcept;
void close_log_file() noexcept;
logger_retval_enum verify_logfile() noexcept;
void logger_enum_to_cstr(logger_retval_enum enum_val, char* out_str) noexcept;
void set_log_level(int level) noexcept;
bool is_logging_started() noexcept;

void enable_log_rotation(size_t max_file_size = 4 * 1024 * 1024, int max_backups = 3) noexcept;
void disable_log_rotation() noexcept;

} // namespace fdr

#endif // FDR_LOGGER_HPP
