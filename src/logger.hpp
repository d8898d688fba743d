#pragma once

#include <cstddef>
#include <deque>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include "consts.hpp"

namespace ledger {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

const char* to_string(LogLevel level);

// Accepts "debug", "info", "warning", "error"
std::optional<LogLevel> log_level_from_string(const std::string& name);

// Session logger.
//
// Each line is "YYYY-mm-dd HH:MM:SS [LEVEL] [Terminal] message". Lines go to
// the session log file once open() succeeds, and the most recent ones are
// always kept in memory.
class Logger {
public:
    explicit Logger(LogLevel threshold = LogLevel::Info, size_t buffer_lines = LOG_BUFFER_LINES);

    // Create log_dir if needed and start writing to
    // log_dir/terminal_YYYYmmdd_HHMMSS.log.
    // On failure a warning goes to stderr and the logger keeps only its
    // in-memory buffer. Returns whether the file is open.
    bool open(const std::filesystem::path& log_dir);

    bool is_open() const { return file.is_open(); }
    const std::filesystem::path& file_path() const { return path; }

    void set_threshold(LogLevel level) { threshold = level; }
    LogLevel get_threshold() const { return threshold; }

    void log(LogLevel level, const std::string& message);
    void debug(const std::string& message) { log(LogLevel::Debug, message); }
    void info(const std::string& message) { log(LogLevel::Info, message); }
    void warning(const std::string& message) { log(LogLevel::Warning, message); }
    void error(const std::string& message) { log(LogLevel::Error, message); }

    // Most recent lines, oldest first
    const std::deque<std::string>& recent() const { return buffer; }

private:
    LogLevel threshold;
    size_t capacity;
    std::deque<std::string> buffer;
    std::ofstream file;
    std::filesystem::path path;
};

} // namespace ledger
