#include "logger.hpp"
#include "consts.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

namespace ledger {

namespace {

std::string format_now(const char* pattern) {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::stringstream ss;
    ss << std::put_time(std::localtime(&now), pattern);
    return ss.str();
}

} // namespace

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> log_level_from_string(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warning") return LogLevel::Warning;
    if (name == "error") return LogLevel::Error;
    return std::nullopt;
}

Logger::Logger(LogLevel threshold, size_t buffer_lines)
    : threshold(threshold)
    , capacity(buffer_lines)
{}

bool Logger::open(const std::filesystem::path& log_dir) {
    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    if (ec) {
        std::cerr << "Warning: Failed to initialize logging: " << ec.message() << std::endl;
        return false;
    }

    path = log_dir / ("terminal_" + format_now("%Y%m%d_%H%M%S") + ".log");
    file.open(path, std::ios::app);
    if (!file.is_open()) {
        std::cerr << "Warning: Failed to initialize logging: cannot open " << path << std::endl;
        return false;
    }
    return true;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (level < threshold) {
        return;
    }

    std::string line = format_now("%Y-%m-%d %H:%M:%S") + " [" + to_string(level) + "] [" +
        LOG_COMPONENT + "] " + message;

    if (capacity > 0) {
        if (buffer.size() >= capacity) {
            buffer.pop_front();
        }
        buffer.push_back(line);
    }

    if (file.is_open()) {
        file << line << std::endl;
    }
}

} // namespace ledger
