#include "config.hpp"
#include "error.hpp"
#include <filesystem>
#include <fstream>
#include <system_error>

namespace ledger {

using json = nlohmann::json;

Config Config::load_from_file(const std::string& path) {
    std::error_code ec;
    const auto status = std::filesystem::status(path, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        return Config{};
    }
    if (ec) {
        throw TerminalError(TerminalError::ErrorType::ConfigReadError,
            "Failed to inspect config file " + path + ": " + ec.message());
    }
    if (!std::filesystem::is_regular_file(status)) {
        throw TerminalError(TerminalError::ErrorType::ConfigReadError,
            "Config path is not a regular file: " + path);
    }

    std::ifstream file(path);
    if (!file) {
        throw TerminalError(TerminalError::ErrorType::ConfigReadError,
            "Failed to open config file for reading: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw TerminalError(TerminalError::ErrorType::ConfigFormatError,
            "Failed to parse config file " + path + ": " + e.what());
    }

    return from_json_document(j);
}

Config Config::from_json_document(const json& j) {
    if (!j.is_object()) {
        throw TerminalError(TerminalError::ErrorType::ConfigFormatError,
            "Config must be a JSON object");
    }

    Config config;
    try {
        config.log_dir = j.value("log_dir", config.log_dir);
        config.history_file = j.value("history_file", config.history_file);
        config.log_to_file = j.value("log_to_file", config.log_to_file);

        const std::string level_name = j.value("log_level", std::string(DEFAULT_LOG_LEVEL));
        auto level = log_level_from_string(level_name);
        if (!level) {
            throw TerminalError(TerminalError::ErrorType::ConfigFormatError,
                "Unknown log_level: " + level_name);
        }
        config.log_level = *level;
    } catch (const json::type_error& e) {
        throw TerminalError(TerminalError::ErrorType::ConfigFormatError,
            std::string("Invalid config field: ") + e.what());
    }

    return config;
}

} // namespace ledger
