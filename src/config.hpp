#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "consts.hpp"
#include "logger.hpp"

namespace ledger {

// Terminal settings. Every field has a default, so an absent or partial
// config file is fine.
struct Config {
    std::string log_dir = DEFAULT_LOG_DIR;            // Directory for session log files
    LogLevel log_level = LogLevel::Info;              // Lowest level written
    std::string history_file = DEFAULT_HISTORY_FILE;  // Target of "Export Transaction History"
    bool log_to_file = true;                          // false keeps logs in memory only

    // Load settings from a JSON file.
    // A missing file yields the defaults.
    // Throws TerminalError (ConfigReadError) if the path exists but cannot be
    // inspected or read or is not a regular file, and TerminalError (ConfigFormatError) for malformed JSON, wrongly
    // typed fields or an unknown log level.
    static Config load_from_file(const std::string& path);

    // Same rules as load_from_file, for an already-parsed document
    static Config from_json_document(const nlohmann::json& j);
};

} // namespace ledger
