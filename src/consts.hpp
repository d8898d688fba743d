#pragma once

#include <cstddef>

namespace ledger {

    // Terminal defaults, overridable from the config file
    constexpr auto DEFAULT_CONFIG_FILE = "ledger_config.json";
    constexpr auto DEFAULT_LOG_DIR = "logs/src";
    constexpr auto DEFAULT_LOG_LEVEL = "info";
    constexpr auto DEFAULT_HISTORY_FILE = "history.json";

    // Logging
    constexpr auto LOG_COMPONENT = "Terminal";
    constexpr size_t LOG_BUFFER_LINES = 200;

    // Indentation used when dumping JSON reports
    constexpr int JSON_INDENT = 4;

} // namespace ledger
