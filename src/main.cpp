// Wallet Ledger Terminal
//
// Entry point for the interactive ledger. A session starts with an empty
// ledger (balance 0), accepts deposits and withdrawals from the menu, and is
// discarded when the program exits. Nothing is read back from disk; the
// only files written are the session log and, on request, a JSON export of
// the history.
//
// Usage: wallet_ledger [config.json]
// Without an argument ledger_config.json in the working directory is used if
// it exists, otherwise built-in defaults.

#include "config.hpp"
#include "consts.hpp"
#include "terminal.hpp"
#include <iostream>
#include <utility>

int main(int argc, char* argv[]) {
    try {
        const std::string config_path = argc > 1 ? argv[1] : ledger::DEFAULT_CONFIG_FILE;
        auto config = ledger::Config::load_from_file(config_path);

        // Keep prompts flushed before blocking on input
        std::cin.tie(&std::cout);

        ledger::Terminal terminal(std::move(config), std::cin, std::cout);
        terminal.run();

    } catch (const std::exception& e) {
        // Bad config, or anything the terminal could not recover from
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
