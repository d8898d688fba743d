#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include "config.hpp"
#include "entry.hpp"
#include "ledger.hpp"
#include "logger.hpp"

namespace ledger {

// Interactive menu over a single session's ledger.
//
// The terminal owns both the Ledger and the Logger for the session; nothing
// about it is global, so several terminals can coexist (tests do this).
class Terminal {
public:
    Terminal(Config config, std::istream& in, std::ostream& out);

    // Run the menu until the user picks Exit or input ends
    void run();

    const Ledger& get_ledger() const { return ledger; }
    const Logger& get_logger() const { return logger; }

private:
    // Show the menu and handle one choice. Returns true when the session should end.
    bool show_menu();

    void check_balance();
    void submit(EntryKind kind);
    void view_history();
    void export_history();

    // Print prompt and read one trimmed line; std::nullopt once input is exhausted
    std::optional<std::string> prompt_line(const std::string& prompt);

    // Parse a whole line as a signed amount
    static std::optional<Amount> parse_amount(const std::string& text);

    Config config;
    std::istream& in;
    std::ostream& out;
    Logger logger;
    Ledger ledger;
    bool input_closed = false;
};

} // namespace ledger
