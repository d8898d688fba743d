#include "terminal.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "history.hpp"
#include <charconv>
#include <fstream>
#include <iostream>
#include <utility>

namespace ledger {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

Terminal::Terminal(Config config, std::istream& in, std::ostream& out)
    : config(std::move(config))
    , in(in)
    , out(out)
    , logger(this->config.log_level)
{
    if (this->config.log_to_file) {
        logger.open(this->config.log_dir);
    }
    logger.info("Initializing new terminal session");
}

void Terminal::run() {
    logger.info("Starting wallet terminal session");
    out << "Welcome to the Wallet Ledger Terminal!" << std::endl;

    while (true) {
        try {
            if (show_menu()) {
                break;
            }
        } catch (const TerminalError& e) {
            logger.error(std::string("Menu error: ") + e.what());
            out << "Error: " << e.what() << std::endl;
        }
    }

    logger.info("Terminating wallet terminal session with balance " + std::to_string(ledger.balance()));
    out << "Thank you for using the Wallet Ledger Terminal!" << std::endl;
}

bool Terminal::show_menu() {
    out << "\nPlease select an option:\n"
        << "1. Check Balance\n"
        << "2. Deposit\n"
        << "3. Withdraw\n"
        << "4. View Transaction History\n"
        << "5. Export Transaction History\n"
        << "6. Exit\n";

    auto choice = prompt_line("\nEnter your choice (1-6): ");
    if (!choice) {
        logger.info("Input closed");
        return true;
    }

    if (*choice == "1") {
        logger.info("Selected: Check Balance");
        check_balance();
    } else if (*choice == "2") {
        logger.info("Selected: Deposit");
        submit(EntryKind::Deposit);
    } else if (*choice == "3") {
        logger.info("Selected: Withdraw");
        submit(EntryKind::Withdrawal);
    } else if (*choice == "4") {
        logger.info("Selected: View History");
        view_history();
    } else if (*choice == "5") {
        logger.info("Selected: Export History");
        export_history();
    } else if (*choice == "6") {
        logger.info("Selected: Exit");
        return true;
    } else {
        logger.error("Invalid menu choice entered: " + *choice);
        out << "Invalid choice. Please try again." << std::endl;
    }

    return input_closed;
}

void Terminal::check_balance() {
    logger.info("Balance check: " + std::to_string(ledger.balance()));
    out << "Current balance: " << ledger.balance() << std::endl;
}

void Terminal::submit(EntryKind kind) {
    auto address = prompt_line("Enter wallet address: ");
    if (!address) {
        return;
    }
    logger.info("Wallet address entered: " + *address);

    auto amount_text = prompt_line("Enter amount: ");
    if (!amount_text) {
        return;
    }

    auto amount = parse_amount(*amount_text);
    if (!amount) {
        logger.error("Invalid amount entered: " + *amount_text);
        out << "Invalid amount. Please enter a valid number." << std::endl;
        return;
    }
    logger.info("Amount entered: " + std::to_string(*amount));

    auto result = ledger.apply(kind, *address, *amount);
    if (!result) {
        const auto& error = result.error();
        logger.error(std::string(to_string(kind)) + " rejected (" + to_string(error.kind) + "): " +
            error.message());
        out << "Error: " << error.message() << std::endl;
        return;
    }

    if (kind == EntryKind::Deposit) {
        logger.info("Successful deposit of " + std::to_string(*amount) + " to wallet " + *address +
            ", balance " + std::to_string(result.value()));
        out << "Successfully deposited " << *amount << " to the wallet" << std::endl;
    } else {
        logger.info("Successful withdrawal of " + std::to_string(*amount) + " from wallet " + *address +
            ", balance " + std::to_string(result.value()));
        out << "Successfully withdrew " << *amount << " from the wallet" << std::endl;
    }
}

void Terminal::view_history() {
    logger.info("Viewing transaction history (" + std::to_string(ledger.size()) + " entries)");
    if (ledger.empty()) {
        out << "No transactions recorded" << std::endl;
        return;
    }

    out << "Transaction history:" << std::endl;
    for (const auto& line : HistoryView::render_with_running_balance(ledger)) {
        out << line << std::endl;
    }
}

void Terminal::export_history() {
    std::ofstream file(config.history_file);
    if (!file) {
        throw TerminalError(TerminalError::ErrorType::ExportError,
            "Failed to open history file for writing: " + config.history_file);
    }

    file << HistoryView::to_json(ledger).dump(JSON_INDENT) << std::endl;
    if (!file) {
        throw TerminalError(TerminalError::ErrorType::ExportError,
            "Failed to write history file: " + config.history_file);
    }

    logger.info("Exported " + std::to_string(ledger.size()) + " entries to " + config.history_file);
    out << "History exported to " << config.history_file << std::endl;
}

std::optional<std::string> Terminal::prompt_line(const std::string& prompt) {
    out << prompt << std::flush;

    std::string line;
    if (!std::getline(in, line)) {
        input_closed = true;
        return std::nullopt;
    }
    return trim(line);
}

std::optional<Amount> Terminal::parse_amount(const std::string& text) {
    Amount value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    // from_chars takes no sign but '-'; allow a single explicit '+'
    if (begin != end && *begin == '+') {
        ++begin;
        if (begin != end && *begin == '-') {
            return std::nullopt;
        }
    }
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end || begin == end) {
        return std::nullopt;
    }
    return value;
}

} // namespace ledger
