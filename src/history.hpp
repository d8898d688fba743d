#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "ledger.hpp"

namespace ledger {

// HistoryView formats a ledger's entries for display and export.
//
// Every call reads the ledger as it is now; nothing is cached between calls
// and the ledger is never modified.
class HistoryView {
public:
    // One line per entry in acceptance order, e.g. "Deposit of 100 to wallet_1"
    static std::vector<std::string> render(const Ledger& ledger);

    // Same as render(), each line followed by the balance after that entry:
    // "Deposit of 100 to wallet_1 | Running balance: 100"
    static std::vector<std::string> render_with_running_balance(const Ledger& ledger);

    // {"balance": <n>, "entries": [{"kind": ..., "address": ..., "amount": ...}, ...]}
    static nlohmann::json to_json(const Ledger& ledger);

private:
    HistoryView() = delete;
};

// Free-function form of HistoryView::render
std::vector<std::string> render_history(const Ledger& ledger);

} // namespace ledger
