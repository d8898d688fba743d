#include "history.hpp"

namespace ledger {

std::vector<std::string> HistoryView::render(const Ledger& ledger) {
    std::vector<std::string> lines;
    lines.reserve(ledger.size());
    for (const auto& entry : ledger.entries()) {
        lines.push_back(entry.describe());
    }
    return lines;
}

std::vector<std::string> HistoryView::render_with_running_balance(const Ledger& ledger) {
    std::vector<std::string> lines;
    lines.reserve(ledger.size());

    Amount running = 0;
    for (const auto& entry : ledger.entries()) {
        running += entry.delta();
        lines.push_back(entry.describe() + " | Running balance: " + std::to_string(running));
    }
    return lines;
}

nlohmann::json HistoryView::to_json(const Ledger& ledger) {
    return nlohmann::json{
        {"balance", ledger.balance()},
        {"entries", ledger.entries()}
    };
}

std::vector<std::string> render_history(const Ledger& ledger) {
    return HistoryView::render(ledger);
}

} // namespace ledger
