#include "ledger.hpp"
#include "validator.hpp"
#include <utility>

namespace ledger {

Result<Amount> Ledger::apply(EntryKind kind, const std::string& address, Amount amount) {
    if (auto rejection = Validator::validate(kind, amount, current_balance)) {
        return *rejection;
    }

    Entry entry{kind, address, amount};
    const Amount next_balance = current_balance + entry.delta();

    // Commit only after everything that can fail has run
    accepted.push_back(std::move(entry));
    current_balance = next_balance;
    return current_balance;
}

Result<Amount> Ledger::replay(const std::vector<Entry>& proposed) {
    Ledger scratch;
    for (const auto& entry : proposed) {
        auto result = scratch.apply(entry.kind, entry.address, entry.amount);
        if (!result) {
            return result.error();
        }
    }
    return scratch.balance();
}

Ledger new_session() {
    return Ledger{};
}

Result<Amount> apply(Ledger& ledger, EntryKind kind, const std::string& address, Amount amount) {
    return ledger.apply(kind, address, amount);
}

Amount balance_of(const Ledger& ledger) {
    return ledger.balance();
}

} // namespace ledger
