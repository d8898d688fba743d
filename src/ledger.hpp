/**
 * @file ledger.hpp
 * @brief Single-wallet ledger: the ordered log of accepted entries and the
 *        balance derived from it
 *
 * Rules the ledger keeps at all times:
 * - Entries are only ever appended, never edited or removed
 * - balance() is the sum of deposits minus the sum of withdrawals over the log
 * - balance() is never negative
 *
 * apply() is the only way to change a Ledger. It runs the Validator against
 * the current balance and either appends the entry or leaves the ledger
 * untouched and reports why.
 *
 * A Ledger lives for one session and is owned by whoever drives that session.
 * It is not synchronized; concurrent callers would have to serialize apply()
 * behind a single mutex so that validation and append stay atomic.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "entry.hpp"
#include "error.hpp"

namespace ledger {

class Ledger {
public:
    Ledger() = default;

    // Validate and append a new entry.
    // Returns the balance after the entry, or the LedgerError that rejected it
    // (in which case nothing was recorded).
    Result<Amount> apply(EntryKind kind, const std::string& address, Amount amount);

    // Current balance
    Amount balance() const { return current_balance; }

    // Accepted entries, oldest first
    const std::vector<Entry>& entries() const { return accepted; }

    size_t size() const { return accepted.size(); }
    bool empty() const { return accepted.empty(); }

    // Fold a sequence of proposed entries, in order, into a fresh ledger.
    // Returns the final balance, or the first entry's rejection.
    static Result<Amount> replay(const std::vector<Entry>& proposed);

private:
    std::vector<Entry> accepted;  // Append-only log of admitted entries
    Amount current_balance = 0;   // Running fold of accepted deltas
};

// Session-level entry points for callers that prefer free functions

// A fresh ledger: balance 0, no history
Ledger new_session();

Result<Amount> apply(Ledger& ledger, EntryKind kind, const std::string& address, Amount amount);

Amount balance_of(const Ledger& ledger);

} // namespace ledger
