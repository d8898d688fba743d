#pragma once

#include <optional>
#include "entry.hpp"
#include "error.hpp"

namespace ledger {

// Admission rules for a proposed entry
class Validator {
public:
    // Checks whether an entry of the given kind and amount may be applied on
    // top of current_balance.
    // Returns std::nullopt when the entry is admissible, otherwise the reason
    // it is not:
    // - InvalidAmount when amount <= 0, or when a deposit would overflow the balance
    // - InsufficientFunds when a withdrawal exceeds current_balance
    static std::optional<LedgerError> validate(EntryKind kind, Amount amount, Amount current_balance);

private:
    Validator() = delete;
};

} // namespace ledger
