#include "validator.hpp"
#include <limits>

namespace ledger {

std::optional<LedgerError> Validator::validate(EntryKind kind, Amount amount, Amount current_balance) {
    if (amount <= 0) {
        return LedgerError{ErrorKind::InvalidAmount, amount, current_balance};
    }

    switch (kind) {
        case EntryKind::Deposit:
            // Checked add: current_balance + amount must stay representable
            if (current_balance > std::numeric_limits<Amount>::max() - amount) {
                return LedgerError{ErrorKind::InvalidAmount, amount, current_balance};
            }
            break;
        case EntryKind::Withdrawal:
            // Emptying the wallet exactly is allowed
            if (amount > current_balance) {
                return LedgerError{ErrorKind::InsufficientFunds, amount, current_balance};
            }
            break;
    }

    return std::nullopt;
}

} // namespace ledger
