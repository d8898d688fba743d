#include "error.hpp"

namespace ledger {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidAmount:
            return "InvalidAmount";
        case ErrorKind::InsufficientFunds:
            return "InsufficientFunds";
    }
    return "Unknown";
}

// Message shown to the user when an entry is refused
std::string LedgerError::message() const {
    switch (kind) {
        case ErrorKind::InvalidAmount:
            return "Invalid transaction amount: " + std::to_string(requested);
        case ErrorKind::InsufficientFunds:
            return "Insufficient funds for withdrawal of " + std::to_string(requested) +
                ". Available balance: " + std::to_string(available);
    }
    return "Unknown ledger error";
}

} // namespace ledger
