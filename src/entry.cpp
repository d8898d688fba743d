#include "entry.hpp"
#include <stdexcept>

namespace ledger {

const char* to_string(EntryKind kind) {
    switch (kind) {
        case EntryKind::Deposit:
            return "Deposit";
        case EntryKind::Withdrawal:
            return "Withdrawal";
    }
    return "Unknown";
}

EntryKind entry_kind_from_string(const std::string& name) {
    if (name == "Deposit") {
        return EntryKind::Deposit;
    }
    if (name == "Withdrawal") {
        return EntryKind::Withdrawal;
    }
    throw std::invalid_argument("Unknown entry kind: " + name);
}

std::string Entry::describe() const {
    return std::string(to_string(kind)) + " of " + std::to_string(amount) + " to " + address;
}

void to_json(nlohmann::json& j, const EntryKind& kind) {
    j = to_string(kind);
}

void from_json(const nlohmann::json& j, EntryKind& kind) {
    kind = entry_kind_from_string(j.get<std::string>());
}

} // namespace ledger
