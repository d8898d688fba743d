#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace ledger {

// Smallest unit of value the ledger counts in
using Amount = int64_t;

enum class EntryKind {
    Deposit,
    Withdrawal
};

// Display name of an entry kind ("Deposit" / "Withdrawal")
const char* to_string(EntryKind kind);

// Parses a display name back into an EntryKind, throwing std::invalid_argument
// for anything else
EntryKind entry_kind_from_string(const std::string& name);

// One accepted movement of funds. The sign of the movement is carried by
// kind; amount is always a positive magnitude once admitted.
struct Entry {
    EntryKind kind;
    std::string address;  // Wallet the entry concerns, free-form
    Amount amount;        // Magnitude of the movement

    // Signed change this entry makes to the balance
    Amount delta() const { return kind == EntryKind::Deposit ? amount : -amount; }

    // "<Kind> of <amount> to <address>"
    std::string describe() const;

    bool operator==(const Entry&) const = default;
};

// JSON serialization for EntryKind, as its display name. from_json exists
// because the Entry macro below generates both directions.
void to_json(nlohmann::json& j, const EntryKind& kind);
void from_json(const nlohmann::json& j, EntryKind& kind);

// JSON serialization for Entry
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Entry, kind, address, amount)

} // namespace ledger
