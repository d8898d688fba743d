#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace ledger {

// Why a proposed entry was refused
enum class ErrorKind {
    InvalidAmount,
    InsufficientFunds
};

const char* to_string(ErrorKind kind);

// A rejected entry, with the figures the caller needs to explain it
struct LedgerError {
    ErrorKind kind;
    int64_t requested = 0;  // Amount that was proposed
    int64_t available = 0;  // Balance at the time, only meaningful for InsufficientFunds

    std::string message() const;

    bool operator==(const LedgerError&) const = default;
};

// Outcome of a fallible ledger operation: either a value or the LedgerError
// that stopped it. Rejections are expected results, not exceptions.
template <typename T>
class Result {
public:
    Result(T value) : outcome_(std::move(value)) {}
    Result(LedgerError error) : outcome_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(outcome_); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(outcome_); }
    const LedgerError& error() const { return std::get<LedgerError>(outcome_); }

private:
    std::variant<T, LedgerError> outcome_;
};

// Failures of the environment around the ledger (config, files), never of
// the ledger rules themselves
class TerminalError : public std::runtime_error {
public:
    enum class ErrorType {
        ConfigReadError,
        ConfigFormatError,
        ExportError
    };

    TerminalError(ErrorType type, const std::string& message = "")
        : std::runtime_error(message.empty() ? "Terminal error" : message)
        , type_(type)
    {}

    ErrorType type() const { return type_; }

private:
    ErrorType type_;
};

} // namespace ledger
