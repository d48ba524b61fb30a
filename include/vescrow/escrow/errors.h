// VESCROW - Escrow Error Codes
// Copyright (c) 2024 VESCROW Developers
// MIT License

#ifndef VESCROW_ESCROW_ERRORS_H
#define VESCROW_ESCROW_ERRORS_H

#include <stdexcept>
#include <string>

namespace vescrow {
namespace escrow {

// ============================================================================
// Error Codes
// ============================================================================

/// Reasons a ledger operation is rejected
enum class EscrowError {
    OK = 0,

    // Input errors
    ZERO_AMOUNT,
    AMOUNT_OUT_OF_RANGE,

    // Lock state errors
    LOCK_EXISTS,
    NO_EXISTING_LOCK,
    LOCK_EXPIRED,
    LOCK_NOT_EXPIRED,

    // Unlock time errors
    UNLOCK_TIME_NOT_FUTURE,
    UNLOCK_TIME_TOO_FAR,
    UNLOCK_TIME_NOT_EXTENDED,

    // Caller errors
    CONTRACT_NOT_ALLOWED,
    REENTRANT_CALL,

    // Collaborator and internal failures
    ASSET_TRANSFER_FAILED,
    ARITHMETIC_OVERFLOW,
    SWEEP_LIMIT_EXCEEDED,
    CLOCK_REGRESSION,
    STORAGE_FAILURE,
};

/// Convert error code to string
const char* EscrowErrorToString(EscrowError error);

// ============================================================================
// Exception
// ============================================================================

/// Raised inside the engine; the lifecycle layer turns it into an EscrowResult
class EscrowException : public std::runtime_error {
public:
    EscrowException(EscrowError code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    EscrowError code() const { return code_; }

private:
    EscrowError code_;
};

// ============================================================================
// Operation Result
// ============================================================================

struct EscrowResult {
    EscrowError error{EscrowError::OK};
    std::string message;

    static EscrowResult Ok() { return EscrowResult(); }

    static EscrowResult Fail(EscrowError code, const std::string& msg = "") {
        EscrowResult r;
        r.error = code;
        r.message = msg;
        return r;
    }

    bool ok() const { return error == EscrowError::OK; }

    /// "OK" or "<CODE>: <message>"
    std::string ToString() const;
};

} // namespace escrow
} // namespace vescrow

#endif // VESCROW_ESCROW_ERRORS_H
