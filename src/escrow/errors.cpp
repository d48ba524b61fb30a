// VESCROW - Escrow Error Codes
// Copyright (c) 2024 VESCROW Developers
// MIT License

#include "vescrow/escrow/errors.h"

namespace vescrow {
namespace escrow {

const char* EscrowErrorToString(EscrowError error) {
    switch (error) {
        case EscrowError::OK:                       return "OK";
        case EscrowError::ZERO_AMOUNT:              return "ZERO_AMOUNT";
        case EscrowError::AMOUNT_OUT_OF_RANGE:      return "AMOUNT_OUT_OF_RANGE";
        case EscrowError::LOCK_EXISTS:              return "LOCK_EXISTS";
        case EscrowError::NO_EXISTING_LOCK:         return "NO_EXISTING_LOCK";
        case EscrowError::LOCK_EXPIRED:             return "LOCK_EXPIRED";
        case EscrowError::LOCK_NOT_EXPIRED:         return "LOCK_NOT_EXPIRED";
        case EscrowError::UNLOCK_TIME_NOT_FUTURE:   return "UNLOCK_TIME_NOT_FUTURE";
        case EscrowError::UNLOCK_TIME_TOO_FAR:      return "UNLOCK_TIME_TOO_FAR";
        case EscrowError::UNLOCK_TIME_NOT_EXTENDED: return "UNLOCK_TIME_NOT_EXTENDED";
        case EscrowError::CONTRACT_NOT_ALLOWED:     return "CONTRACT_NOT_ALLOWED";
        case EscrowError::REENTRANT_CALL:           return "REENTRANT_CALL";
        case EscrowError::ASSET_TRANSFER_FAILED:    return "ASSET_TRANSFER_FAILED";
        case EscrowError::ARITHMETIC_OVERFLOW:      return "ARITHMETIC_OVERFLOW";
        case EscrowError::SWEEP_LIMIT_EXCEEDED:     return "SWEEP_LIMIT_EXCEEDED";
        case EscrowError::CLOCK_REGRESSION:         return "CLOCK_REGRESSION";
        case EscrowError::STORAGE_FAILURE:          return "STORAGE_FAILURE";
        default:                                    return "UNKNOWN";
    }
}

std::string EscrowResult::ToString() const {
    if (ok()) {
        return "OK";
    }
    std::string result = EscrowErrorToString(error);
    if (!message.empty()) {
        result += ": " + message;
    }
    return result;
}

} // namespace escrow
} // namespace vescrow
