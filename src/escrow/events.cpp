// VESCROW - Escrow Events
// Copyright (c) 2024 VESCROW Developers
// MIT License

#include "vescrow/escrow/events.h"

#include <sstream>

namespace vescrow {
namespace escrow {

const char* DepositTypeToString(DepositType type) {
    switch (type) {
        case DepositType::DEPOSIT_FOR:          return "DepositFor";
        case DepositType::CREATE_LOCK:          return "CreateLock";
        case DepositType::INCREASE_LOCK_AMOUNT: return "IncreaseLockAmount";
        case DepositType::INCREASE_UNLOCK_TIME: return "IncreaseUnlockTime";
        default:                                return "Unknown";
    }
}

std::string DepositEvent::ToString() const {
    std::ostringstream ss;
    ss << "Deposit(" << DepositTypeToString(type)
       << ", account=" << account.ToHex()
       << ", amount=" << amount
       << ", end=" << lockEnd
       << ", ts=" << timestamp << ")";
    return ss.str();
}

std::string WithdrawEvent::ToString() const {
    std::ostringstream ss;
    ss << "Withdraw(account=" << account.ToHex()
       << ", amount=" << amount
       << ", ts=" << timestamp << ")";
    return ss.str();
}

std::string SupplyEvent::ToString() const {
    std::ostringstream ss;
    ss << "Supply(" << previous << " -> " << current << ")";
    return ss.str();
}

} // namespace escrow
} // namespace vescrow
