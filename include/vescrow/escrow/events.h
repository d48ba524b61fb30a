// VESCROW - Escrow Events
// Copyright (c) 2024 VESCROW Developers
// MIT License

#ifndef VESCROW_ESCROW_EVENTS_H
#define VESCROW_ESCROW_EVENTS_H

#include "vescrow/core/types.h"

#include <functional>
#include <string>

namespace vescrow {
namespace escrow {

/// Which operation produced a deposit
enum class DepositType {
    DEPOSIT_FOR = 0,
    CREATE_LOCK = 1,
    INCREASE_LOCK_AMOUNT = 2,
    INCREASE_UNLOCK_TIME = 3,
};

const char* DepositTypeToString(DepositType type);

struct DepositEvent {
    /// Lock owner
    Address account;
    /// Account the tokens were pulled from (differs from account for DepositFor)
    Address payer;
    Amount amount{0};
    Timestamp lockEnd{0};
    DepositType type{DepositType::DEPOSIT_FOR};
    Timestamp timestamp{0};

    std::string ToString() const;
};

struct WithdrawEvent {
    Address account;
    Amount amount{0};
    Timestamp timestamp{0};

    std::string ToString() const;
};

/// Locked supply before and after an operation
struct SupplyEvent {
    Amount previous{0};
    Amount current{0};

    std::string ToString() const;
};

using DepositCallback = std::function<void(const DepositEvent&)>;
using WithdrawCallback = std::function<void(const WithdrawEvent&)>;
using SupplyCallback = std::function<void(const SupplyEvent&)>;

} // namespace escrow
} // namespace vescrow

#endif // VESCROW_ESCROW_EVENTS_H
