// VESCROW - Ledger Scripts
// Copyright (c) 2024 VESCROW Developers
// MIT License
//
// Line-oriented command scripts replayed against a VotingEscrow:
//
//   fund alice 1000000         # credit spendable balance
//   lock alice 500000 +52w     # create a lock
//   advance 1w                 # move the clock
//   power alice                # print voting power
//
// Accounts are 40-digit hex addresses or names, hashed to an address.
// "contract:<acct>" marks a contract caller.

#ifndef VESCROW_ESCROW_SCRIPT_H
#define VESCROW_ESCROW_SCRIPT_H

#include "vescrow/escrow/interfaces.h"
#include "vescrow/escrow/voting_escrow.h"

#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace vescrow {
namespace escrow {

/// Seconds per block when "advance" is not given a block count
constexpr int64_t SCRIPT_BLOCK_INTERVAL = 12;

std::optional<int64_t> ParseScriptInteger(const std::string& str);

/// "90", "90s", "15m", "2h", "3d", "4w", "1y"
std::optional<int64_t> ParseScriptDuration(const std::string& str);

/// Unix seconds, ISO 8601, or +DURATION relative to now
std::optional<Timestamp> ParseScriptTime(const std::string& str, Timestamp now);

std::optional<Address> ParseScriptAccount(const std::string& str);

Caller ParseScriptCaller(const std::string& str, const Address& account);

class ScriptRunner {
public:
    ScriptRunner(VotingEscrow& escrow,
                 std::shared_ptr<ManualChainClock> clock,
                 std::shared_ptr<InMemoryAssetMover> mover,
                 std::shared_ptr<StaticContractChecker> checker,
                 std::ostream& out);

    /// Run every line; returns the number of failed commands
    int Run(std::istream& in);

    /// Run one tokenized command; on failure error says why
    bool Execute(const std::vector<std::string>& args, std::string& error);

private:
    VotingEscrow& escrow_;
    std::shared_ptr<ManualChainClock> clock_;
    std::shared_ptr<InMemoryAssetMover> mover_;
    std::shared_ptr<StaticContractChecker> checker_;
    std::ostream& out_;
};

} // namespace escrow
} // namespace vescrow

#endif // VESCROW_ESCROW_SCRIPT_H
