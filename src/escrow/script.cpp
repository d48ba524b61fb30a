// VESCROW - Ledger Scripts
// Copyright (c) 2024 VESCROW Developers
// MIT License

#include "vescrow/escrow/script.h"
#include "vescrow/core/arith.h"
#include "vescrow/crypto/sha256.h"
#include "vescrow/util/logging.h"
#include "vescrow/util/time.h"

#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace vescrow {
namespace escrow {

// ============================================================================
// Token Parsing
// ============================================================================

std::optional<int64_t> ParseScriptInteger(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    long long value = std::strtoll(str.c_str(), &end, 10);
    if (errno != 0 || end == str.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

std::optional<int64_t> ParseScriptDuration(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }
    int64_t multiplier = 1;
    std::string digits = str;
    switch (str.back()) {
        case 's': multiplier = 1; break;
        case 'm': multiplier = util::SECONDS_PER_MINUTE; break;
        case 'h': multiplier = util::SECONDS_PER_HOUR; break;
        case 'd': multiplier = util::SECONDS_PER_DAY; break;
        case 'w': multiplier = util::SECONDS_PER_WEEK; break;
        case 'y': multiplier = util::SECONDS_PER_YEAR; break;
        default:
            if (str.back() < '0' || str.back() > '9') {
                return std::nullopt;
            }
            break;
    }
    if (str.back() < '0' || str.back() > '9') {
        digits.pop_back();
    }
    auto value = ParseScriptInteger(digits);
    if (!value || *value < 0) {
        return std::nullopt;
    }
    int64_t seconds;
    if (__builtin_mul_overflow(*value, multiplier, &seconds)) {
        return std::nullopt;
    }
    return seconds;
}

std::optional<Timestamp> ParseScriptTime(const std::string& str, Timestamp now) {
    if (!str.empty() && str[0] == '+') {
        auto offset = ParseScriptDuration(str.substr(1));
        if (!offset) {
            return std::nullopt;
        }
        int64_t result;
        if (!AddNoOverflow(now, *offset, result)) {
            return std::nullopt;
        }
        return result;
    }
    if (auto value = ParseScriptInteger(str)) {
        return value;
    }
    return util::ParseISO8601(str);
}

std::optional<Address> ParseScriptAccount(const std::string& str) {
    std::string name = str;
    if (name.rfind("contract:", 0) == 0) {
        name = name.substr(9);
    }
    if (name.empty()) {
        return std::nullopt;
    }

    std::string digits = name;
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }
    if (digits.size() == Address::SIZE * 2 &&
        digits.find_first_not_of("0123456789abcdefABCDEF") == std::string::npos) {
        return Address::FromHex(digits);
    }

    // Names map to the leading bytes of their SHA-256
    Hash256 digest = SHA256Hash(reinterpret_cast<const Byte*>(name.data()), name.size());
    return Address(digest.data(), Address::SIZE);
}

Caller ParseScriptCaller(const std::string& str, const Address& account) {
    if (str.rfind("contract:", 0) == 0) {
        return Caller::Contract(account);
    }
    return Caller::External(account);
}

// ============================================================================
// ScriptRunner
// ============================================================================

ScriptRunner::ScriptRunner(VotingEscrow& escrow,
                           std::shared_ptr<ManualChainClock> clock,
                           std::shared_ptr<InMemoryAssetMover> mover,
                           std::shared_ptr<StaticContractChecker> checker,
                           std::ostream& out)
    : escrow_(escrow), clock_(std::move(clock)),
      mover_(std::move(mover)), checker_(std::move(checker)), out_(out) {}

int ScriptRunner::Run(std::istream& in) {
    int failures = 0;
    std::string line;
    int lineNum = 0;
    while (std::getline(in, line)) {
        ++lineNum;
        auto comment = line.find('#');
        if (comment != std::string::npos) {
            line.erase(comment);
        }

        std::istringstream tokens(line);
        std::vector<std::string> args;
        std::string token;
        while (tokens >> token) {
            args.push_back(token);
        }
        if (args.empty()) {
            continue;
        }

        std::string error;
        if (!Execute(args, error)) {
            out_ << "line " << lineNum << ": " << args[0] << " failed: " << error << "\n";
            LOG_DEBUG(util::LogCategory::ESCROW)
                << "Script line " << lineNum << " failed: " << error;
            ++failures;
        }
    }
    return failures;
}

bool ScriptRunner::Execute(const std::vector<std::string>& args, std::string& error) {
    if (args.empty()) {
        error = "empty command";
        return false;
    }
    const std::string& cmd = args[0];
    const Timestamp now = clock_->Now().time;

    auto needArgs = [&](size_t min, size_t max) {
        if (args.size() - 1 < min || args.size() - 1 > max) {
            error = "wrong number of arguments";
            return false;
        }
        return true;
    };
    auto account = [&](size_t idx) -> std::optional<Address> {
        auto addr = ParseScriptAccount(args[idx]);
        if (!addr) {
            error = "bad account " + args[idx];
        }
        return addr;
    };
    auto amount = [&](size_t idx) -> std::optional<Amount> {
        auto value = ParseScriptInteger(args[idx]);
        if (!value) {
            error = "bad amount " + args[idx];
        }
        return value;
    };
    auto time = [&](size_t idx) -> std::optional<Timestamp> {
        auto value = ParseScriptTime(args[idx], now);
        if (!value) {
            error = "bad time " + args[idx];
        }
        return value;
    };
    auto report = [&](const EscrowResult& result) {
        if (!result.ok()) {
            error = result.ToString();
            return false;
        }
        out_ << cmd << " ok\n";
        return true;
    };

    if (cmd == "fund") {
        if (!needArgs(2, 2)) return false;
        auto addr = account(1);
        auto value = amount(2);
        if (!addr || !value) return false;
        if (!mover_->Credit(*addr, *value)) {
            error = "cannot credit " + args[2];
            return false;
        }
        out_ << "balance " << args[1] << " = " << mover_->BalanceOf(*addr) << "\n";
        return true;
    }

    if (cmd == "allow") {
        if (!needArgs(1, 1)) return false;
        auto addr = account(1);
        if (!addr) return false;
        checker_->Allow(*addr);
        return true;
    }

    if (cmd == "lock") {
        if (!needArgs(3, 3)) return false;
        auto addr = account(1);
        auto value = amount(2);
        auto unlock = time(3);
        if (!addr || !value || !unlock) return false;
        return report(escrow_.CreateLock(ParseScriptCaller(args[1], *addr), *value, *unlock));
    }

    if (cmd == "increase") {
        if (!needArgs(2, 2)) return false;
        auto addr = account(1);
        auto value = amount(2);
        if (!addr || !value) return false;
        return report(escrow_.IncreaseAmount(ParseScriptCaller(args[1], *addr), *value));
    }

    if (cmd == "extend") {
        if (!needArgs(2, 2)) return false;
        auto addr = account(1);
        auto unlock = time(2);
        if (!addr || !unlock) return false;
        return report(escrow_.IncreaseUnlockTime(ParseScriptCaller(args[1], *addr), *unlock));
    }

    if (cmd == "depositfor") {
        if (!needArgs(3, 3)) return false;
        auto payer = account(1);
        auto addr = account(2);
        auto value = amount(3);
        if (!payer || !addr || !value) return false;
        return report(escrow_.DepositFor(ParseScriptCaller(args[1], *payer), *addr, *value));
    }

    if (cmd == "withdraw") {
        if (!needArgs(1, 1)) return false;
        auto addr = account(1);
        if (!addr) return false;
        return report(escrow_.Withdraw(ParseScriptCaller(args[1], *addr)));
    }

    if (cmd == "checkpoint") {
        if (!needArgs(0, 0)) return false;
        return report(escrow_.Checkpoint());
    }

    if (cmd == "advance") {
        if (!needArgs(1, 2)) return false;
        auto seconds = ParseScriptDuration(args[1]);
        if (!seconds) {
            error = "bad duration " + args[1];
            return false;
        }
        int64_t blocks = *seconds / SCRIPT_BLOCK_INTERVAL;
        if (args.size() == 3) {
            auto value = ParseScriptInteger(args[2]);
            if (!value || *value < 0) {
                error = "bad block count " + args[2];
                return false;
            }
            blocks = *value;
        }
        clock_->Advance(*seconds, static_cast<BlockHeight>(blocks));
        auto ctx = clock_->Now();
        out_ << "now " << util::FormatISO8601(ctx.time)
             << " (" << ctx.time << ") marker " << ctx.height << "\n";
        return true;
    }

    if (cmd == "power") {
        if (!needArgs(1, 2)) return false;
        auto addr = account(1);
        if (!addr) return false;
        Timestamp t = now;
        if (args.size() == 3) {
            auto parsed = time(2);
            if (!parsed) return false;
            t = *parsed;
        }
        out_ << "power " << args[1] << " @" << t << " = "
             << FormatPower(escrow_.PowerOf(*addr, t)) << "\n";
        return true;
    }

    if (cmd == "total") {
        if (!needArgs(0, 1)) return false;
        Timestamp t = now;
        if (args.size() == 2) {
            auto parsed = time(1);
            if (!parsed) return false;
            t = *parsed;
        }
        out_ << "total @" << t << " = " << FormatPower(escrow_.TotalPower(t)) << "\n";
        return true;
    }

    if (cmd == "powerat" || cmd == "totalat") {
        bool single = cmd == "powerat";
        if (!needArgs(single ? 2 : 1, single ? 2 : 1)) return false;
        auto marker = ParseScriptInteger(args.back());
        if (!marker || *marker < 0) {
            error = "bad marker " + args.back();
            return false;
        }
        std::optional<Power> power;
        if (single) {
            auto addr = account(1);
            if (!addr) return false;
            power = escrow_.PowerOfAt(*addr, static_cast<BlockHeight>(*marker));
        } else {
            power = escrow_.TotalPowerAt(static_cast<BlockHeight>(*marker));
        }
        if (!power) {
            error = "marker " + args.back() + " is in the future";
            return false;
        }
        out_ << cmd << " " << (single ? args[1] + " " : std::string())
             << "#" << *marker << " = " << FormatPower(*power) << "\n";
        return true;
    }

    if (cmd == "state") {
        if (!needArgs(0, 1)) return false;
        if (args.size() == 2) {
            auto addr = account(1);
            if (!addr) return false;
            auto lock = escrow_.GetLock(*addr);
            out_ << "account " << addr->ToHex()
                 << " " << LockStateToString(escrow_.GetLockState(*addr))
                 << " amount=" << lock.amount
                 << " end=" << lock.end
                 << " epoch=" << escrow_.UserEpoch(*addr)
                 << " balance=" << mover_->BalanceOf(*addr) << "\n";
            return true;
        }
        out_ << "epoch=" << escrow_.Epoch()
             << " supply=" << escrow_.Supply()
             << " total=" << FormatPower(escrow_.TotalPower())
             << " digest=" << escrow_.GetStateDigest().ToHex() << "\n";
        return true;
    }

    error = "unknown command";
    return false;
}

} // namespace escrow
} // namespace vescrow
