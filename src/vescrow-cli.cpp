// VESCROW CLI - Ledger Script Replay
// Copyright (c) 2024 VESCROW Developers
// MIT License
//
// vescrow-cli replays a script of ledger commands against a LevelDB-backed
// vote-escrow ledger in the data directory and prints query results.

#include "vescrow/db/leveldb.h"
#include "vescrow/escrow/ledger_store.h"
#include "vescrow/escrow/script.h"
#include "vescrow/escrow/voting_escrow.h"
#include "vescrow/util/config.h"
#include "vescrow/util/logging.h"
#include "vescrow/util/time.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace vescrow {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "VESCROW CLI";

namespace defaults {
    constexpr const char* DB_DIRNAME = "ledger";
}

// ============================================================================
// CLI Configuration
// ============================================================================

struct CLIConfig {
    std::string dataDir;
    std::string configFile;
    std::string scriptPath;

    util::LoggingOptions logging;

    escrow::EscrowParams params;

    /// Clock start when the ledger is fresh
    int64_t startTime{0};
    uint64_t startHeight{0};

    bool showHelp{false};
    bool showVersion{false};
};

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: vescrow-cli [options] <script|->\n\n";
    std::cout << "Options:\n";
    std::cout << "  -help                      Show this help message\n";
    std::cout << "  -version                   Show version information\n";
    std::cout << "  -conf=FILE                 Config file (default: <datadir>/vescrow.conf)\n";
    std::cout << "  -datadir=DIR               Data directory\n";
    std::cout << "  -starttime=TIME            Clock start for a fresh ledger (unix or ISO 8601)\n";
    std::cout << "  -startheight=N             Marker start for a fresh ledger (default: 0)\n";
    std::cout << "  -loglevel=LEVEL            trace, debug, info, warn, error\n";
    std::cout << "  -logfile=FILE              Also log to FILE\n";
    std::cout << "  -printtoconsole=0/1        Log to the console (default: 1)\n";
    std::cout << "  -debug=CATEGORY            Log only these categories (comma separated)\n";
    std::cout << "\nEscrow Options:\n";
    std::cout << "  -escrow.lockunit=SECONDS   Unlock-time rounding unit (default: 604800)\n";
    std::cout << "  -escrow.maxlockduration=S  Longest lock (default: 126144000)\n";
    std::cout << "  -escrow.maxsweepbuckets=N  Sweep ceiling (default: 5218)\n";
    std::cout << "\nScript Commands (one per line, '#' starts a comment):\n";
    std::cout << "  fund <acct> <amount>               Credit spendable balance\n";
    std::cout << "  allow <acct>                       Allow a contract account to lock\n";
    std::cout << "  lock <acct> <amount> <unlock>      Create a lock\n";
    std::cout << "  increase <acct> <amount>           Add to an active lock\n";
    std::cout << "  extend <acct> <unlock>             Move the unlock time later\n";
    std::cout << "  depositfor <payer> <acct> <amount> Add to another account's lock\n";
    std::cout << "  withdraw <acct>                    Release an expired lock\n";
    std::cout << "  checkpoint                         Bring the global curve up to date\n";
    std::cout << "  advance <duration> [blocks]        Move the clock forward\n";
    std::cout << "  power <acct> [time]                Voting power of an account\n";
    std::cout << "  total [time]                       Total voting power\n";
    std::cout << "  powerat <acct> <marker>            Voting power at a past marker\n";
    std::cout << "  totalat <marker>                   Total voting power at a past marker\n";
    std::cout << "  state [acct]                       Ledger summary or account lock\n";
    std::cout << "\nAccounts are 40-digit hex addresses or names (hashed to an address).\n";
    std::cout << "A contract caller is written as contract:<acct>.\n";
    std::cout << "Times are unix seconds, ISO 8601, or +DURATION relative to now.\n";
    std::cout << "Durations take an optional unit suffix: s, m, h, d, w, y.\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 VESCROW Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

bool LoadConfig(int argc, char* argv[], CLIConfig& config) {
    namespace keys = util::ConfigKeys;

    util::ConfigManager manager;
    auto result = manager.ParseCommandLine(argc, argv);
    if (!result.success) {
        std::cerr << "Error: " << result.errorMessage << "\n";
        return false;
    }

    config.showHelp = manager.GetBool("help", false) || manager.GetBool("h", false);
    config.showVersion = manager.GetBool("version", false);
    if (config.showHelp || config.showVersion) {
        return true;
    }

    config.dataDir = manager.GetPath(keys::DATADIR, util::ConfigManager::GetDefaultDataDir());
    config.configFile = manager.GetPath(keys::CONF,
        (std::filesystem::path(config.dataDir) / util::DEFAULT_CONFIG_FILENAME).string());

    // A missing config file is fine; a malformed one is not
    std::error_code ec;
    if (std::filesystem::exists(config.configFile, ec)) {
        result = manager.ParseFile(config.configFile);
        if (!result.success) {
            std::cerr << "Error reading " << config.configFile << ": "
                      << result.errorMessage << "\n";
            return false;
        }
    }

    const auto& positional = manager.GetPositionalArgs();
    if (positional.size() != 1) {
        std::cerr << "Error: expected exactly one script path (use -help for usage)\n";
        return false;
    }
    config.scriptPath = positional[0];

    config.logging.level = util::LogLevelFromString(manager.GetString(keys::LOGLEVEL, "info"));
    config.logging.printToConsole = manager.GetBool(keys::PRINTTOCONSOLE, true);
    config.logging.logFile = manager.GetPath(keys::LOGFILE);
    config.logging.categories = manager.GetList(keys::DEBUG);

    std::string error;
    auto params = escrow::EscrowParams::FromConfig(manager, &error);
    if (!params) {
        std::cerr << "Error: " << error << "\n";
        return false;
    }
    config.params = *params;

    config.startTime = util::GetTime();
    if (auto start = manager.TryGetString("starttime")) {
        auto parsed = escrow::ParseScriptTime(*start, config.startTime);
        if (!parsed) {
            std::cerr << "Error: invalid -starttime " << *start << "\n";
            return false;
        }
        config.startTime = *parsed;
    }
    int64_t height = manager.GetInt("startheight", 0);
    if (height < 0) {
        std::cerr << "Error: -startheight must not be negative\n";
        return false;
    }
    config.startHeight = static_cast<uint64_t>(height);

    return true;
}

// ============================================================================
// Main
// ============================================================================

int AppMain(int argc, char* argv[]) {
    CLIConfig config;
    if (!LoadConfig(argc, argv, config)) {
        return 1;
    }
    if (config.showHelp) {
        PrintHelp();
        return 0;
    }
    if (config.showVersion) {
        PrintVersion();
        return 0;
    }

    if (!util::ConfigureLogging(config.logging)) {
        std::cerr << "Error: cannot open log file " << config.logging.logFile << "\n";
        return 1;
    }

    std::filesystem::path dbPath = std::filesystem::path(config.dataDir) / defaults::DB_DIRNAME;
    auto [status, database] = db::OpenLevelDatabase(dbPath);
    if (!status.ok()) {
        std::cerr << "Error: cannot open " << dbPath.string() << ": " << status.ToString() << "\n";
        return 1;
    }

    auto store = std::make_shared<escrow::LedgerStore>(std::move(database));
    auto clock = std::make_shared<escrow::ManualChainClock>(
        escrow::BlockContext(config.startTime, config.startHeight));
    auto mover = std::make_shared<escrow::InMemoryAssetMover>();
    auto checker = std::make_shared<escrow::StaticContractChecker>();

    auto [result, ledger] = escrow::VotingEscrow::Open(config.params, clock, mover, store);
    if (!result.ok()) {
        std::cerr << "Error: " << result.ToString() << "\n";
        return 1;
    }
    ledger->SetContractChecker(checker);

    // Resume no earlier than the latest stored point
    auto latest = ledger->GetGlobalPoint(ledger->Epoch());
    auto now = clock->Now();
    if (latest && (latest->ts > now.time || latest->marker > now.height)) {
        clock->Set(escrow::BlockContext(std::max(latest->ts, now.time),
                                        std::max(latest->marker, now.height)));
    }

    escrow::ScriptRunner runner(*ledger, clock, mover, checker, std::cout);
    int failures = 0;
    if (config.scriptPath == "-") {
        failures = runner.Run(std::cin);
    } else {
        std::ifstream script(config.scriptPath);
        if (!script.is_open()) {
            std::cerr << "Error: cannot open script " << config.scriptPath << "\n";
            return 1;
        }
        failures = runner.Run(script);
    }

    util::Logger::Instance().Flush();
    return failures == 0 ? 0 : 2;
}

} // namespace cli
} // namespace vescrow

int main(int argc, char* argv[]) {
    try {
        return vescrow::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
