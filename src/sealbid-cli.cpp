// SEALBID CLI - Command Line Interface
// Copyright (c) 2024 SEALBID Developers
// MIT License
//
// The sealbid-cli tool operates a sealed-bid ledger stored in the data
// directory (LevelDB) or in memory for a single invocation.

#include <sealbid/core/hex.h>
#include <sealbid/db/database.h>
#include <sealbid/ledger/commitment.h>
#include <sealbid/ledger/ledger.h>
#include <sealbid/util/config.h>
#include <sealbid/util/logging.h>

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace sealbid {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "SEALBID CLI";

/// Exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_REJECTED = 1;
constexpr int EXIT_USAGE = 2;

namespace defaults {
    constexpr const char* BACKEND_LEVELDB = "leveldb";
    constexpr const char* BACKEND_MEMORY = "memory";
    constexpr const char* LEDGER_DIRNAME = "ledger";
    constexpr const char* LOGLEVEL = "warn";
    constexpr const char* AUDITLEVEL = "info";
}

// ============================================================================
// Help Text
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: sealbid-cli [options] <command> [args]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --help                     Show this help message\n";
    std::cout << "  --version                  Show version information\n";
    std::cout << "  --conf=FILE                Config file path\n";
    std::cout << "  --datadir=DIR              Data directory path\n";
    std::cout << "  --backend=leveldb|memory   Storage backend\n";
    std::cout << "  --admin=ID                 Admin of a newly created ledger (default: deployer)\n";
    std::cout << "  --height=N                 Advance the logical height before the command\n";
    std::cout << "  --loglevel=LEVEL           trace, debug, info, warn, error, off\n";
    std::cout << "  --logfile=FILE             Also write log output to FILE\n";
    std::cout << "  --logcategories=A,B        Only log these categories (ledger, db, audit, config, cli)\n";
    std::cout << "  --auditlevel=LEVEL         Level for the audit category (default: info)\n";
    std::cout << "  --noprinttoconsole         Do not log to stderr\n";
    std::cout << "\nCommands:\n";
    std::cout << "  commit <amount> <description> <bidder>           Print a bid commitment\n";
    std::cout << "  register <project>                               Register a project\n";
    std::cout << "  submit <caller> <project> <commitment>           Submit a sealed bid\n";
    std::cout << "  reveal <caller> <project> <amount> <description> <commitment>\n";
    std::cout << "                                                   Reveal a bid\n";
    std::cout << "  withdraw <caller> <project>                      Withdraw an unrevealed bid\n";
    std::cout << "  pause <caller>                                   Pause the ledger\n";
    std::cout << "  unpause <caller>                                 Resume the ledger\n";
    std::cout << "  setadmin <caller> <newadmin>                     Transfer adminship\n";
    std::cout << "  bid <project> <bidder>                           Show a bid record\n";
    std::cout << "  bids <project>                                   List a project's bids\n";
    std::cout << "  status                                           Show ledger state\n";
    std::cout << "\nExit status: 0 success, 1 rejected by the ledger, 2 usage or configuration error\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 SEALBID Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Argument Helpers
// ============================================================================

/// Strict unsigned decimal parse (no sign, no trailing characters)
bool ParseUInt64(const std::string& str, uint64_t& out) {
    if (str.empty() || str.size() > 20) {
        return false;
    }
    uint64_t value = 0;
    for (char c : str) {
        if (c < '0' || c > '9') {
            return false;
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (UINT64_MAX - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

int UsageError(const std::string& message) {
    std::cerr << "error: " << message << "\n";
    std::cerr << "Use 'sealbid-cli --help' for usage information.\n";
    return EXIT_USAGE;
}

bool RequireArgs(const std::vector<std::string>& args, size_t count) {
    // args[0] is the command
    return args.size() == count + 1;
}

int Report(const ledger::LedgerResult& result) {
    if (result) {
        std::cout << "ok\n";
        return EXIT_OK;
    }
    std::cerr << "error: " << result.ToString() << "\n";
    return EXIT_REJECTED;
}

void PrintRecord(const ledger::BidRecord& record) {
    std::cout << "commitment: " << record.commitment.ToHex() << "\n";
    std::cout << "revealed: " << (record.revealed ? "true" : "false") << "\n";
    std::cout << "amount: " << record.amount << "\n";
    std::cout << "description: " << record.description << "\n";
    std::cout << "revealed_at: ";
    if (record.revealedAt) {
        std::cout << *record.revealedAt;
    } else {
        std::cout << "-";
    }
    std::cout << "\n";
}

// ============================================================================
// Setup
// ============================================================================

/// Configure logging sinks, level and categories; false on bad input
bool SetupLogging(const util::ConfigManager& config) {
    auto& logger = util::Logger::Instance();
    logger.ClearSinks();
    logger.EnableAllCategories();
    logger.ClearCategoryLevels();
    
    std::string levelName = config.GetString(util::ConfigKeys::LOGLEVEL, "");
    auto level = util::ParseLogLevel(levelName);
    if (!level) {
        std::cerr << "error: unknown log level '" << levelName << "'\n";
        return false;
    }
    logger.SetLevel(*level);
    
    std::string auditName = config.GetString(util::ConfigKeys::AUDITLEVEL, "");
    auto auditLevel = util::ParseLogLevel(auditName);
    if (!auditLevel) {
        std::cerr << "error: unknown audit level '" << auditName << "'\n";
        return false;
    }
    logger.SetCategoryLevel(util::LogCategory::AUDIT, *auditLevel);
    
    for (const auto& category : config.GetList(util::ConfigKeys::LOGCATEGORIES)) {
        logger.EnableCategory(category);
    }
    
    if (config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, true)) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = util::LogLevel::Trace;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }
    
    std::string logFile = config.GetPath(util::ConfigKeys::LOGFILE);
    if (!logFile.empty()) {
        util::FileSink::Config fileConfig;
        fileConfig.path = logFile;
        fileConfig.level = util::LogLevel::Trace;
        auto sink = std::make_shared<util::FileSink>(fileConfig);
        if (!sink->IsOpen()) {
            std::cerr << "error: cannot open log file " << logFile << "\n";
            return false;
        }
        logger.AddSink(sink);
    }
    return true;
}

/// Open the ledger database selected by the config
std::unique_ptr<db::Database> OpenBackend(const util::ConfigManager& config,
                                          const std::string& dataDir) {
    std::string backend = config.GetString(util::ConfigKeys::BACKEND, "");
    
    if (backend == defaults::BACKEND_MEMORY) {
        LOG_DEBUG(util::LogCategory::CLI) << "Using in-memory ledger";
        return db::CreateMemoryDatabase();
    }
    
    if (backend != defaults::BACKEND_LEVELDB) {
        std::cerr << "error: unknown backend '" << backend << "'\n";
        return nullptr;
    }
    
    std::filesystem::path path = std::filesystem::path(dataDir) / defaults::LEDGER_DIRNAME;
    auto [status, database] = db::OpenDatabase(path);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Cannot open " << path.string()
                                         << ": " << status.ToString();
        std::cerr << "error: cannot open ledger database: " << status.ToString() << "\n";
        return nullptr;
    }
    LOG_DEBUG(util::LogCategory::CLI) << "Opened ledger at " << path.string();
    return std::move(database);
}

// ============================================================================
// Commands
// ============================================================================

int CommandCommit(const std::vector<std::string>& args) {
    if (!RequireArgs(args, 3)) {
        return UsageError("commit <amount> <description> <bidder>");
    }
    uint64_t amount = 0;
    if (!ParseUInt64(args[1], amount)) {
        return UsageError("invalid amount: " + args[1]);
    }
    std::cout << ledger::ComputeBidCommitment(amount, args[2], args[3]).ToHex() << "\n";
    return EXIT_OK;
}

int ExecuteLedgerCommand(ledger::BidLedger& bids, const std::vector<std::string>& args) {
    const std::string& command = args[0];
    uint64_t projectId = 0;
    
    if (command == "register") {
        if (!RequireArgs(args, 1)) return UsageError("register <project>");
        if (!ParseUInt64(args[1], projectId)) return UsageError("invalid project: " + args[1]);
        if (!bids.RegisterProject(projectId)) {
            std::cerr << "error: project " << projectId << " could not be registered\n";
            return EXIT_REJECTED;
        }
        std::cout << "ok\n";
        return EXIT_OK;
    }
    
    if (command == "submit") {
        if (!RequireArgs(args, 3)) return UsageError("submit <caller> <project> <commitment>");
        if (!ParseUInt64(args[2], projectId)) return UsageError("invalid project: " + args[2]);
        if (!IsValidHex(args[3])) return UsageError("commitment must be hex");
        return Report(bids.SubmitBid(args[1], projectId, HexToBytes(args[3])));
    }
    
    if (command == "reveal") {
        if (!RequireArgs(args, 5)) {
            return UsageError("reveal <caller> <project> <amount> <description> <commitment>");
        }
        uint64_t amount = 0;
        if (!ParseUInt64(args[2], projectId)) return UsageError("invalid project: " + args[2]);
        if (!ParseUInt64(args[3], amount)) return UsageError("invalid amount: " + args[3]);
        if (!IsValidHex(args[5])) return UsageError("commitment must be hex");
        return Report(bids.RevealBid(args[1], projectId, amount, args[4], HexToBytes(args[5])));
    }
    
    if (command == "withdraw") {
        if (!RequireArgs(args, 2)) return UsageError("withdraw <caller> <project>");
        if (!ParseUInt64(args[2], projectId)) return UsageError("invalid project: " + args[2]);
        return Report(bids.WithdrawBid(args[1], projectId));
    }
    
    if (command == "pause") {
        if (!RequireArgs(args, 1)) return UsageError("pause <caller>");
        return Report(bids.Pause(args[1]));
    }
    
    if (command == "unpause") {
        if (!RequireArgs(args, 1)) return UsageError("unpause <caller>");
        return Report(bids.Unpause(args[1]));
    }
    
    if (command == "setadmin") {
        if (!RequireArgs(args, 2)) return UsageError("setadmin <caller> <newadmin>");
        return Report(bids.SetAdmin(args[1], args[2]));
    }
    
    if (command == "bid") {
        if (!RequireArgs(args, 2)) return UsageError("bid <project> <bidder>");
        if (!ParseUInt64(args[1], projectId)) return UsageError("invalid project: " + args[1]);
        auto record = bids.GetBidDetails(projectId, args[2]);
        if (!record) {
            std::cout << "not found\n";
            return EXIT_REJECTED;
        }
        PrintRecord(*record);
        return EXIT_OK;
    }
    
    if (command == "bids") {
        if (!RequireArgs(args, 1)) return UsageError("bids <project>");
        if (!ParseUInt64(args[1], projectId)) return UsageError("invalid project: " + args[1]);
        auto list = bids.GetProjectBids(projectId);
        if (!list) {
            std::cout << "not found\n";
            return EXIT_REJECTED;
        }
        for (const auto& header : *list) {
            std::cout << header.bidder << " " << header.commitment.ToHex()
                      << " " << header.submittedAt << "\n";
        }
        return EXIT_OK;
    }
    
    if (command == "status") {
        if (!RequireArgs(args, 0)) return UsageError("status takes no arguments");
        std::cout << "backend: " << bids.GetDatabase().Name() << "\n";
        std::cout << "admin: " << bids.GetAdmin() << "\n";
        std::cout << "paused: " << (bids.IsPaused() ? "true" : "false") << "\n";
        std::cout << "height: " << bids.GetHeight() << "\n";
        for (ProjectId id : bids.ListProjects()) {
            std::cout << "project " << id << ": " << bids.GetBidCount(id) << " bids\n";
        }
        return EXIT_OK;
    }
    
    return UsageError("unknown command: " + command);
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigManager config;
    
    auto parsed = config.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        return UsageError(parsed.ToString());
    }
    
    if (config.GetBool(util::ConfigKeys::HELP, false)) {
        PrintHelp();
        return EXIT_OK;
    }
    if (config.GetBool(util::ConfigKeys::VERSION, false)) {
        PrintVersion();
        return EXIT_OK;
    }
    
    config.SetDefault(util::ConfigKeys::DATADIR, util::ConfigManager::GetDefaultDataDir());
    config.SetDefault(util::ConfigKeys::LOGLEVEL, defaults::LOGLEVEL);
    config.SetDefault(util::ConfigKeys::AUDITLEVEL, defaults::AUDITLEVEL);
    config.SetDefault(util::ConfigKeys::BACKEND,
        db::HasPersistentBackend() ? defaults::BACKEND_LEVELDB : defaults::BACKEND_MEMORY);
    
    std::string dataDir = config.GetPath(util::ConfigKeys::DATADIR);
    
    // Command line takes precedence over the config file
    if (config.HasKey(util::ConfigKeys::CONF)) {
        auto fileResult = config.ParseFile(config.GetPath(util::ConfigKeys::CONF));
        if (!fileResult.success) {
            return UsageError(fileResult.ToString());
        }
    } else {
        std::filesystem::path confPath =
            std::filesystem::path(dataDir) / util::DEFAULT_CONFIG_FILENAME;
        std::error_code ec;
        if (std::filesystem::exists(confPath, ec)) {
            auto fileResult = config.ParseFile(confPath.string());
            if (!fileResult.success) {
                return UsageError(fileResult.ToString());
            }
        }
    }
    
    if (!SetupLogging(config)) {
        return EXIT_USAGE;
    }
    
    const std::vector<std::string>& args = config.GetPositionalArgs();
    if (args.empty()) {
        return UsageError("no command specified");
    }
    
    // Needs no ledger
    if (args[0] == "commit") {
        return CommandCommit(args);
    }
    
    std::unique_ptr<db::Database> database = OpenBackend(config, dataDir);
    if (!database) {
        return EXIT_USAGE;
    }
    
    ledger::LedgerOptions options;
    options.initialAdmin = config.GetString(util::ConfigKeys::ADMIN, ledger::DEFAULT_ADMIN);
    
    auto [status, bids] = ledger::BidLedger::Open(std::move(database), options);
    if (!status.ok()) {
        std::cerr << "error: cannot load ledger: " << status.ToString() << "\n";
        return EXIT_USAGE;
    }
    
    ledger::LogAuditSink auditSink;
    bids->SetAuditSink(&auditSink);
    
    if (config.HasKey(util::ConfigKeys::HEIGHT)) {
        auto height = config.TryGetUInt(util::ConfigKeys::HEIGHT);
        if (!height) {
            return UsageError("height must be an unsigned integer");
        }
        if (!bids->SetHeight(*height)) {
            return UsageError("height " + std::to_string(*height) +
                              " is below the ledger height " +
                              std::to_string(bids->GetHeight()));
        }
    }
    
    int rc = ExecuteLedgerCommand(*bids, args);
    LOG_DEBUG(util::LogCategory::CLI) << args[0] << " finished with exit code " << rc;
    return rc;
}

} // namespace cli
} // namespace sealbid

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    int rc;
    try {
        rc = sealbid::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        rc = sealbid::cli::EXIT_USAGE;
    }
    sealbid::util::Logger::Instance().Shutdown();
    return rc;
}
