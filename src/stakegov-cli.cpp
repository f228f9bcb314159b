// STAKEGOV CLI - Command Line Interface
// Copyright (c) 2024 STAKEGOV Developers
// MIT License
//
// stakegov-cli drives a governance engine whose state lives in a LevelDB
// database under the data directory. Each invocation loads the state,
// applies at most one operation, and saves the state back if the
// operation succeeded.

#include "stakegov/db/database.h"
#include "stakegov/governance/collaborators.h"
#include "stakegov/governance/engine.h"
#include "stakegov/governance/execution.h"
#include "stakegov/governance/params.h"
#include "stakegov/governance/store.h"
#include "stakegov/util/config.h"
#include "stakegov/util/logging.h"

#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace stakegov {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "STAKEGOV CLI";

namespace defaults {
    constexpr const char* LOG_FILENAME = "debug.log";
    constexpr const char* STATE_DIRNAME = "state";
    constexpr const char* LOG_LEVEL = "info";
}

/// Process exit codes
enum ExitCode {
    EXIT_OK = 0,
    EXIT_OPERATION_FAILED = 1,
    EXIT_USAGE = 2,
};

// ============================================================================
// Invocation Context
// ============================================================================

struct Context {
    util::ConfigManager config;
    governance::GovernanceParams params;
    std::string dataDir;

    std::unique_ptr<db::Database> database;
    governance::ManualClock clock;
    governance::BalanceCustody custody;
    std::unique_ptr<governance::GovernanceEngine> engine;

    std::optional<Identity> caller;

    /// Set when the command changed state that must be written back
    bool dirty{false};
};

using Args = std::vector<std::string>;

/// Thrown for malformed arguments; maps to EXIT_USAGE
struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// ============================================================================
// Help Text
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: stakegov-cli [options] <command> [args]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -help                      Show this help message\n";
    std::cout << "  -version                   Show version information\n";
    std::cout << "  -datadir=DIR               Data directory (default: ~/.stakegov)\n";
    std::cout << "  -conf=FILE                 Config file (default: <datadir>/stakegov.conf)\n";
    std::cout << "  -caller=ID                 Calling identity: 40 hex chars or a label\n";
    std::cout << "  -height=N                  Advance the clock to block height N first\n";
    std::cout << "  -loglevel=LEVEL            trace, debug, info, warn, error, off\n";
    std::cout << "  -printtoconsole            Also log to stderr\n";
    std::cout << "\nOperations (need -caller unless noted):\n";
    std::cout << "  fund <id> <amount>         Credit external balance (no caller needed)\n";
    std::cout << "  stake <amount>             Lock value for voting weight\n";
    std::cout << "  propose <title> <description> [duration]\n";
    std::cout << "  vote <proposal> <yes|no>\n";
    std::cout << "  execute <proposal>\n";
    std::cout << "\nQueries:\n";
    std::cout << "  balance <id>               External balance\n";
    std::cout << "  stakeof <id>               Committed stake\n";
    std::cout << "  proposal <proposal>        Proposal record\n";
    std::cout << "  voteof <proposal> <id>     Vote record\n";
    std::cout << "  votes <proposal>           All votes on a proposal\n";
    std::cout << "  totalstaked\n";
    std::cout << "  executable <proposal>\n";
    std::cout << "  outcome <proposal>         voting, passed, failed or executed\n";
    std::cout << "  list [creator]             All proposals, optionally by creator\n";
    std::cout << "  statehash\n";
    std::cout << "  height\n";
    std::cout << "\nExit status: 0 success, 1 operation rejected, 2 usage or storage error\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 STAKEGOV Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

/// 40 hex characters are taken literally, anything else is a label
Identity ParseIdentity(const std::string& arg) {
    if (arg.empty()) {
        throw UsageError("empty identity");
    }
    if (arg.size() == Identity::SIZE * 2) {
        try {
            return Identity::FromHex(arg);
        } catch (const std::invalid_argument&) {
            // Fall through to label
        }
    }
    return Identity::FromLabel(arg);
}

int64_t ParseInteger(const std::string& arg, const char* what) {
    auto value = util::ConfigManager::ParseInt(arg);
    if (!value) {
        throw UsageError(std::string("invalid ") + what + ": '" + arg + "'");
    }
    return *value;
}

governance::ProposalId ParseProposalId(const std::string& arg) {
    int64_t id = ParseInteger(arg, "proposal id");
    if (id < 0) {
        throw UsageError("invalid proposal id: '" + arg + "'");
    }
    return static_cast<governance::ProposalId>(id);
}

bool ParseDirection(const std::string& arg) {
    auto value = util::ConfigManager::ParseBool(arg);
    if (!value) {
        throw UsageError("vote direction must be yes or no, got '" + arg + "'");
    }
    return *value;
}

void RequireArgs(const Args& args, size_t min, size_t max, const char* usage) {
    if (args.size() < min || args.size() > max) {
        throw UsageError(std::string("usage: stakegov-cli ") + usage);
    }
}

const Identity& RequireCaller(const Context& ctx) {
    if (!ctx.caller) {
        throw UsageError("this command needs -caller=<id>");
    }
    return *ctx.caller;
}

// ============================================================================
// Output
// ============================================================================

void PrintProposal(const governance::ProposalRecord& p, Height now) {
    std::cout << "id: " << p.id << "\n"
              << "creator: " << p.creator.ToHex() << "\n"
              << "title: " << p.title << "\n"
              << "description: " << p.description << "\n"
              << "start: " << p.startTime << "\n"
              << "end: " << p.endTime << "\n"
              << "status: " << governance::ProposalStatusToString(p.status) << "\n"
              << "outcome: "
              << governance::ProposalOutcomeToString(governance::EvaluateOutcome(p, now)) << "\n"
              << "yes: " << p.yesWeight << "\n"
              << "no: " << p.noWeight << "\n"
              << "quorum: " << p.minVotesRequired << "\n"
              << "executed: " << (p.executed ? "true" : "false") << "\n";
}

void PrintVote(const governance::VoteRecord& v) {
    std::cout << v.proposalId << " " << v.voter.ToHex() << " "
              << (v.support ? "yes" : "no") << " " << v.weight << "\n";
}

int ReportFailure(governance::GovernanceError error) {
    std::cerr << "error: " << governance::GovernanceErrorToString(error)
              << " (code " << governance::GovernanceErrorCode(error) << ")\n";
    return EXIT_OPERATION_FAILED;
}

// ============================================================================
// Commands
// ============================================================================

int CmdFund(Context& ctx, const Args& args) {
    RequireArgs(args, 2, 2, "fund <id> <amount>");
    Identity who = ParseIdentity(args[0]);
    Amount amount = ParseInteger(args[1], "amount");
    if (!ctx.custody.Credit(who, amount)) {
        return ReportFailure(governance::GovernanceError::InvalidAmount);
    }
    LOG_INFO(util::LogCategory::CLI) << "funded " << who.ToHex() << " with " << amount;
    std::cout << ctx.custody.GetBalance(who) << "\n";
    ctx.dirty = true;
    return EXIT_OK;
}

int CmdBalance(Context& ctx, const Args& args) {
    RequireArgs(args, 1, 1, "balance <id>");
    std::cout << ctx.custody.GetBalance(ParseIdentity(args[0])) << "\n";
    return EXIT_OK;
}

int CmdStake(Context& ctx, const Args& args) {
    RequireArgs(args, 1, 1, "stake <amount>");
    const Identity& caller = RequireCaller(ctx);
    auto result = ctx.engine->Stake(caller, ParseInteger(args[0], "amount"));
    if (!result.ok()) {
        return ReportFailure(result.error);
    }
    std::cout << result.value << "\n";
    ctx.dirty = true;
    return EXIT_OK;
}

int CmdPropose(Context& ctx, const Args& args) {
    RequireArgs(args, 2, 3, "propose <title> <description> [duration]");
    const Identity& caller = RequireCaller(ctx);
    Height duration = args.size() == 3 ? ParseInteger(args[2], "duration")
                                       : ctx.params.defaultDuration;
    auto result = ctx.engine->CreateProposal(caller, args[0], args[1], duration);
    if (!result.ok()) {
        return ReportFailure(result.error);
    }
    std::cout << result.value << "\n";
    ctx.dirty = true;
    return EXIT_OK;
}

int CmdVote(Context& ctx, const Args& args) {
    RequireArgs(args, 2, 2, "vote <proposal> <yes|no>");
    const Identity& caller = RequireCaller(ctx);
    auto result = ctx.engine->Vote(caller, ParseProposalId(args[0]), ParseDirection(args[1]));
    if (!result.ok()) {
        return ReportFailure(result.error);
    }
    std::cout << "ok\n";
    ctx.dirty = true;
    return EXIT_OK;
}

int CmdExecute(Context& ctx, const Args& args) {
    RequireArgs(args, 1, 1, "execute <proposal>");
    const Identity& caller = RequireCaller(ctx);
    auto result = ctx.engine->ExecuteProposal(caller, ParseProposalId(args[0]));
    if (!result.ok()) {
        return ReportFailure(result.error);
    }
    std::cout << "ok\n";
    ctx.dirty = true;
    return EXIT_OK;
}

int CmdProposal(Context& ctx, const Args& args) {
    RequireArgs(args, 1, 1, "proposal <proposal>");
    auto proposal = ctx.engine->GetProposal(ParseProposalId(args[0]));
    if (!proposal) {
        return ReportFailure(governance::GovernanceError::ProposalNotFound);
    }
    PrintProposal(*proposal, ctx.engine->Now());
    return EXIT_OK;
}

int CmdStakeOf(Context& ctx, const Args& args) {
    RequireArgs(args, 1, 1, "stakeof <id>");
    std::cout << ctx.engine->GetStake(ParseIdentity(args[0])) << "\n";
    return EXIT_OK;
}

int CmdVoteOf(Context& ctx, const Args& args) {
    RequireArgs(args, 2, 2, "voteof <proposal> <id>");
    auto vote = ctx.engine->GetVote(ParseProposalId(args[0]), ParseIdentity(args[1]));
    if (!vote) {
        std::cout << "none\n";
        return EXIT_OK;
    }
    PrintVote(*vote);
    return EXIT_OK;
}

int CmdVotes(Context& ctx, const Args& args) {
    RequireArgs(args, 1, 1, "votes <proposal>");
    for (const auto& vote : ctx.engine->GetVotes(ParseProposalId(args[0]))) {
        PrintVote(vote);
    }
    return EXIT_OK;
}

int CmdTotalStaked(Context& ctx, const Args& args) {
    RequireArgs(args, 0, 0, "totalstaked");
    std::cout << ctx.engine->GetTotalStaked() << "\n";
    return EXIT_OK;
}

int CmdExecutable(Context& ctx, const Args& args) {
    RequireArgs(args, 1, 1, "executable <proposal>");
    std::cout << (ctx.engine->IsExecutable(ParseProposalId(args[0])) ? "true" : "false") << "\n";
    return EXIT_OK;
}

int CmdOutcome(Context& ctx, const Args& args) {
    RequireArgs(args, 1, 1, "outcome <proposal>");
    auto outcome = ctx.engine->EvaluateOutcome(ParseProposalId(args[0]));
    if (!outcome) {
        return ReportFailure(governance::GovernanceError::ProposalNotFound);
    }
    std::cout << governance::ProposalOutcomeToString(*outcome) << "\n";
    return EXIT_OK;
}

int CmdList(Context& ctx, const Args& args) {
    RequireArgs(args, 0, 1, "list [creator]");
    auto proposals = args.empty() ? ctx.engine->ListProposals()
                                  : ctx.engine->ListProposalsByCreator(ParseIdentity(args[0]));
    Height now = ctx.engine->Now();
    for (const auto& p : proposals) {
        std::cout << p.id << " "
                  << governance::ProposalOutcomeToString(governance::EvaluateOutcome(p, now))
                  << " yes=" << p.yesWeight << " no=" << p.noWeight
                  << " quorum=" << p.minVotesRequired
                  << " end=" << p.endTime
                  << " " << p.title << "\n";
    }
    return EXIT_OK;
}

int CmdStateHash(Context& ctx, const Args& args) {
    RequireArgs(args, 0, 0, "statehash");
    std::cout << ctx.engine->StateHash().ToHex() << "\n";
    return EXIT_OK;
}

int CmdHeight(Context& ctx, const Args& args) {
    RequireArgs(args, 0, 0, "height");
    std::cout << ctx.clock.Now() << "\n";
    return EXIT_OK;
}

using CommandFn = std::function<int(Context&, const Args&)>;

const std::map<std::string, CommandFn>& GetCommands() {
    static const std::map<std::string, CommandFn> commands = {
        {"fund", CmdFund},
        {"balance", CmdBalance},
        {"stake", CmdStake},
        {"propose", CmdPropose},
        {"vote", CmdVote},
        {"execute", CmdExecute},
        {"proposal", CmdProposal},
        {"stakeof", CmdStakeOf},
        {"voteof", CmdVoteOf},
        {"votes", CmdVotes},
        {"totalstaked", CmdTotalStaked},
        {"executable", CmdExecutable},
        {"outcome", CmdOutcome},
        {"list", CmdList},
        {"statehash", CmdStateHash},
        {"height", CmdHeight},
    };
    return commands;
}

// ============================================================================
// Initialization
// ============================================================================

bool SetupLogging(const Context& ctx) {
    std::string levelName = ctx.config.GetString(util::ConfigKeys::LOGLEVEL, defaults::LOG_LEVEL);
    auto level = util::ParseLogLevel(levelName);
    if (!level) {
        std::cerr << "Error: unknown log level '" << levelName << "'\n";
        return false;
    }

    auto& logger = util::Logger::Instance();
    logger.ClearSinks();
    logger.SetLevel(*level);

    util::FileSink::Config fileConfig;
    fileConfig.path = (std::filesystem::path(ctx.dataDir) / defaults::LOG_FILENAME).string();
    fileConfig.level = *level;
    auto fileSink = std::make_shared<util::FileSink>(fileConfig);
    if (fileSink->IsOpen()) {
        logger.AddSink(fileSink);
    }

    if (ctx.config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, false)) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.useStderr = true;
        consoleConfig.level = *level;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }
    return true;
}

bool LoadConfiguration(Context& ctx) {
    ctx.dataDir = ctx.config.GetPath(util::ConfigKeys::DATADIR,
                                     util::ConfigManager::GetDefaultDataDir());
    if (ctx.dataDir.empty()) {
        std::cerr << "Error: cannot determine data directory, pass -datadir\n";
        return false;
    }

    std::error_code ec;
    std::filesystem::create_directories(ctx.dataDir, ec);
    if (ec) {
        std::cerr << "Error: cannot create data directory " << ctx.dataDir
                  << ": " << ec.message() << "\n";
        return false;
    }

    bool explicitConf = ctx.config.HasKey(util::ConfigKeys::CONF);
    std::string confPath = ctx.config.GetPath(
        util::ConfigKeys::CONF,
        (std::filesystem::path(ctx.dataDir) / util::DEFAULT_CONFIG_FILENAME).string());

    if (explicitConf || std::filesystem::exists(confPath)) {
        auto result = ctx.config.ParseFile(confPath);
        if (!result.success) {
            std::cerr << "Error reading config: " << result.ToString() << "\n";
            return false;
        }
    }

    std::string error;
    if (!governance::GovernanceParams::FromConfig(ctx.config, ctx.params, error)) {
        std::cerr << "Error: " << error << "\n";
        return false;
    }

    if (auto caller = ctx.config.TryGetString(util::ConfigKeys::CALLER)) {
        ctx.caller = ParseIdentity(*caller);
    }
    return true;
}

bool OpenState(Context& ctx) {
    std::filesystem::path statePath = std::filesystem::path(ctx.dataDir) / defaults::STATE_DIRNAME;
    auto [status, database] = db::OpenDatabase(statePath);
    if (!status.ok()) {
        std::cerr << "Error: cannot open state database: " << status.ToString() << "\n";
        return false;
    }
    ctx.database = std::move(database);

    ctx.engine = std::make_unique<governance::GovernanceEngine>(ctx.params, ctx.clock, ctx.custody);

    Height height = 0;
    governance::GovernanceStore store(*ctx.database);
    status = store.Load(*ctx.engine, ctx.custody, height);
    if (!status.ok()) {
        std::cerr << "Error: cannot load state: " << status.ToString() << "\n";
        return false;
    }
    ctx.clock.SetHeight(height);

    if (auto raw = ctx.config.TryGetString(util::ConfigKeys::HEIGHT)) {
        auto target = util::ConfigManager::ParseInt(*raw);
        if (!target || *target < 0) {
            std::cerr << "Error: invalid height '" << *raw << "'\n";
            return false;
        }
        if (!ctx.clock.SetHeight(*target)) {
            std::cerr << "Error: height " << *target << " is behind current height "
                      << ctx.clock.Now() << "\n";
            return false;
        }
        if (*target != height) {
            LOG_INFO(util::LogCategory::CLI) << "clock advanced from " << height
                                             << " to " << *target;
            ctx.dirty = true;
        }
    }
    return true;
}

// ============================================================================
// Main
// ============================================================================

int AppMain(int argc, char* argv[]) {
    Context ctx;
    Args positional;

    auto parsed = ctx.config.ParseCommandLine(argc, argv, &positional);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.ToString() << "\n";
        return EXIT_USAGE;
    }

    if (ctx.config.GetBool("help", false) || ctx.config.GetBool("h", false)) {
        PrintHelp();
        return EXIT_OK;
    }
    if (ctx.config.GetBool("version", false)) {
        PrintVersion();
        return EXIT_OK;
    }

    if (positional.empty()) {
        std::cerr << "Error: no command given. Use 'stakegov-cli -help' for usage.\n";
        return EXIT_USAGE;
    }

    const std::string command = positional.front();
    Args args(positional.begin() + 1, positional.end());

    const auto& commands = GetCommands();
    auto it = commands.find(command);
    if (it == commands.end()) {
        std::cerr << "Error: unknown command '" << command << "'\n";
        return EXIT_USAGE;
    }

    try {
        if (!LoadConfiguration(ctx) || !SetupLogging(ctx) || !OpenState(ctx)) {
            return EXIT_USAGE;
        }

        int rc = it->second(ctx, args);
        if (rc != EXIT_OK) {
            return rc;
        }
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    }

    if (ctx.dirty) {
        governance::GovernanceStore store(*ctx.database);
        db::Status status = store.Save(*ctx.engine, ctx.custody, ctx.clock.Now());
        if (!status.ok()) {
            std::cerr << "Error: cannot save state: " << status.ToString() << "\n";
            return EXIT_USAGE;
        }
    }
    return EXIT_OK;
}

} // namespace cli
} // namespace stakegov

int main(int argc, char* argv[]) {
    try {
        return stakegov::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return stakegov::cli::EXIT_USAGE;
    }
}
