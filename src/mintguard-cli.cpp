// MINTGUARD CLI - Transaction Executor
// Copyright (c) 2024 MINTGUARD Developers
// MIT License
//
// mintguard-cli executes exactly one issuance operation per invocation
// against the persisted state in the data directory. The block height and
// the caller identity are supplied by the host on the command line; state
// is committed only if the operation succeeds.

#include <mintguard/core/types.h>
#include <mintguard/db/statedb.h>
#include <mintguard/issuance/controller.h>
#include <mintguard/issuance/ledger.h>
#include <mintguard/issuance/params.h>
#include <mintguard/util/config.h>
#include <mintguard/util/logging.h>

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mintguard {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "MINTGUARD CLI";

namespace defaults {
    constexpr const char* DATADIR = "~/.mintguard";
    constexpr const char* STATE_DIRNAME = "state";
    constexpr const char* LOG_FILENAME = "debug.log";
    constexpr const char* LOG_LEVEL = "warn";
}

/// Process exit codes
enum ExitCode {
    EXIT_OK = 0,
    EXIT_REJECTED = 1,    // the operation failed a guard
    EXIT_USAGE = 2,       // bad command line
    EXIT_ENVIRONMENT = 3, // configuration or storage failure
};

// ============================================================================
// Help
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: mintguard-cli [options] <command> [args]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -help                      Show this help message\n";
    std::cout << "  -version                   Show version information\n";
    std::cout << "  -datadir=DIR               Data directory (default: ~/.mintguard)\n";
    std::cout << "  -conf=FILE                 Config file (default: <datadir>/mintguard.conf)\n";
    std::cout << "  -regtest                   Use the regression test preset\n";
    std::cout << "  -height=N                  Current block height (required for operations)\n";
    std::cout << "  -caller=HEX                Calling identity (required for operations)\n";
    std::cout << "  -loglevel=LEVEL            Console log level (default: warn)\n";
    std::cout << "  -debug=CATEGORY            Log only this category (issuance, registry, ...)\n";
    std::cout << "\nOperations:\n";
    std::cout << "  authorize <id>             Authorize an issuer\n";
    std::cout << "  deauthorize <id>           Deauthorize an issuer\n";
    std::cout << "  sweep                      Deauthorize every expired issuer\n";
    std::cout << "  transfer <newid>           Transfer the caller's issuer rights\n";
    std::cout << "  mint <to> <amount>         Mint as the calling issuer\n";
    std::cout << "  burn <amount>              Burn from the caller's balance\n";
    std::cout << "  burnfrom <account> <amt>   Burn from an account using an allowance\n";
    std::cout << "  approve <spender> <amount> Set the caller's allowance for a spender\n";
    std::cout << "\nQueries:\n";
    std::cout << "  issuers                    List issuers\n";
    std::cout << "  expired                    List expired issuers\n";
    std::cout << "  mintfactor <id>            Current mint factor of an issuer\n";
    std::cout << "  maxmintable <id>           Largest mint request an issuer may make\n";
    std::cout << "  issuer <id>                Record of an issuer\n";
    std::cout << "  balance <id>               Ledger balance\n";
    std::cout << "  supply                     Total supply\n";
    std::cout << "\nAmounts are decimal units with up to 8 fractional digits.\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

std::optional<Identity> ParseIdentity(const std::string& str) {
    try {
        return Identity::FromHex(str);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

/// Parse "12", "-3" or "0.5" (units) into base units
std::optional<Amount> ParseAmount(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }

    size_t pos = 0;
    bool negative = false;
    if (str[0] == '-' || str[0] == '+') {
        negative = str[0] == '-';
        pos = 1;
    }

    Amount units = 0;
    Amount fraction = 0;
    int fractionDigits = 0;
    bool seenDigit = false;
    bool seenPoint = false;

    for (; pos < str.size(); ++pos) {
        char c = str[pos];
        if (c == '.' && !seenPoint) {
            seenPoint = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        seenDigit = true;
        if (seenPoint) {
            if (++fractionDigits > 8) {
                return std::nullopt;
            }
            fraction = fraction * 10 + (c - '0');
        } else {
            if (units > (MAX_SUPPLY / COIN)) {
                return std::nullopt;
            }
            units = units * 10 + (c - '0');
        }
    }
    if (!seenDigit) {
        return std::nullopt;
    }

    for (; fractionDigits < 8; ++fractionDigits) {
        fraction *= 10;
    }
    if (units > MAX_SUPPLY / COIN) {
        return std::nullopt;
    }

    Amount amount = units * COIN + fraction;
    return negative ? -amount : amount;
}

// ============================================================================
// Logging Setup
// ============================================================================

void SetupLogging(const util::ConfigManager& config, const std::filesystem::path& dataDir) {
    auto& logger = util::Logger::Instance();
    logger.ClearSinks();
    logger.SetLevel(util::LogLevel::Debug);

    util::ConsoleSink::Config consoleConfig;
    consoleConfig.level = util::LogLevelFromString(
        config.GetString(util::ConfigKeys::LOGLEVEL, defaults::LOG_LEVEL));
    logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));

    auto fileSink = std::make_shared<util::FileSink>(
        (dataDir / defaults::LOG_FILENAME).string(), util::LogLevel::Debug);
    if (fileSink->IsOpen()) {
        logger.AddSink(fileSink);
    } else {
        LOG_WARN(util::LogCategory::CLI) << "Cannot open log file " << fileSink->GetPath();
    }

    auto debugCategory = config.TryGetString(util::ConfigKeys::DEBUG);
    if (debugCategory && *debugCategory != "true" && *debugCategory != "1") {
        logger.EnableCategory(*debugCategory);
    }
}

// ============================================================================
// Command Execution
// ============================================================================

/// Everything a command handler can touch
struct ExecContext {
    issuance::IssuanceController& controller;
    issuance::TokenLedger& ledger;
    issuance::CallContext call;
    const std::vector<std::string>& args;
};

/// Outcome of a command: an error for rejected operations
struct CommandOutcome {
    issuance::IssuanceError error{issuance::IssuanceError::OK};
    std::string usageError;

    static CommandOutcome Ok() { return {}; }
    static CommandOutcome From(const issuance::IssuanceResult& r) { return {r.error, ""}; }
    static CommandOutcome Usage(const std::string& msg) {
        return {issuance::IssuanceError::OK, msg};
    }
};

using CommandHandler = std::function<CommandOutcome(ExecContext&)>;

struct CommandInfo {
    size_t numArgs;
    bool mutating;
    CommandHandler handler;
};

/// Parse the identity argument at `index`
#define MINTGUARD_ARG_IDENTITY(var, index)                                     \
    auto var = ParseIdentity(ctx.args[index]);                                 \
    if (!var) return CommandOutcome::Usage("invalid identity: " + ctx.args[index])

/// Parse the amount argument at `index`
#define MINTGUARD_ARG_AMOUNT(var, index)                                       \
    auto var = ParseAmount(ctx.args[index]);                                   \
    if (!var) return CommandOutcome::Usage("invalid amount: " + ctx.args[index])

void PrintIdentityList(const std::vector<Identity>& ids) {
    for (const auto& id : ids) {
        std::cout << id.ToHex() << "\n";
    }
}

const std::map<std::string, CommandInfo>& GetCommands() {
    static const std::map<std::string, CommandInfo> commands = {
        // ---------------------------------------------------------------- operations
        {"authorize", {1, true, [](ExecContext& ctx) {
            MINTGUARD_ARG_IDENTITY(id, 0);
            return CommandOutcome::From(ctx.controller.AuthorizeIssuer(*id, ctx.call));
        }}},
        {"deauthorize", {1, true, [](ExecContext& ctx) {
            MINTGUARD_ARG_IDENTITY(id, 0);
            return CommandOutcome::From(ctx.controller.DeauthorizeIssuer(*id, ctx.call));
        }}},
        {"sweep", {0, true, [](ExecContext& ctx) {
            auto removed = ctx.controller.DeauthorizeAllExpiredIssuers(ctx.call);
            std::cout << "removed " << removed.size() << "\n";
            return CommandOutcome::Ok();
        }}},
        {"transfer", {1, true, [](ExecContext& ctx) {
            MINTGUARD_ARG_IDENTITY(id, 0);
            return CommandOutcome::From(
                ctx.controller.TransferIssuerAuthorization(*id, ctx.call));
        }}},
        {"mint", {2, true, [](ExecContext& ctx) {
            MINTGUARD_ARG_IDENTITY(to, 0);
            MINTGUARD_ARG_AMOUNT(amount, 1);
            auto result = ctx.controller.Mint(*to, *amount, ctx.call);
            if (result) {
                std::cout << "minted " << FormatAmount(result.amount) << "\n";
            }
            return CommandOutcome::From(result);
        }}},
        {"burn", {1, true, [](ExecContext& ctx) {
            MINTGUARD_ARG_AMOUNT(amount, 0);
            auto result = ctx.controller.Burn(*amount, ctx.call);
            if (result) {
                std::cout << "burned " << FormatAmount(result.amount) << "\n";
            }
            return CommandOutcome::From(result);
        }}},
        {"burnfrom", {2, true, [](ExecContext& ctx) {
            MINTGUARD_ARG_IDENTITY(account, 0);
            MINTGUARD_ARG_AMOUNT(amount, 1);
            auto result = ctx.controller.BurnFrom(*account, *amount, ctx.call);
            if (result) {
                std::cout << "burned " << FormatAmount(result.amount) << "\n";
            }
            return CommandOutcome::From(result);
        }}},
        {"approve", {2, true, [](ExecContext& ctx) {
            MINTGUARD_ARG_IDENTITY(spender, 0);
            MINTGUARD_ARG_AMOUNT(amount, 1);
            if (*amount < 0) {
                return CommandOutcome::From(
                    issuance::IssuanceResult::Failure(issuance::IssuanceError::NonPositiveAmount));
            }
            if (!ctx.ledger.Approve(ctx.call.caller, *spender, *amount)) {
                return CommandOutcome::From(
                    issuance::IssuanceResult::Failure(issuance::IssuanceError::InvalidTarget));
            }
            std::cout << "approved " << FormatAmount(*amount) << "\n";
            return CommandOutcome::Ok();
        }}},

        // ---------------------------------------------------------------- queries
        {"issuers", {0, false, [](ExecContext& ctx) {
            PrintIdentityList(ctx.controller.GetIssuers());
            return CommandOutcome::Ok();
        }}},
        {"expired", {0, false, [](ExecContext& ctx) {
            PrintIdentityList(ctx.controller.GetExpiredIssuers(ctx.call.height));
            return CommandOutcome::Ok();
        }}},
        {"mintfactor", {1, false, [](ExecContext& ctx) {
            MINTGUARD_ARG_IDENTITY(id, 0);
            auto factor = ctx.controller.GetIssuerMintFactor(*id);
            if (!factor) {
                return CommandOutcome::From(
                    issuance::IssuanceResult::Failure(issuance::IssuanceError::NotAuthorized));
            }
            std::cout << *factor << "/" << ctx.controller.Params().nMintFactorScale << "\n";
            return CommandOutcome::Ok();
        }}},
        {"maxmintable", {1, false, [](ExecContext& ctx) {
            MINTGUARD_ARG_IDENTITY(id, 0);
            auto max = ctx.controller.GetIssuerMaxMintable(*id);
            if (!max) {
                return CommandOutcome::From(
                    issuance::IssuanceResult::Failure(issuance::IssuanceError::NotAuthorized));
            }
            std::cout << FormatAmount(*max) << "\n";
            return CommandOutcome::Ok();
        }}},
        {"issuer", {1, false, [](ExecContext& ctx) {
            MINTGUARD_ARG_IDENTITY(id, 0);
            auto record = ctx.controller.GetIssuerRecord(*id);
            if (!record) {
                return CommandOutcome::From(
                    issuance::IssuanceResult::Failure(issuance::IssuanceError::NotAuthorized));
            }
            std::cout << "position=" << record->position << "\n"
                      << "startBlock=" << record->startBlock << "\n"
                      << "expirationBlock=" << record->expirationBlock << "\n"
                      << "totalMinted=" << FormatAmount(record->totalMinted) << "\n"
                      << "mintCount=" << record->mintCount << "\n"
                      << "totalBurned=" << FormatAmount(record->totalBurned) << "\n"
                      << "burnCount=" << record->burnCount << "\n";
            return CommandOutcome::Ok();
        }}},
        {"balance", {1, false, [](ExecContext& ctx) {
            MINTGUARD_ARG_IDENTITY(id, 0);
            std::cout << FormatAmount(ctx.ledger.BalanceOf(*id)) << "\n";
            return CommandOutcome::Ok();
        }}},
        {"supply", {0, false, [](ExecContext& ctx) {
            std::cout << FormatAmount(ctx.ledger.TotalSupply()) << "\n";
            return CommandOutcome::Ok();
        }}},
    };
    return commands;
}

#undef MINTGUARD_ARG_IDENTITY
#undef MINTGUARD_ARG_AMOUNT

// ============================================================================
// Main Entry
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigManager config;

    auto cmdResult = config.ParseCommandLine(argc, argv);
    if (!cmdResult.success) {
        std::cerr << "Error: " << cmdResult.errorMessage << "\n";
        return EXIT_USAGE;
    }

    if (config.GetBool("help", false) || config.GetBool("h", false)) {
        PrintHelp();
        return EXIT_OK;
    }
    if (config.GetBool("version", false)) {
        std::cout << CLIENT_NAME << " v" << VERSION << "\n";
        return EXIT_OK;
    }

    const auto& positional = config.GetPositionalArgs();
    if (positional.empty()) {
        std::cerr << "Error: no command given (see -help)\n";
        return EXIT_USAGE;
    }

    const std::string& command = positional[0];
    const std::vector<std::string> args(positional.begin() + 1, positional.end());

    auto cmdIt = GetCommands().find(command);
    if (cmdIt == GetCommands().end()) {
        std::cerr << "Error: unknown command '" << command << "'\n";
        return EXIT_USAGE;
    }
    const CommandInfo& info = cmdIt->second;
    if (args.size() != info.numArgs) {
        std::cerr << "Error: '" << command << "' takes " << info.numArgs << " argument(s)\n";
        return EXIT_USAGE;
    }

    // Data directory and config file
    std::filesystem::path dataDir = config.GetPath(util::ConfigKeys::DATADIR, defaults::DATADIR);
    if (config.GetBool(util::ConfigKeys::REGTEST, false)) {
        dataDir /= "regtest";
    }

    std::error_code ec;
    std::filesystem::create_directories(dataDir, ec);
    if (ec) {
        std::cerr << "Error: cannot create data directory " << dataDir << ": " << ec.message() << "\n";
        return EXIT_ENVIRONMENT;
    }

    auto confPath = config.TryGetString(util::ConfigKeys::CONF);
    std::filesystem::path confFile = confPath
        ? std::filesystem::path(util::ConfigManager::ExpandTilde(*confPath))
        : dataDir / util::DEFAULT_CONFIG_FILENAME;
    if (confPath || std::filesystem::exists(confFile)) {
        auto fileResult = config.ParseFile(confFile.string(), false);
        if (!fileResult.success) {
            std::cerr << "Error: " << fileResult.errorFile << ":" << fileResult.errorLine
                      << ": " << fileResult.errorMessage << "\n";
            return EXIT_ENVIRONMENT;
        }
    }

    SetupLogging(config, dataDir);

    issuance::IssuanceParams params;
    try {
        params = issuance::IssuanceParams::FromConfig(config);
    } catch (const std::invalid_argument& e) {
        LOG_ERROR(util::LogCategory::CONFIG) << "Invalid configuration: " << e.what();
        std::cerr << "Error: invalid configuration: " << e.what() << "\n";
        return EXIT_ENVIRONMENT;
    }
    std::string paramError = params.Validate();
    if (!paramError.empty()) {
        LOG_ERROR(util::LogCategory::CONFIG) << "Invalid parameters: " << paramError;
        std::cerr << "Error: invalid parameters: " << paramError << "\n";
        return EXIT_ENVIRONMENT;
    }

    // Load state
    std::unique_ptr<db::IssuanceStateDB> stateDb;
    try {
        stateDb = std::make_unique<db::IssuanceStateDB>(dataDir / defaults::STATE_DIRNAME);
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_ENVIRONMENT;
    }

    issuance::TokenLedger ledger;
    issuance::IssuanceController controller(params, ledger);
    BlockHeight lastHeight = db::NO_HEIGHT;

    db::Status loadStatus = stateDb->Load(controller.Registry(), ledger, lastHeight);
    if (!loadStatus.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Failed to load state: " << loadStatus.ToString();
        std::cerr << "Error: failed to load state: " << loadStatus.ToString() << "\n";
        return EXIT_ENVIRONMENT;
    }

    // Block height and caller
    issuance::CallContext call;
    auto heightArg = config.TryGetString(util::ConfigKeys::HEIGHT);
    if (heightArg) {
        auto height = util::ConfigManager::ParseInt(*heightArg);
        if (!height || *height < 0) {
            std::cerr << "Error: invalid height: " << *heightArg << "\n";
            return EXIT_USAGE;
        }
        call.height = *height;
    } else if (info.mutating) {
        std::cerr << "Error: '" << command << "' requires -height\n";
        return EXIT_USAGE;
    } else {
        call.height = lastHeight == db::NO_HEIGHT ? 0 : lastHeight;
    }

    auto callerArg = config.TryGetString(util::ConfigKeys::CALLER);
    if (callerArg) {
        auto caller = ParseIdentity(*callerArg);
        if (!caller) {
            std::cerr << "Error: invalid caller: " << *callerArg << "\n";
            return EXIT_USAGE;
        }
        call.caller = *caller;
    } else if (info.mutating) {
        std::cerr << "Error: '" << command << "' requires -caller\n";
        return EXIT_USAGE;
    }

    if (info.mutating && call.height < lastHeight) {
        auto err = issuance::IssuanceError::StaleBlockHeight;
        LOG_WARN(util::LogCategory::CLI) << "Refusing height " << call.height
            << ", last executed height is " << lastHeight;
        std::cerr << "error: " << issuance::IssuanceErrorName(err) << ": "
                  << issuance::IssuanceErrorString(err) << " (" << lastHeight << ")\n";
        return EXIT_REJECTED;
    }

    // Execute
    const size_t eventOffset = controller.Events().Size();
    ExecContext ctx{controller, ledger, call, args};
    CommandOutcome outcome = info.handler(ctx);

    if (!outcome.usageError.empty()) {
        std::cerr << "Error: " << outcome.usageError << "\n";
        return EXIT_USAGE;
    }
    if (outcome.error != issuance::IssuanceError::OK) {
        std::cerr << "error: " << issuance::IssuanceErrorName(outcome.error) << ": "
                  << issuance::IssuanceErrorString(outcome.error) << "\n";
        return EXIT_REJECTED;
    }

    if (info.mutating) {
        db::Status commitStatus = stateDb->Commit(controller.Registry(), ledger, call.height);
        if (!commitStatus.ok()) {
            std::cerr << "Error: failed to commit state: " << commitStatus.ToString() << "\n";
            return EXIT_ENVIRONMENT;
        }
        for (const auto& entry : controller.Events().Since(eventOffset)) {
            std::cout << "event: " << issuance::FormatEvent(entry.event) << "\n";
        }
    }

    util::Logger::Instance().Flush();
    return EXIT_OK;
}

} // namespace cli
} // namespace mintguard

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return mintguard::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return mintguard::cli::EXIT_ENVIRONMENT;
    }
}
