// Copyright 2018 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/CommandLine.h"
#include "invariant/InvariantManager.h"
#include "ledger/PoolLedgerTxn.h"
#include "main/Config.h"
#include "main/CpammVersion.h"
#include "pool/ConstantProductCurve.h"
#include "pool/PoolOperations.h"
#include "pool/PoolTransactionFrame.h"
#include "util/Logging.h"

#ifdef BUILD_TESTS
#include "test/test.h"
#endif

#include <clara.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <functional>
#include <iostream>
#include <optional>

namespace cpamm
{

void
writeWithTextFlow(std::ostream& os, std::string const& text)
{
    size_t consoleWidth = CLARA_TEXTFLOW_CONFIG_CONSOLE_WIDTH;
    os << clara::TextFlow::Column(text).width(consoleWidth) << "\n\n";
}

namespace
{

class CommandLine
{
  public:
    struct ConfigOption
    {
        using Common = std::pair<std::string, bool>;
        static const std::vector<Common> COMMON_OPTIONS;

        LogLevel mLogLevel{LogLevel::LVL_INFO};
        std::string mConfigFile;

        Config getConfig() const;
    };

    class Command
    {
      public:
        using RunFunc = std::function<int(CommandLineArgs const& args)>;

        Command(std::string const& name, std::string const& description,
                RunFunc const& runFunc);
        int run(CommandLineArgs const& args) const;
        std::string name() const;
        std::string description() const;

      private:
        std::string mName;
        std::string mDescription;
        RunFunc mRunFunc;
    };

    explicit CommandLine(std::vector<Command> const& commands);

    using AdjustedCommandLine =
        std::pair<std::string, std::vector<std::string>>;
    AdjustedCommandLine adjustCommandLine(clara::detail::Args const& args);
    std::optional<Command> selectCommand(std::string const& commandName);
    void writeToStream(std::string const& exeName, std::ostream& os) const;

  private:
    std::vector<Command> mCommands;
};

const std::vector<std::pair<std::string, bool>>
    CommandLine::ConfigOption::COMMON_OPTIONS{
        {"--conf", true}, {"--ll", true}, {"--help", false}};

class ParserWithValidation
{
  public:
    ParserWithValidation(
        clara::Parser parser,
        std::function<std::string()> isValid = [] { return std::string{}; })
    {
        mParser = parser;
        mIsValid = isValid;
    }

    ParserWithValidation(
        clara::Opt opt,
        std::function<std::string()> isValid = [] { return std::string{}; })
    {
        mParser = clara::Parser{} | opt;
        mIsValid = isValid;
    }

    const clara::Parser&
    parser() const
    {
        return mParser;
    }

    std::string
    validate() const
    {
        return mIsValid();
    }

  private:
    clara::Parser mParser;
    std::function<std::string()> mIsValid;
};

clara::Opt
logLevelParser(LogLevel& value)
{
    return clara::Opt{
        [&](std::string const& arg) { value = Logging::getLLfromString(arg); },
        "LEVEL"}["--ll"]("set the log level");
}

clara::Parser
configurationParser(CommandLine::ConfigOption& configOption)
{
    return logLevelParser(configOption.mLogLevel) |
           clara::Opt{configOption.mConfigFile,
                      "FILE-NAME"}["--conf"](fmt::format(
               FMT_STRING("specify a config file ('{}' for STDIN, default "
                          "'cpamm.cfg')"),
               Config::STDIN_SPECIAL_NAME));
}

// the pool a quote-* command evaluates against
ParserWithValidation
snapshotParser(PoolSnapshot& snapshot)
{
    return {clara::Opt{snapshot.reserveX, "AMOUNT"}["--reserve-x"](
                "reserve of token X") |
                clara::Opt{snapshot.reserveY, "AMOUNT"}["--reserve-y"](
                    "reserve of token Y") |
                clara::Opt{snapshot.totalPoolShares, "AMOUNT"}["--shares"](
                    "outstanding pool shares") |
                clara::Opt{snapshot.feeBps, "BPS"}["--fee-bps"](
                    "swap fee in basis points") |
                clara::Opt{snapshot.shareDecimals,
                           "DECIMALS"}["--share-decimals"](
                    "decimals of fixed-point prices") |
                clara::Opt{snapshot.locked}["--locked"]("pool is locked"),
            [&snapshot] {
                if (snapshot.feeBps > FEE_BPS_DENOMINATOR)
                {
                    return std::string{"--fee-bps must be at most 10000"};
                }
                return std::string{};
            }};
}

clara::Opt
assetParser(std::optional<PoolAsset>& asset, std::string const& option,
            std::string const& description)
{
    return clara::Opt{
        [&](std::string const& arg) { asset = poolAssetFromString(arg); },
        "X|Y"}[option](description);
}

std::function<std::string()>
requiredAsset(std::optional<PoolAsset> const& asset, std::string const& name)
{
    return [&asset, name] {
        if (!asset)
        {
            return name + " argument is required";
        }
        return std::string{};
    };
}

int
runWithHelp(CommandLineArgs const& args,
            std::vector<ParserWithValidation> parsers, std::function<int()> f)
{
    auto isHelp = false;
    auto parser = clara::Parser{} | clara::Help(isHelp);
    for (auto const& p : parsers)
        parser |= p.parser();
    auto errorMessage =
        parser
            .parse(args.mCommandName,
                   clara::detail::TokenStream{std::begin(args.mArgs),
                                              std::end(args.mArgs)})
            .errorMessage();
    if (errorMessage.empty())
    {
        for (auto const& p : parsers)
        {
            errorMessage = p.validate();
            if (!errorMessage.empty())
            {
                break;
            }
        }
    }

    if (!errorMessage.empty())
    {
        writeWithTextFlow(std::cerr, errorMessage);
        writeWithTextFlow(std::cerr, args.mCommandDescription);
        parser.writeToStream(std::cerr);
        return 1;
    }

    if (isHelp)
    {
        writeWithTextFlow(std::cout, args.mCommandDescription);
        parser.writeToStream(std::cout);
        return 0;
    }

    return f();
}

CommandLine::Command::Command(std::string const& name,
                              std::string const& description,
                              RunFunc const& runFunc)
    : mName{name}, mDescription{description}, mRunFunc{runFunc}
{
}

int
CommandLine::Command::run(CommandLineArgs const& args) const
{
    return mRunFunc(args);
}

std::string
CommandLine::Command::name() const
{
    return mName;
}

std::string
CommandLine::Command::description() const
{
    return mDescription;
}

Config
CommandLine::ConfigOption::getConfig() const
{
    Config config;
    auto configFile =
        mConfigFile.empty() ? std::string{"cpamm.cfg"} : mConfigFile;

    Logging::setLogLevel(mLogLevel, nullptr);
    LOG_INFO(DEFAULT_LOG, "Config from {}", configFile);
    config.load(configFile);

    if (!config.LOG_FILE_PATH.empty())
    {
        Logging::setLoggingToFile(config.LOG_FILE_PATH);
    }
    if (config.LOG_COLOR)
    {
        Logging::setLoggingColor(true);
    }
    Logging::setLogLevel(mLogLevel, nullptr);
    return config;
}

CommandLine::CommandLine(std::vector<Command> const& commands)
    : mCommands{commands}
{
    mCommands.push_back(Command{"help", "display list of available commands",
                                [this](CommandLineArgs const& args) {
                                    writeToStream(args.mExeName, std::cout);
                                    return 0;
                                }});

    std::sort(
        std::begin(mCommands), std::end(mCommands),
        [](Command const& x, Command const& y) { return x.name() < y.name(); });
}

CommandLine::AdjustedCommandLine
CommandLine::adjustCommandLine(clara::detail::Args const& args)
{
    auto tokens = clara::detail::TokenStream{args};
    auto command = std::string{};
    auto remainingTokens = std::vector<std::string>{};
    auto found = false;
    auto optionValue = false;

    while (tokens)
    {
        auto token = *tokens;
        if (found || optionValue)
        {
            remainingTokens.push_back(token.token);
            optionValue = false;
        }
        else if (token.type == clara::detail::TokenType::Argument)
        {
            command = token.token;
            found = true;
        }
        else // clara::detail::TokenType::Option
        {
            auto commonIt =
                std::find_if(std::begin(ConfigOption::COMMON_OPTIONS),
                             std::end(ConfigOption::COMMON_OPTIONS),
                             [&](ConfigOption::Common const& option) {
                                 return token.token == option.first;
                             });
            if (commonIt != std::end(ConfigOption::COMMON_OPTIONS))
            {
                remainingTokens.push_back(token.token);
                optionValue = commonIt->second;
            }
            else
            {
                return {}; // unknown option before the command, show help
            }
        }
        ++tokens;
    }

    return CommandLine::AdjustedCommandLine{command, remainingTokens};
}

std::optional<CommandLine::Command>
CommandLine::selectCommand(std::string const& commandName)
{
    auto command = std::find_if(
        std::begin(mCommands), std::end(mCommands),
        [&](Command const& command) { return command.name() == commandName; });
    if (command != std::end(mCommands))
    {
        return std::make_optional<Command>(*command);
    }

    command = std::find_if(
        std::begin(mCommands), std::end(mCommands),
        [&](Command const& command) { return command.name() == "help"; });
    if (command != std::end(mCommands))
    {
        return std::make_optional<Command>(*command);
    }
    return std::nullopt;
}

void
CommandLine::writeToStream(std::string const& exeName, std::ostream& os) const
{
    os << "usage:\n"
       << "  " << exeName << " "
       << "COMMAND";
    os << "\n\nwhere COMMAND is one of following:" << std::endl;

    size_t consoleWidth = CLARA_TEXTFLOW_CONFIG_CONSOLE_WIDTH;
    size_t commandWidth = 0;
    for (auto const& command : mCommands)
        commandWidth = std::max(commandWidth, command.name().size() + 2);

    commandWidth = std::min(commandWidth, consoleWidth / 2);

    for (auto const& command : mCommands)
    {
        auto row = clara::TextFlow::Column(command.name())
                       .width(commandWidth)
                       .indent(2) +
                   clara::TextFlow::Spacer(4) +
                   clara::TextFlow::Column(command.description())
                       .width(consoleWidth - 7 - commandWidth);
        os << row << std::endl;
    }
}
}

int
run(CommandLineArgs const& args)
{
    CommandLine::ConfigOption configOption;

    return runWithHelp(args, {configurationParser(configOption)}, [&] {
        auto cfg = configOption.getConfig();

        PoolLedgerTxnRoot root(cfg.POOL_FEE_BPS, cfg.POOL_SHARE_DECIMALS,
                               cfg.POOL_LOCKED);
        for (auto const& account : cfg.ACCOUNTS)
        {
            root.createAccount(account.mName, account.mBalanceX,
                               account.mBalanceY);
        }

        auto invariantManager = InvariantManager::create();
        registerPoolInvariants(*invariantManager);
        for (auto const& pattern : cfg.INVARIANT_CHECKS)
        {
            invariantManager->enableInvariant(pattern);
        }

        size_t failed = 0;
        for (size_t i = 0; i < cfg.OPERATIONS.size(); ++i)
        {
            auto const& oc = cfg.OPERATIONS[i];
            PoolTransactionFrame tx(oc.mSource, {oc.mOperation});
            PoolTransactionResult res;
            if (!tx.apply(root, *invariantManager, res))
            {
                ++failed;
            }

            std::cout << fmt::format(FMT_STRING("{}: {} {}"), i, oc.mSource,
                                     toString(res.code));
            for (auto const& opRes : res.results)
            {
                std::cout << " [" << toString(opRes) << "]";
            }
            std::cout << std::endl;
        }

        std::cout << "pool: " << toString(root.getSnapshot()) << std::endl;
        for (auto const& kv : root.getState().accounts)
        {
            std::cout << fmt::format(FMT_STRING("account {}: X={} Y={} "
                                                "shares={}"),
                                     kv.first, kv.second.balanceX,
                                     kv.second.balanceY, kv.second.poolShares)
                      << std::endl;
        }
        CLOG_INFO(Main, "Applied {} operations, {} failed",
                  cfg.OPERATIONS.size(), failed);
        return 0;
    });
}

int
printQuote(PoolResultCode code, std::string const& success)
{
    if (code != POOL_SUCCESS)
    {
        std::cout << toString(code) << std::endl;
        return 1;
    }
    std::cout << success << std::endl;
    return 0;
}

int
runQuoteDeposit(CommandLineArgs const& args)
{
    LogLevel logLevel{LogLevel::LVL_WARNING};
    PoolSnapshot snapshot;
    DepositRequest request;

    return runWithHelp(
        args,
        {logLevelParser(logLevel), snapshotParser(snapshot),
         clara::Opt{request.shareAmount, "AMOUNT"}["--share-amount"](
             "pool shares to mint"),
         clara::Opt{request.maxAmountX, "AMOUNT"}["--max-x"](
             "most X to deposit"),
         clara::Opt{request.maxAmountY, "AMOUNT"}["--max-y"](
             "most Y to deposit")},
        [&] {
            Logging::setLogLevel(logLevel, nullptr);
            CurveResult amounts;
            auto code = deposit(snapshot, request, amounts);
            return printQuote(code,
                              fmt::format(FMT_STRING("x={} y={} shares={}"),
                                          amounts.amountX, amounts.amountY,
                                          request.shareAmount));
        });
}

int
runQuoteWithdraw(CommandLineArgs const& args)
{
    LogLevel logLevel{LogLevel::LVL_WARNING};
    PoolSnapshot snapshot;
    WithdrawRequest request;

    return runWithHelp(
        args,
        {logLevelParser(logLevel), snapshotParser(snapshot),
         clara::Opt{request.shareAmount, "AMOUNT"}["--share-amount"](
             "pool shares to burn"),
         clara::Opt{request.minAmountX, "AMOUNT"}["--min-x"](
             "least X to receive"),
         clara::Opt{request.minAmountY, "AMOUNT"}["--min-y"](
             "least Y to receive")},
        [&] {
            Logging::setLogLevel(logLevel, nullptr);
            CurveResult amounts;
            auto code = withdraw(snapshot, request, amounts);
            return printQuote(code,
                              fmt::format(FMT_STRING("x={} y={} shares={}"),
                                          amounts.amountX, amounts.amountY,
                                          request.shareAmount));
        });
}

int
runQuoteSwap(CommandLineArgs const& args)
{
    LogLevel logLevel{LogLevel::LVL_WARNING};
    PoolSnapshot snapshot;
    SwapRequest request;
    std::optional<PoolAsset> input;

    return runWithHelp(
        args,
        {logLevelParser(logLevel), snapshotParser(snapshot),
         {assetParser(input, "--input", "token sold to the pool"),
          requiredAsset(input, "--input")},
         clara::Opt{request.inputAmount, "AMOUNT"}["--amount"](
             "amount sold to the pool"),
         clara::Opt{request.minOutput, "AMOUNT"}["--min-output"](
             "least amount to receive")},
        [&] {
            Logging::setLogLevel(logLevel, nullptr);
            request.inputSide = *input;
            SwapResult amounts;
            auto code = swap(snapshot, request, amounts);
            return printQuote(code,
                              fmt::format(FMT_STRING("in={} {} out={} {}"),
                                          amounts.deposit,
                                          toString(request.inputSide),
                                          amounts.withdraw,
                                          toString(otherAsset(
                                              request.inputSide))));
        });
}

int
runSpotPrice(CommandLineArgs const& args)
{
    LogLevel logLevel{LogLevel::LVL_WARNING};
    PoolSnapshot snapshot;
    std::optional<PoolAsset> side;

    return runWithHelp(
        args,
        {logLevelParser(logLevel), snapshotParser(snapshot),
         {assetParser(side, "--side", "token to price"),
          requiredAsset(side, "--side")}},
        [&] {
            Logging::setLogLevel(logLevel, nullptr);
            uint64_t price = 0;
            auto code = getSpotPrice(snapshot, *side, price);
            return printQuote(
                code, fmt::format(FMT_STRING("price={} decimals={}"), price,
                                  snapshot.shareDecimals));
        });
}

int
runVersion(CommandLineArgs const&)
{
    std::cout << CPAMM_VERSION << std::endl;
    return 0;
}

int
handleCommandLine(int argc, char* const* argv)
{
    auto commandLine = CommandLine{
        {{"run",
          "apply the operations of a config file to an in-memory pool and "
          "print the results",
          run},
         {"quote-deposit", "compute the amounts a deposit would take",
          runQuoteDeposit},
         {"quote-withdraw", "compute the amounts a withdrawal would pay",
          runQuoteWithdraw},
         {"quote-swap", "compute the output of a swap", runQuoteSwap},
         {"spot-price",
          "print the price of one unit of a token in the other token",
          runSpotPrice},
#ifdef BUILD_TESTS
         {"test", "execute test suite", runTest},
#endif
         {"version", "print version information", runVersion}}};

    auto adjustedCommandLine = commandLine.adjustCommandLine({argc, argv});
    auto command = commandLine.selectCommand(adjustedCommandLine.first);
    bool didDefaultToHelp = command->name() != adjustedCommandLine.first;

    auto exeName = "cpamm";
    auto commandName =
        fmt::format(FMT_STRING("{0} {1}"), exeName, command->name());
    auto args = CommandLineArgs{exeName, commandName, command->description(),
                                adjustedCommandLine.second};

    try
    {
        int res = command->run(args);
        return didDefaultToHelp ? 1 : res;
    }
    catch (std::exception& e)
    {
        LOG_FATAL(DEFAULT_LOG, "Got an exception: {}", e.what());
        return 1;
    }
}
}
