// cli/src/main.cpp

// Standard includes
#include <iostream>
#include <string>
#include <vector>
#include <map>
#include <exception>
#include <chrono>
#include <csignal>
#include <cstdlib>     // Needed for std::getenv
#include <memory>
#include <thread>
#include <atomic>

// Project includes
#include "logging.hpp"        // For logging functionality
#include "exceptions.hpp"     // For custom exception types
#include "datatypes.hpp"
#include "utils.hpp"
#include "config.hpp"
#include "database_manager.hpp" // Market data (SQLite)
#include "upstox_api_client.hpp"// Broker / market data over HTTP
#include "trade_store.hpp"      // Trade journal + open positions
#include "backtester.hpp"
#include "trade_log.hpp"
#include "live_trader.hpp"
#include "approval_gateway.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>

namespace {

    volatile std::sig_atomic_t g_interrupted = 0;

    void onSignal(int) {
        g_interrupted = 1;
    }

    void printUsage() {
        std::cerr
            << "Usage:\n"
            << "  swing_trader backtest --config <file> --db <market.db> --from YYYY-MM-DD --to YYYY-MM-DD\n"
            << "                        [--trades <trades.csv>] [--equity <equity.csv>] [--journal <trades.db>]\n"
            << "  swing_trader live     --config <file> [--journal <trades.db>]\n"
            << "  swing_trader fetch    --config <file> --db <market.db> --from YYYY-MM-DD --to YYYY-MM-DD\n"
            << "Options: --log-level <trace|debug|info|warn|error>  --log-dir <dir>\n"
            << "Credentials: UPSTOX_API_KEY, UPSTOX_API_SECRET, UPSTOX_ACCESS_TOKEN, UPSTOX_REDIRECT_URI\n";
    }

    // --key value pairs after the command
    std::map<std::string, std::string> parseOptions(int argc, char* argv[]) {
        std::map<std::string, std::string> options;
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg.rfind("--", 0) != 0 || i + 1 >= argc) {
                throw std::invalid_argument("Unexpected argument: " + arg);
            }
            options[arg.substr(2)] = argv[++i];
        }
        return options;
    }

    std::string required(const std::map<std::string, std::string>& options, const std::string& key) {
        auto it = options.find(key);
        if (it == options.end() || it->second.empty()) {
            throw std::invalid_argument("Missing required option --" + key);
        }
        return it->second;
    }

    std::string optionOr(const std::map<std::string, std::string>& options, const std::string& key, const std::string& fallback) {
        auto it = options.find(key);
        return it == options.end() ? fallback : it->second;
    }

    std::string envOr(const char* name, const std::string& fallback = "") {
        const char* value = std::getenv(name);
        return value ? std::string(value) : fallback;
    }

    std::unique_ptr<data::UpstoxApiClient> makeUpstoxClient() {
        auto logger = core::logging::getLogger();
        // --- Read API Credentials ---
        std::string api_key = envOr("UPSTOX_API_KEY");
        std::string api_secret = envOr("UPSTOX_API_SECRET");
        std::string access_token = envOr("UPSTOX_ACCESS_TOKEN");
        std::string redirect_uri = envOr("UPSTOX_REDIRECT_URI");

        if (api_key.empty() || api_secret.empty()) {
            logger->warn("API Key or Secret not found in environment variables (UPSTOX_API_KEY, UPSTOX_API_SECRET)");
        }
        if (access_token.empty()) {
            throw core::AuthenticationException("Access token not found in environment variable UPSTOX_ACCESS_TOKEN");
        }
        return std::make_unique<data::UpstoxApiClient>(api_key, api_secret, redirect_uri, access_token);
    }

    int runBacktest(const std::map<std::string, std::string>& options) {
        auto logger = core::logging::getLogger();
        core::EngineConfig config = core::loadEngineConfig(required(options, "config"));
        std::string db_path = required(options, "db");
        std::string start_date = required(options, "from");
        std::string end_date = required(options, "to");
        logger->info("Backtest Parameters: Capital={:.2f}, Start={}, End={}, Universe={} instruments",
                     config.initial_capital, start_date, end_date, config.universe.size());

        // --- Database Setup ---
        data::DatabaseManager db_manager(db_path);
        if (!db_manager.connect()) {
            throw core::DataLoadException("Cannot open market data database " + db_path);
        }

        std::unique_ptr<data::SqliteTradeStore> journal;
        if (options.count("journal")) {
            journal = std::make_unique<data::SqliteTradeStore>(options.at("journal"));
        }

        backtester::Backtester the_backtester(config, nullptr, journal.get());
        the_backtester.loadData(db_manager, start_date, end_date);
        backtester::BacktestMetrics metrics = the_backtester.run(core::utils::parseDate(start_date),
                                                                 core::utils::parseDate(end_date) + std::chrono::hours(24) - std::chrono::seconds(1));
        db_manager.disconnect();

        const auto& portfolio = the_backtester.getPortfolio();
        std::string trades_path = optionOr(options, "trades", "backtest_trades.csv");
        std::string equity_path = optionOr(options, "equity", "backtest_equity.csv");
        backtester::writeTradeLogCsv(trades_path, portfolio.getClosedTrades());
        backtester::writeEquityCurveCsv(equity_path, portfolio.getEquityCurve());
        logger->info("Trade log written to {}, equity curve to {}", trades_path, equity_path);

        std::cout << "Final equity: " << metrics.final_equity
                  << "  Total return: " << metrics.total_return * 100.0 << "%"
                  << "  Trades: " << metrics.total_trades
                  << "  Max drawdown: " << metrics.max_drawdown * 100.0 << "%" << std::endl;
        return 0;
    }

    int runFetch(const std::map<std::string, std::string>& options) {
        auto logger = core::logging::getLogger();
        core::EngineConfig config = core::loadEngineConfig(required(options, "config"));
        std::string start_date = required(options, "from");
        std::string end_date = required(options, "to");

        data::DatabaseManager db_manager(required(options, "db"));
        if (!db_manager.connect() || !db_manager.initializeSchema()) {
            throw core::DataLoadException("Cannot prepare market data database");
        }
        auto upstox_client = makeUpstoxClient();

        std::vector<std::string> instruments = config.universe;
        if (!config.benchmark.empty()) {
            instruments.push_back(config.benchmark);
        }
        int failures = 0;
        for (const auto& instrument : instruments) {
            try {
                auto candles = upstox_client->getHistoricalCandleData(instrument, config.interval, start_date, end_date);
                if (!db_manager.saveCandles(candles, instrument, config.interval)) {
                    logger->error("Failed to save fetched candles for {}", instrument);
                    ++failures;
                }
            } catch (const core::AuthenticationException&) {
                throw;
            } catch (const core::ExternalServiceException& e) {
                logger->error("Fetching {} failed: {}", instrument, e.what());
                ++failures;
            }
        }
        db_manager.disconnect();
        return failures == 0 ? 0 : 1;
    }

    int runLive(const std::map<std::string, std::string>& options) {
        auto logger = core::logging::getLogger();
        core::EngineConfig config = core::loadEngineConfig(required(options, "config"));
        auto upstox_client = makeUpstoxClient();
        data::SqliteTradeStore journal(optionOr(options, "journal", "live_trades.db"));

        std::unique_ptr<live::IApprovalGateway> approver;
        if (config.live.require_manual_approval) {
            approver = std::make_unique<live::ConsoleApprover>();
        } else {
            approver = std::make_unique<live::AutoApprover>();
        }

        live::LiveTrader trader(config, *upstox_client, *approver, nullptr, &journal, &journal);

        std::signal(SIGINT, onSignal);
        std::signal(SIGTERM, onSignal);
        std::atomic<bool> finished{false};
        std::thread watcher([&trader, &finished]() {
            while (!finished.load()) {
                if (g_interrupted) {
                    trader.stop();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        });

        int exit_code = 0;
        try {
            trader.run();
        } catch (const core::AuthenticationException& e) {
            logger->critical("Authentication failed, live trading stopped: {}", e.what());
            exit_code = 2;
        }
        finished.store(true);
        watcher.join();
        return exit_code;
    }

} // namespace

int main(int argc, char* argv[]) {
    // Define logger pointer early in the main scope
    std::shared_ptr<spdlog::logger> logger = nullptr;

    if (argc < 2) {
        printUsage();
        return 1;
    }
    const std::string command = argv[1];

    // Main try block for exception handling
    try {
        std::map<std::string, std::string> options = parseOptions(argc, argv);

        // --- Initialize Logging ---
        spdlog::level::level_enum console_level = core::logging::level_from_string(optionOr(options, "log-level", "info"));
        core::logging::initialize("swing_trader_" + command, console_level, spdlog::level::debug,
                                  optionOr(options, "log-dir", "logs"));
        logger = core::logging::getLogger();
        logger->info("Swing Trader CLI starting: {}", command);

        int result = 1;
        if (command == "backtest") {
            result = runBacktest(options);
        } else if (command == "live") {
            result = runLive(options);
        } else if (command == "fetch") {
            result = runFetch(options);
        } else {
            printUsage();
            return 1;
        }
        logger->info("Swing Trader CLI finished with code {}.", result);
        return result;

    // --- Exception Handling ---
    } catch (const core::InvalidConfigurationException& ex) {
        std::cerr << "Configuration Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Configuration Error: {}", ex.what());
        return 1;
    } catch (const core::TradingEngineException& ex) {
        std::cerr << "Engine Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Engine Error: {}", ex.what());
        return 1;
    } catch (const std::invalid_argument& ex) {
        std::cerr << "Usage Error: " << ex.what() << std::endl;
        printUsage();
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }
}
