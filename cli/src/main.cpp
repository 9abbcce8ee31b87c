// cli/src/main.cpp

// Standard includes
#include <iostream>
#include <string>
#include <exception>
#include <chrono>
#include <csignal>     // For SIGINT/SIGTERM
#include <memory>      // For std::shared_ptr
#include <map>
#include <atomic>

// Project includes
#include "logging.hpp"
#include "exceptions.hpp"
#include "config.hpp"
#include "utils.hpp"
#include "database_manager.hpp"
#include "token_supply.hpp"
#include "binance_market_data_client.hpp"
#include "binance_exchange_client.hpp"
#include "paper_exchange_client.hpp"
#include "factor_engine.hpp"
#include "signal_generator.hpp"
#include "position_sizer.hpp"
#include "risk_manager.hpp"
#include "order_execution_engine.hpp"
#include "cycle_coordinator.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>

namespace {

    std::atomic<bool> g_stop_requested{false};

    void handleStopSignal(int) {
        g_stop_requested.store(true);
    }

    struct CliOptions {
        std::string config_path = "config/engine_config.json";
        std::string mode = "simulate";
        bool once = false;
    };

    void printUsage(const char* program) {
        std::cerr << "Usage: " << program << " [--config <path>] [--mode live|simulate] [--once]" << std::endl;
    }

    CliOptions parseArguments(int argc, char* argv[]) {
        CliOptions options;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                options.config_path = argv[++i];
            } else if (arg == "--mode" && i + 1 < argc) {
                options.mode = argv[++i];
            } else if (arg == "--once") {
                options.once = true;
            } else {
                throw core::ConfigException("Unknown or incomplete argument: " + arg);
            }
        }
        if (options.mode != "live" && options.mode != "simulate") {
            throw core::ConfigException("--mode must be 'live' or 'simulate', got '" + options.mode + "'");
        }
        return options;
    }

} // end anonymous namespace

int main(int argc, char* argv[]) {
    // Define logger pointer early in the main scope
    std::shared_ptr<spdlog::logger> logger = nullptr;

    // Main try block for exception handling
    try {
        CliOptions options;
        try {
            options = parseArguments(argc, argv);
        } catch (const core::ConfigException& ex) {
            std::cerr << ex.what() << std::endl;
            printUsage(argv[0]);
            return 2;
        }

        // --- Initialize Logging ---
        core::logging::initialize("statarb_engine", spdlog::level::info, spdlog::level::debug);
        logger = core::logging::getLogger();
        logger->info("Stat-arb decision engine starting (mode={}, config={})", options.mode, options.config_path);

        // --- Configuration ---
        core::config::EngineConfig config = core::config::loadEngineConfig(options.config_path);
        core::logging::initialize("statarb_engine", core::logging::level_from_string(config.log_level),
                                  spdlog::level::debug);
        logger = core::logging::getLogger();

        // --- Storage ---
        auto db_manager = std::make_shared<data::DatabaseManager>(config.database_path);
        if (!db_manager->connect() || !db_manager->initializeSchema()) {
            throw core::StorageException("Cannot open or initialize database: " + config.database_path);
        }

        // --- Market data ---
        data::TokenSupplyTable supply = data::loadTokenSupplyTable(config.market_data.token_supply_path);
        auto market_data = std::make_shared<data::BinanceMarketDataClient>(config.market_data, std::move(supply));

        // --- Exchange ---
        std::shared_ptr<execution::IExchangeClient> exchange;
        std::shared_ptr<execution::PaperExchangeClient> paper;
        if (options.mode == "live") {
            exchange = std::make_shared<execution::BinanceExchangeClient>(config.exchange);
        } else {
            paper = std::make_shared<execution::PaperExchangeClient>();
            exchange = paper;
        }
        logger->info("Using exchange client '{}'", exchange->name());

        // --- Risk and execution ---
        auto risk_manager = std::make_shared<risk::RiskManager>(config.risk);

        // Positions survive restarts; a live venue overrides what was stored
        std::map<std::string, core::PositionState> positions = db_manager->loadPositions();
        if (auto venue_positions = exchange->fetchOpenPositions()) {
            positions = risk::reconcilePositions(positions, *venue_positions);
            for (const auto& entry : positions) {
                if (!db_manager->savePosition(entry.second)) {
                    logger->error("Reconciled position for {} was not persisted.", entry.first);
                }
            }
        }
        risk_manager->restorePositions(positions);

        auto execution_engine = std::make_shared<execution::OrderExecutionEngine>(
            exchange, config.execution,
            [risk_manager](const core::Order& order) { risk_manager->commit(order); });

        // --- Coordinator ---
        coordinator::CycleCoordinator cycle_coordinator(
            market_data,
            factors::FactorEngine(config.factors),
            strategy_engine::SignalGenerator(config.signals),
            strategy_engine::PositionSizer(config.sizing),
            risk_manager,
            execution_engine,
            std::chrono::seconds(config.cycle_interval_seconds));
        cycle_coordinator.setStorage(db_manager);
        cycle_coordinator.setDashboardStatePath(config.dashboard_state_path);
        if (paper) {
            cycle_coordinator.setSnapshotListener([paper](const core::MarketSnapshot& snapshot) {
                paper->updateMarks(snapshot);
            });
        } else {
            cycle_coordinator.setEquitySource([exchange]() { return exchange->fetchAccountEquity(); });
        }

        std::signal(SIGINT, handleStopSignal);
        std::signal(SIGTERM, handleStopSignal);

        int exit_code = 0;
        if (options.once) {
            core::CycleSummary summary = cycle_coordinator.runCycle(std::chrono::system_clock::now());
            exit_code = summary.status == core::CycleStatus::Completed ? 0 : 1;
        } else {
            cycle_coordinator.run(g_stop_requested);
        }

        // Let running orders reach a terminal state and commit before exit
        execution_engine->shutdown();
        db_manager->disconnect();

        logger->info("Stat-arb decision engine finished.");
        return exit_code;

    // --- Exception Handling ---
    } catch (const core::TradingPlatformException& ex) {
        std::cerr << "Platform Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Platform Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    } catch (...) {
        std::cerr << "Unknown Error occurred." << std::endl;
        if (logger) logger->critical("Unknown Error occurred.");
        return 1;
    }
}
