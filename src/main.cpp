#include "common/Logger.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "common/PathUtils.h"
#include "analytics/FvgDetector.h"
#include "analytics/OrderBlockDetector.h"
#include "analytics/StructureAnalyzer.h"
#include "core/execution/TradeLifecycleManager.h"
#include "core/state/NotificationJournalJsonl.h"
#include "core/state/TradeStoreJson.h"
#include "data/CachingCandleProvider.h"
#include "data/CsvCandleProvider.h"
#include "engine/SymbolScanner.h"
#include "risk/RiskEstimator.h"
#include "strategy/H4ZoneStrategy.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace fvgscan;

namespace {
std::atomic<bool> g_stop_requested(false);

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_stop_requested = true;
    }
}

void printUsage() {
    std::cout << "usage: fvgscan [--config <path>] [--once]\n"
              << "  --config <path>  JSON configuration (default config/config.json)\n"
              << "  --once           run a single scan cycle and exit\n";
}
}

int main(int argc, char* argv[]) {
    std::string config_path = "config/config.json";
    bool run_once = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--once") {
            run_once = true;
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            printUsage();
            return 2;
        }
    }

    try {
        auto& config = Config::getInstance();
        config.load(config_path);

        Logger::getInstance().initialize(
            utils::PathUtils::resolvePath(config.getLogDir()).string(), config.getLogLevel());

        std::cout << "\n";
        std::cout << "=============================================\n";
        std::cout << "       FVGSCAN multi-timeframe scanner\n";
        std::cout << "=============================================\n\n";

        const engine::ScannerConfig scanner_config = config.getScannerConfig();

        // ===== Collaborators =====
        const std::filesystem::path data_dir = utils::PathUtils::resolvePath(scanner_config.data_dir);
        const std::filesystem::path store_path = utils::PathUtils::resolvePath(scanner_config.trade_store_path);
        const std::filesystem::path journal_path = utils::PathUtils::resolvePath(scanner_config.journal_path);
        auto csv_provider = std::make_shared<data::CsvCandleProvider>(data_dir);
        auto cache = std::make_shared<data::SeriesCache>(config.getSeriesCacheConfig());
        auto provider = std::make_shared<data::CachingCandleProvider>(csv_provider, cache);

        auto store = std::make_shared<core::TradeStoreJson>(store_path);
        auto journal = std::make_shared<core::NotificationJournalJsonl>(journal_path);

        // ===== Analysis =====
        auto structure = std::make_shared<analytics::StructureAnalyzer>(config.getStructureConfig());
        auto fvg = std::make_shared<analytics::FvgDetector>(config.getFvgConfig());
        auto order_blocks = std::make_shared<analytics::OrderBlockDetector>(config.getOrderBlockConfig());

        auto estimator = std::make_shared<risk::RiskEstimator>(config.getRiskConfig(), store, structure);
        auto strategy = std::make_shared<strategy::H4ZoneStrategy>(
            config.getStrategyConfig(), structure, fvg, order_blocks, estimator);
        auto lifecycle = std::make_shared<core::execution::TradeLifecycleManager>(
            config.getLifecycleConfig(), store, journal);

        engine::SymbolScanner scanner(scanner_config, provider, strategy, estimator, lifecycle, store);

        LOG_INFO("fvgscan starting: {} symbols, data dir {}, {} stored trades in {}, journal {}",
                 scanner_config.symbols.size(), data_dir.string(), store->size(),
                 store_path.string(), journal_path.string());

        if (run_once) {
            const engine::ScanReport report = scanner.runScanCycle();
            for (const auto& result : report.results) {
                std::cout << result.symbol << ": "
                          << (result.error.empty() ? "ok" : result.error)
                          << (result.opened_trade_id ? " signal " + *result.opened_trade_id : std::string())
                          << ", tracked " << result.trades_tracked
                          << ", closed " << result.trades_closed << "\n";
            }
            return report.failed_symbols == static_cast<int>(report.results.size()) ? 1 : 0;
        }

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        if (!scanner.start()) {
            LOG_ERROR("scanner failed to start");
            return 1;
        }
        std::cout << "press Ctrl+C to stop\n\n";

        while (scanner.isRunning() && !g_stop_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        scanner.stop();

        LOG_INFO("fvgscan stopped");
        return 0;
    } catch (const ConfigError& e) {
        std::cerr << "configuration error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "fatal error: " << e.what() << std::endl;
        return 1;
    }
}
