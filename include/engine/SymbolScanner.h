#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "core/contracts/ICandleProvider.h"
#include "core/contracts/IOutcomeStore.h"
#include "core/execution/TradeLifecycleManager.h"
#include "data/CachingCandleProvider.h"
#include "engine/EngineConfig.h"
#include "risk/IRiskEstimator.h"
#include "strategy/IStrategy.h"

namespace fvgscan {
namespace engine {

struct SymbolScanResult {
    std::string symbol;
    bool data_available = false;
    std::optional<std::string> opened_trade_id;
    int trades_tracked = 0;
    int trades_closed = 0;
    int adjustments_applied = 0;
    std::string error;
};

struct ScanReport {
    Timestamp started_at = 0;
    std::vector<SymbolScanResult> results;
    int signals = 0;
    int failed_symbols = 0;
};

// One scan cycle per interval: fetch every timeframe, look for a new signal,
// then walk each open trade through the bars it has not seen yet.
class SymbolScanner {
public:
    SymbolScanner(
        ScannerConfig config,
        std::shared_ptr<core::ICandleProvider> provider,
        std::shared_ptr<strategy::IStrategy> strategy,
        std::shared_ptr<risk::IRiskEstimator> estimator,
        std::shared_ptr<core::execution::TradeLifecycleManager> lifecycle,
        std::shared_ptr<core::IOutcomeStore> store,
        data::Clock clock = data::systemNowMs
    );

    ~SymbolScanner();

    // ===== Loop control =====

    bool start();
    void stop();
    bool isRunning() const { return running_; }
    void run();

    // ===== Single cycle =====

    ScanReport runScanCycle();
    ScanReport runScanCycle(Timestamp now);
    SymbolScanResult scanSymbol(const SymbolMapping& symbol, Timestamp now);

    std::optional<Timestamp> lastSeenH4(const std::string& alias) const;

private:
    strategy::MultiTimeframeContext buildContext(const SymbolMapping& symbol, Timestamp now);
    void recordH4Close(const std::string& alias, const strategy::MultiTimeframeContext& ctx);

    // Bounded retry of trackTradeOnce on StateConflict
    void trackTrade(const std::string& trade_id, const strategy::MultiTimeframeContext& ctx, SymbolScanResult& result);
    void trackTradeOnce(const std::string& trade_id, const strategy::MultiTimeframeContext& ctx, SymbolScanResult& result);

    ScannerConfig config_;
    std::shared_ptr<core::ICandleProvider> provider_;
    std::shared_ptr<strategy::IStrategy> strategy_;
    std::shared_ptr<risk::IRiskEstimator> estimator_;
    std::shared_ptr<core::execution::TradeLifecycleManager> lifecycle_;
    std::shared_ptr<core::IOutcomeStore> store_;
    data::Clock clock_;

    std::map<std::string, Timestamp> last_seen_h4_;
    mutable std::mutex last_seen_mutex_;

    std::atomic<bool> running_;
    std::unique_ptr<std::thread> worker_thread_;
};

} // namespace engine
} // namespace fvgscan
