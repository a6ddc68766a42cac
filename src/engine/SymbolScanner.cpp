#include "engine/SymbolScanner.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <chrono>
#include <future>

namespace fvgscan {
namespace engine {

namespace {
constexpr DurationMs kDayMs = 24LL * 60 * 60 * 1000;
constexpr int kDefaultHistoryDays = 7;
}

SymbolScanner::SymbolScanner(
    ScannerConfig config,
    std::shared_ptr<core::ICandleProvider> provider,
    std::shared_ptr<strategy::IStrategy> strategy,
    std::shared_ptr<risk::IRiskEstimator> estimator,
    std::shared_ptr<core::execution::TradeLifecycleManager> lifecycle,
    std::shared_ptr<core::IOutcomeStore> store,
    data::Clock clock
)
    : config_(std::move(config))
    , provider_(std::move(provider))
    , strategy_(std::move(strategy))
    , estimator_(std::move(estimator))
    , lifecycle_(std::move(lifecycle))
    , store_(std::move(store))
    , clock_(std::move(clock))
    , running_(false)
{
    if (!provider_ || !strategy_ || !estimator_ || !lifecycle_ || !store_ || !clock_) {
        throw InvariantViolation("SymbolScanner requires all collaborators");
    }
}

SymbolScanner::~SymbolScanner() {
    stop();
}

// ===== Loop control =====

bool SymbolScanner::start() {
    if (running_) {
        LOG_WARN("scanner already running");
        return false;
    }

    LOG_INFO("========================================");
    LOG_INFO("scanner started: {} symbols, every {}s", config_.symbols.size(), config_.scan_interval_seconds);
    LOG_INFO("========================================");

    running_ = true;
    worker_thread_ = std::make_unique<std::thread>(&SymbolScanner::run, this);
    return true;
}

void SymbolScanner::stop() {
    if (!running_) {
        return;
    }
    LOG_INFO("scanner stopping");
    running_ = false;
    if (worker_thread_ && worker_thread_->joinable()) {
        worker_thread_->join();
    }
}

void SymbolScanner::run() {
    const auto scan_interval = std::chrono::seconds(config_.scan_interval_seconds);
    const auto poll_interval = std::chrono::milliseconds(200);
    auto last_scan_time = std::chrono::steady_clock::now() - scan_interval;

    while (running_) {
        const auto now = std::chrono::steady_clock::now();
        if (now - last_scan_time >= scan_interval) {
            try {
                const ScanReport report = runScanCycle();
                LOG_INFO("scan cycle done: {} symbols, {} signals, {} failed",
                         report.results.size(), report.signals, report.failed_symbols);
            } catch (const std::exception& e) {
                LOG_ERROR("scan cycle failed: {}", e.what());
            }
            last_scan_time = std::chrono::steady_clock::now();
        }
        std::this_thread::sleep_for(poll_interval);
    }
}

// ===== Single cycle =====

ScanReport SymbolScanner::runScanCycle() {
    return runScanCycle(clock_());
}

ScanReport SymbolScanner::runScanCycle(Timestamp now) {
    ScanReport report;
    report.started_at = now;

    if (config_.parallel_symbols && config_.symbols.size() > 1) {
        std::vector<std::future<SymbolScanResult>> futures;
        futures.reserve(config_.symbols.size());
        for (const auto& symbol : config_.symbols) {
            futures.push_back(std::async(std::launch::async, [this, &symbol, now]() {
                return scanSymbol(symbol, now);
            }));
        }
        for (auto& future : futures) {
            report.results.push_back(future.get());
        }
    } else {
        for (const auto& symbol : config_.symbols) {
            report.results.push_back(scanSymbol(symbol, now));
        }
    }

    for (const auto& result : report.results) {
        if (result.opened_trade_id) {
            report.signals++;
        }
        if (!result.error.empty()) {
            report.failed_symbols++;
        }
    }
    return report;
}

SymbolScanResult SymbolScanner::scanSymbol(const SymbolMapping& symbol, Timestamp now) {
    SymbolScanResult result;
    result.symbol = symbol.alias;

    try {
        const strategy::MultiTimeframeContext ctx = buildContext(symbol, now);
        result.data_available = true;

        // 1) new signal
        const auto signal = strategy_->evaluateNewSignal(ctx);
        recordH4Close(symbol.alias, ctx);
        if (signal) {
            try {
                result.opened_trade_id = lifecycle_->openTrade(*signal);
            } catch (const InvariantViolation& e) {
                LOG_ERROR("{} signal {} not opened: {}", symbol.alias, signal->id, e.what());
            }
        }

        // 2) open trades
        for (const auto& trade : store_->openTrades(symbol.alias)) {
            trackTrade(trade.id, ctx, result);
        }
    } catch (const DataUnavailable& e) {
        LOG_WARN("{} skipped, data unavailable: {}", symbol.alias, e.what());
        result.error = e.what();
    } catch (const std::exception& e) {
        LOG_ERROR("{} scan failed: {}", symbol.alias, e.what());
        result.error = e.what();
    }
    return result;
}

std::optional<Timestamp> SymbolScanner::lastSeenH4(const std::string& alias) const {
    std::lock_guard<std::mutex> lock(last_seen_mutex_);
    auto it = last_seen_h4_.find(alias);
    if (it == last_seen_h4_.end()) {
        return std::nullopt;
    }
    return it->second;
}

strategy::MultiTimeframeContext SymbolScanner::buildContext(const SymbolMapping& symbol, Timestamp now) {
    strategy::MultiTimeframeContext ctx;
    ctx.symbol = symbol.alias;
    ctx.now = now;
    ctx.last_seen_h4 = lastSeenH4(symbol.alias);

    for (Timeframe tf : kAllTimeframes) {
        auto it = config_.history_days.find(tf);
        const int days = (it != config_.history_days.end()) ? it->second : kDefaultHistoryDays;
        ctx.series.emplace(tf, provider_->getSeries(symbol.data_symbol, tf, now - days * kDayMs));
    }

    // newest price from the finest timeframe that has bars
    for (auto tf = kAllTimeframes.rbegin(); tf != kAllTimeframes.rend(); ++tf) {
        const CandleSeries* series = ctx.find(*tf);
        if (series && !series->empty()) {
            ctx.current_price = series->back().close;
            break;
        }
    }
    if (ctx.current_price <= 0.0) {
        throw DataUnavailable("no bars for " + symbol.data_symbol + " on any timeframe");
    }
    return ctx;
}

void SymbolScanner::recordH4Close(const std::string& alias, const strategy::MultiTimeframeContext& ctx) {
    const CandleSeries* h4 = ctx.find(Timeframe::H4);
    if (!h4) {
        return;
    }
    const CandleSeries closed = h4->closedAt(ctx.now);
    if (closed.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(last_seen_mutex_);
    Timestamp& seen = last_seen_h4_[alias];
    seen = std::max(seen, closed.lastTimestamp());
}

// ===== Open trade tracking =====

void SymbolScanner::trackTrade(
    const std::string& trade_id,
    const strategy::MultiTimeframeContext& ctx,
    SymbolScanResult& result
) {
    result.trades_tracked++;
    for (int attempt = 0; attempt <= config_.max_conflict_retries; ++attempt) {
        try {
            trackTradeOnce(trade_id, ctx, result);
            return;
        } catch (const StateConflict& e) {
            LOG_WARN("{} trade {} conflict (attempt {}): {}", ctx.symbol, trade_id, attempt + 1, e.what());
        }
    }
    LOG_ERROR("{} trade {} gave up after {} conflicts", ctx.symbol, trade_id, config_.max_conflict_retries + 1);
}

void SymbolScanner::trackTradeOnce(
    const std::string& trade_id,
    const strategy::MultiTimeframeContext& ctx,
    SymbolScanResult& result
) {
    using core::execution::TransitionOutcome;

    auto trade = store_->getTrade(trade_id);
    if (!trade || core::isTerminal(trade->state)) {
        return;
    }

    // 1) replay unseen closed bars
    if (const CandleSeries* tracking = ctx.find(config_.tracking_timeframe)) {
        // first bar whose close is after the open, i.e. the one the trade was filled in
        const Timestamp first_open = trade->open_time - timeframeDuration(config_.tracking_timeframe) + 1;
        const CandleSeries closed = tracking->closedAt(ctx.now).since(first_open);
        for (const auto& bar : closed.barsAfter(trade->last_bar_time)) {
            const TransitionOutcome outcome = lifecycle_->onBar(trade_id, bar, config_.tracking_timeframe);
            if (outcome == TransitionOutcome::CONFLICT) {
                throw StateConflict("bar " + std::to_string(bar.timestamp));
            }
            if (outcome == TransitionOutcome::APPLIED) {
                result.trades_closed++;
                return;
            }
        }
        trade = store_->getTrade(trade_id);
        if (!trade || core::isTerminal(trade->state)) {
            return;
        }
    }

    // 2) adjustment
    const auto recommendation = strategy_->evaluateOpenTrade(*trade, ctx);
    if (recommendation) {
        const auto adjustment = estimator_->evaluateAdjustment(recommendation->analytics);
        if (adjustment) {
            const TransitionOutcome outcome =
                lifecycle_->applyAdjustment(trade_id, *adjustment, ctx.current_price, ctx.now);
            if (outcome == TransitionOutcome::CONFLICT) {
                throw StateConflict("adjustment " + adjustment->reason);
            }
            if (outcome == TransitionOutcome::APPLIED) {
                result.adjustments_applied++;
                if (adjustment->kind == risk::AdjustmentKind::CLOSE_EARLY) {
                    result.trades_closed++;
                    return;
                }
            }
        }
    }

    // 3) expiry without bars
    const TransitionOutcome outcome = lifecycle_->checkExpiry(trade_id, ctx.now, ctx.current_price);
    if (outcome == TransitionOutcome::CONFLICT) {
        throw StateConflict("expiry");
    }
    if (outcome == TransitionOutcome::APPLIED) {
        result.trades_closed++;
    }
}

} // namespace engine
} // namespace fvgscan
