#pragma once

#include <map>
#include <string>
#include <vector>

#include "common/Types.h"

namespace fvgscan {
namespace engine {

// alias is what trades and notifications are keyed by; data_symbol is what the provider is asked for
struct SymbolMapping {
    std::string alias;
    std::string data_symbol;
};

struct ScannerConfig {
    std::vector<SymbolMapping> symbols = {
        {"US30", "US30"},
        {"XAUUSD", "XAUUSD"}
    };

    int scan_interval_seconds = 60;
    bool parallel_symbols = false;
    int max_conflict_retries = 3;
    Timeframe tracking_timeframe = Timeframe::M1;   // bars replayed against open trades

    // history fetched per cycle
    std::map<Timeframe, int> history_days = {
        {Timeframe::H4, 30},
        {Timeframe::H1, 14},
        {Timeframe::M30, 7},
        {Timeframe::M15, 7},
        {Timeframe::M5, 3},
        {Timeframe::M1, 1}
    };

    std::string data_dir = "data";
    std::string trade_store_path = "state/trades.json";
    std::string journal_path = "logs/notifications.jsonl";
};

} // namespace engine
} // namespace fvgscan
