#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/contracts/ICandleProvider.h"

namespace fvgscan {
namespace data {

// Reads <data_dir>/<symbol>_<tf>.csv (timestamp,open,high,low,close[,volume]).
// Timestamps in seconds are promoted to milliseconds.
class CsvCandleProvider : public core::ICandleProvider {
public:
    explicit CsvCandleProvider(std::filesystem::path data_dir);

    CandleSeries getSeries(const std::string& symbol, Timeframe timeframe, Timestamp since_ms) override;

    std::filesystem::path pathFor(const std::string& symbol, Timeframe timeframe) const;

    // Sorted by timestamp, duplicates resolved to the last row
    static std::vector<Candle> loadCSV(const std::filesystem::path& file_path);

private:
    std::filesystem::path data_dir_;
};

} // namespace data
} // namespace fvgscan
