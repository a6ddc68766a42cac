#include "data/CsvCandleProvider.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <sstream>

namespace fvgscan {
namespace data {

namespace {
constexpr long long kSecondsThreshold = 100000000000LL;    // below this a timestamp is in seconds

std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // UTF-8 BOM on the first cell
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}
} // namespace

CsvCandleProvider::CsvCandleProvider(std::filesystem::path data_dir)
    : data_dir_(std::move(data_dir)) {}

std::filesystem::path CsvCandleProvider::pathFor(const std::string& symbol, Timeframe timeframe) const {
    return data_dir_ / (symbol + "_" + toString(timeframe) + ".csv");
}

CandleSeries CsvCandleProvider::getSeries(const std::string& symbol, Timeframe timeframe, Timestamp since_ms) {
    const auto path = pathFor(symbol, timeframe);
    if (!std::filesystem::exists(path)) {
        throw DataUnavailable("no candle file for " + symbol + " " + toString(timeframe) + ": " + path.string());
    }

    std::vector<Candle> candles = loadCSV(path);
    candles.erase(
        std::remove_if(candles.begin(), candles.end(), [&](const Candle& c) {
            return c.timestamp < since_ms;
        }),
        candles.end()
    );

    LOG_DEBUG("{} {}: {} candles since {}", symbol, toString(timeframe), candles.size(), since_ms);
    return CandleSeries(symbol, timeframe, std::move(candles));
}

std::vector<Candle> CsvCandleProvider::loadCSV(const std::filesystem::path& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw DataUnavailable("failed to open CSV file: " + file_path.string());
    }

    std::map<Timestamp, Candle> by_time;
    std::string line;
    size_t skipped = 0;

    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 5) continue;
        if (row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0]))) {
            // header
            continue;
        }

        try {
            Candle candle;
            candle.timestamp = std::stoll(row[0]);
            if (candle.timestamp < kSecondsThreshold) {
                candle.timestamp *= 1000;
            }
            candle.open = std::stod(row[1]);
            candle.high = std::stod(row[2]);
            candle.low = std::stod(row[3]);
            candle.close = std::stod(row[4]);
            candle.volume = (row.size() > 5 && !row[5].empty()) ? std::stod(row[5]) : 0.0;

            if (candle.high < candle.low ||
                candle.high < std::max(candle.open, candle.close) ||
                candle.low > std::min(candle.open, candle.close)) {
                LOG_WARN("Inconsistent OHLC row skipped: {}", line);
                ++skipped;
                continue;
            }
            by_time[candle.timestamp] = candle;
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
            ++skipped;
        }
    }

    std::vector<Candle> candles;
    candles.reserve(by_time.size());
    for (const auto& [ts, candle] : by_time) {
        candles.push_back(candle);
    }

    LOG_DEBUG("Loaded {} candles from {} ({} rows skipped)", candles.size(), file_path.string(), skipped);
    return candles;
}

} // namespace data
} // namespace fvgscan
