#pragma once

#include <optional>
#include <vector>
#include "common/CandleSeries.h"
#include "common/Types.h"

namespace fvgscan {
namespace analytics {

enum class SwingKind { HIGH, LOW };

struct SwingPoint {
    size_t index = 0;
    Timestamp timestamp = 0;
    double price = 0.0;
    SwingKind kind = SwingKind::HIGH;
};

enum class StructureEventKind {
    BOS,        // close beyond the last swing in the trend direction
    CHOCH,      // BOS against the previously established trend
    SWEEP       // wick through a swing level, close back inside
};

struct StructureEvent {
    StructureEventKind kind = StructureEventKind::BOS;
    MarketBias direction = MarketBias::BULLISH;
    double price = 0.0;         // swing level that was broken or swept
    size_t index = 0;           // bar that produced the event
    Timestamp timestamp = 0;
};

struct StructureAnalysis {
    std::vector<SwingPoint> swings;
    std::vector<StructureEvent> events;
    std::optional<MarketBias> trend;    // direction of the last BOS/CHOCH
};

struct StructureConfig {
    int swing_window = 5;       // bars required on each side of a swing
};

std::string toString(StructureEventKind kind);

class IStructureAnalyzer {
public:
    virtual ~IStructureAnalyzer() = default;

    virtual std::vector<SwingPoint> findSwings(const CandleSeries& series) const = 0;
    virtual std::vector<StructureEvent> findStructure(
        const CandleSeries& series,
        const std::vector<SwingPoint>& swings
    ) const = 0;

    // Minimum bars before any swing can be confirmed
    virtual size_t minimumBars() const = 0;

    StructureAnalysis analyze(const CandleSeries& series) const;
};

// Fixed-window swing detector with bar-by-bar structure replay.
// A swing at index i is only usable from bar i + window onwards, so events
// never depend on bars that were not closed yet when they fired.
class StructureAnalyzer : public IStructureAnalyzer {
public:
    explicit StructureAnalyzer(StructureConfig config = StructureConfig());

    std::vector<SwingPoint> findSwings(const CandleSeries& series) const override;
    std::vector<StructureEvent> findStructure(
        const CandleSeries& series,
        const std::vector<SwingPoint>& swings
    ) const override;
    size_t minimumBars() const override;

    const StructureConfig& config() const { return config_; }

private:
    StructureConfig config_;
};

} // namespace analytics
} // namespace fvgscan
