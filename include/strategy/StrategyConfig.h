#pragma once

#include <string>

namespace fvgscan {
namespace strategy {

struct H4ZoneStrategyConfig {
    std::string name = "H4 FVG/OB + structure";

    int h4_zone_lookback = 20;          // H4 bars a bias zone may originate from
    int structure_lookback = 20;        // H1/M30/M15 bars searched for BOS/CHOCH
    int entry_lookback = 3;             // M5/M1 bars searched for a wick rejection
    int micro_structure_lookback = 10;  // M5/M1 bars searched for a micro BOS/CHOCH
    double wick_body_ratio = 2.0;
    int atr_period = 14;
};

} // namespace strategy
} // namespace fvgscan
