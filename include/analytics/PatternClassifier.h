#pragma once

#include "common/Types.h"
#include <vector>

namespace peakrev {
namespace analytics {

enum class PatternTag {
    ALL,            // every post-peak bar bearish -> fast EMA
    ALL_BUT_ONE,    // exactly one bullish bar -> slow EMA
    NONE            // abort signal generation
};

const char* toString(PatternTag tag);

struct PatternResult {
    PatternTag tag = PatternTag::NONE;
    int bars_examined = 0;
    int bearish_count = 0;
};

class PatternClassifier {
public:
    static constexpr double DAILY_BUFFER = 0.1;
    static constexpr double WEEKLY_BUFFER = 0.2;
    static constexpr int MAX_BARS = 7;

    // `after_peak` holds the candles following `peak`, oldest first; at most
    // `max_bars` of them are examined.
    static PatternResult classify(
        const Candle& peak,
        const std::vector<Candle>& after_peak,
        double buffer,
        int max_bars = MAX_BARS
    );

    // Bullish if the high rose, the candle closed up, or the upper wick
    // reaches past open*(1+buffer)
    static bool isBullish(const Candle& bar, const Candle& previous, double buffer);
};

} // namespace analytics
} // namespace peakrev
