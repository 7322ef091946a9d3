#include "analytics/PatternClassifier.h"
#include <algorithm>

namespace peakrev {
namespace analytics {

const char* toString(PatternTag tag) {
    switch (tag) {
        case PatternTag::ALL: return "all";
        case PatternTag::ALL_BUT_ONE: return "all_but_one";
        default: return "none";
    }
}

bool PatternClassifier::isBullish(const Candle& bar, const Candle& previous, double buffer) {
    if (bar.high > previous.high) return true;
    if (bar.close > bar.open) return true;
    if (bar.high > bar.open * (1.0 + buffer)) return true;
    return false;
}

PatternResult PatternClassifier::classify(
    const Candle& peak,
    const std::vector<Candle>& after_peak,
    double buffer,
    int max_bars
) {
    PatternResult result;
    const std::size_t limit = std::min(after_peak.size(), static_cast<std::size_t>(std::max(max_bars, 0)));
    if (limit == 0) {
        return result;
    }

    const Candle* previous = &peak;
    for (std::size_t i = 0; i < limit; ++i) {
        if (!isBullish(after_peak[i], *previous, buffer)) {
            ++result.bearish_count;
        }
        previous = &after_peak[i];
    }
    result.bars_examined = static_cast<int>(limit);

    if (result.bearish_count == result.bars_examined) {
        result.tag = PatternTag::ALL;
    } else if (result.bearish_count == result.bars_examined - 1) {
        result.tag = PatternTag::ALL_BUT_ONE;
    } else {
        result.tag = PatternTag::NONE;
    }
    return result;
}

} // namespace analytics
} // namespace peakrev
