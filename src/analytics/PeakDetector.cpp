#include "analytics/PeakDetector.h"
#include "analytics/TechnicalIndicators.h"
#include <algorithm>
#include <limits>

namespace peakrev {
namespace analytics {

const char* toString(PeakRejection reason) {
    switch (reason) {
        case PeakRejection::NONE: return "accepted";
        case PeakRejection::BAD_INPUT: return "bad_input";
        case PeakRejection::TIED_MAXIMUM: return "tied_maximum";
        case PeakRejection::OUTSIDE_RECENT_WINDOW: return "outside_recent_window";
        case PeakRejection::EMA_UNDEFINED: return "ema_undefined";
        case PeakRejection::BELOW_EMA_MULTIPLE: return "below_ema_multiple";
        case PeakRejection::NO_PRIOR_BREAKOUT: return "no_prior_breakout";
        case PeakRejection::PEAK_NOT_BREAKOUT: return "peak_not_breakout";
    }
    return "unknown";
}

double PeakDetector::maxInRange(const std::vector<double>& values, std::size_t begin, std::size_t end) {
    double result = -std::numeric_limits<double>::infinity();
    for (std::size_t i = begin; i < end; ++i) {
        result = std::max(result, values[i]);
    }
    return result;
}

PeakResult PeakDetector::findPeak(
    const std::vector<double>& highs,
    const std::vector<double>& closes,
    int recent_window,
    int total_window,
    int ema_period,
    double ema_multiple
) {
    PeakResult result;

    if (highs.empty() || highs.size() != closes.size() ||
        recent_window < 1 || total_window < recent_window) {
        return result;
    }

    const std::size_t n = highs.size();
    const std::size_t total = static_cast<std::size_t>(total_window);
    const std::size_t recent = static_cast<std::size_t>(recent_window);

    // 1. Restrict to the last total_window bars
    const std::size_t start = (n > total) ? n - total : 0;
    const std::size_t recent_start = std::max(start, (n > recent) ? n - recent : 0);

    // 2. Unique maximum; a tie is treated as no peak
    const double max_high = maxInRange(highs, start, n);
    std::size_t peak = n;
    int hits = 0;
    for (std::size_t i = start; i < n; ++i) {
        if (highs[i] == max_high) {
            peak = i;
            ++hits;
        }
    }
    if (hits != 1) {
        result.reason = PeakRejection::TIED_MAXIMUM;
        return result;
    }

    // 3. Peak must be recent
    if (peak < recent_start) {
        result.reason = PeakRejection::OUTSIDE_RECENT_WINDOW;
        return result;
    }

    // 4. Peak high stretched above the EMA of closes
    const auto ema = TechnicalIndicators::computeEMASeries(closes, ema_period);
    if (!ema[peak].has_value()) {
        result.reason = PeakRejection::EMA_UNDEFINED;
        return result;
    }
    if (highs[peak] < ema_multiple * *ema[peak]) {
        result.reason = PeakRejection::BELOW_EMA_MULTIPLE;
        return result;
    }

    // 5. Some recent close broke the high recorded before the recent window
    if (recent_start == start) {
        result.reason = PeakRejection::NO_PRIOR_BREAKOUT;
        return result;
    }
    const double prior_high = maxInRange(highs, start, recent_start);
    const bool prior_breakout = std::any_of(
        closes.begin() + static_cast<std::ptrdiff_t>(recent_start), closes.end(),
        [prior_high](double c) { return c > prior_high; });
    if (!prior_breakout) {
        result.reason = PeakRejection::NO_PRIOR_BREAKOUT;
        return result;
    }

    // 6. The peak bar (or the bar right before it) closed above every earlier high
    if (peak == start) {
        result.reason = PeakRejection::PEAK_NOT_BREAKOUT;
        return result;
    }
    const double before_peak_high = maxInRange(highs, start, peak);
    bool peak_breakout = closes[peak] > before_peak_high;
    if (!peak_breakout && peak - 1 > start) {
        const double before_prev_high = maxInRange(highs, start, peak - 1);
        peak_breakout = closes[peak - 1] > before_prev_high;
    }
    if (!peak_breakout) {
        result.reason = PeakRejection::PEAK_NOT_BREAKOUT;
        return result;
    }

    result.index = peak;
    result.reason = PeakRejection::NONE;
    return result;
}

} // namespace analytics
} // namespace peakrev
