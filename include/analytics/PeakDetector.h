#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace peakrev {
namespace analytics {

enum class PeakRejection {
    NONE,                   // peak accepted
    BAD_INPUT,              // size mismatch, empty input or bad windows
    TIED_MAXIMUM,           // window maximum attained by more than one bar
    OUTSIDE_RECENT_WINDOW,
    EMA_UNDEFINED,
    BELOW_EMA_MULTIPLE,
    NO_PRIOR_BREAKOUT,      // no recent close above the pre-window high
    PEAK_NOT_BREAKOUT       // neither the peak nor the bar before it closed above earlier highs
};

const char* toString(PeakRejection reason);

struct PeakResult {
    std::optional<std::size_t> index;   // absolute index into the input arrays
    PeakRejection reason = PeakRejection::BAD_INPUT;

    bool found() const { return index.has_value(); }
};

class PeakDetector {
public:
    static constexpr int WEEKLY_RECENT_WINDOW = 5;
    static constexpr int WEEKLY_TOTAL_WINDOW = 52;
    static constexpr int DAILY_RECENT_WINDOW = 7;
    static constexpr int DAILY_TOTAL_WINDOW = 200;

    // Finds the single qualifying high of the last `total_window` bars.
    // The peak must be unique, sit in the last `recent_window` bars, reach
    // ema_multiple x EMA(closes, ema_period) and be a confirmed breakout.
    static PeakResult findPeak(
        const std::vector<double>& highs,
        const std::vector<double>& closes,
        int recent_window,
        int total_window,
        int ema_period = 15,
        double ema_multiple = 1.2
    );

private:
    static double maxInRange(const std::vector<double>& values, std::size_t begin, std::size_t end);
};

} // namespace analytics
} // namespace peakrev
