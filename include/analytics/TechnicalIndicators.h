#pragma once

#include <vector>
#include <optional>
#include "common/Types.h"

namespace peakrev {
namespace analytics {

using IndicatorSeries = std::vector<std::optional<double>>;

class TechnicalIndicators {
public:
    // EMA aligned to prices. Indices before period-1 are empty, index period-1 is the
    // SMA seed, then price*a + prev*(1-a) with a = 2/(period+1).
    // Fewer than `period` prices (or period <= 0) gives an all-empty series.
    static IndicatorSeries computeEMASeries(const std::vector<double>& prices, int period);

    // SMA of the last `period` prices (0 if not enough data)
    static double calculateSMA(const std::vector<double>& prices, int period);

    // RSI from simple averages of the last `period` changes
    static std::optional<double> calculateRSI(const std::vector<double>& prices, int period = 14);

    // Population std-dev of close-to-close simple returns
    static double calculateReturnVolatility(const std::vector<double>& prices);

    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);
    static std::vector<double> extractHighPrices(const std::vector<Candle>& candles);

private:
    static double calculateMean(const std::vector<double>& values);
    static double calculateStandardDeviation(const std::vector<double>& values, double mean);
};

} // namespace analytics
} // namespace peakrev
