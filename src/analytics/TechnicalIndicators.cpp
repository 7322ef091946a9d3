#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>
#include <numeric>

namespace peakrev {
namespace analytics {

IndicatorSeries TechnicalIndicators::computeEMASeries(const std::vector<double>& prices, int period) {
    IndicatorSeries ema(prices.size());
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return ema;
    }

    const double alpha = 2.0 / (period + 1.0);

    // Seed with the SMA of the first `period` prices
    double seed = std::accumulate(prices.begin(), prices.begin() + period, 0.0) / period;
    ema[period - 1] = seed;

    double prev = seed;
    for (size_t i = static_cast<size_t>(period); i < prices.size(); ++i) {
        prev = prices[i] * alpha + prev * (1.0 - alpha);
        ema[i] = prev;
    }
    return ema;
}

double TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return 0.0;
    }
    double sum = std::accumulate(prices.end() - period, prices.end(), 0.0);
    return sum / period;
}

std::optional<double> TechnicalIndicators::calculateRSI(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period + 1)) {
        return std::nullopt;
    }

    double gain_sum = 0.0;
    double loss_sum = 0.0;
    for (size_t i = prices.size() - period; i < prices.size(); ++i) {
        double change = prices[i] - prices[i - 1];
        if (change > 0) gain_sum += change;
        else loss_sum += std::abs(change);
    }

    const double avg_gain = gain_sum / period;
    const double avg_loss = loss_sum / period;
    if (avg_loss == 0.0) return 100.0;

    double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

double TechnicalIndicators::calculateReturnVolatility(const std::vector<double>& prices) {
    if (prices.size() < 2) {
        return 0.0;
    }

    std::vector<double> returns;
    returns.reserve(prices.size() - 1);
    for (size_t i = 1; i < prices.size(); ++i) {
        if (prices[i - 1] == 0.0) continue;
        returns.push_back((prices[i] - prices[i - 1]) / prices[i - 1]);
    }
    if (returns.empty()) {
        return 0.0;
    }
    return calculateStandardDeviation(returns, calculateMean(returns));
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> prices;
    prices.reserve(candles.size());
    for (const auto& c : candles) {
        prices.push_back(c.close);
    }
    return prices;
}

std::vector<double> TechnicalIndicators::extractHighPrices(const std::vector<Candle>& candles) {
    std::vector<double> prices;
    prices.reserve(candles.size());
    for (const auto& c : candles) {
        prices.push_back(c.high);
    }
    return prices;
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double TechnicalIndicators::calculateStandardDeviation(const std::vector<double>& values, double mean) {
    if (values.empty()) return 0.0;

    double sq_sum = 0.0;
    for (double v : values) {
        sq_sum += (v - mean) * (v - mean);
    }
    return std::sqrt(sq_sum / values.size());
}

} // namespace analytics
} // namespace peakrev
