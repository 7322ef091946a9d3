#include "strategy/PeakReversalStrategy.h"
#include "analytics/PeakDetector.h"
#include "analytics/PatternClassifier.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>

namespace peakrev {
namespace strategy {

const char* toString(SignalType type) {
    return type == SignalType::BUY ? "BUY" : "NONE";
}

const char* toString(ScanStage stage) {
    switch (stage) {
        case ScanStage::SCANNING: return "SCANNING";
        case ScanStage::PEAK_FOUND: return "PEAK_FOUND";
        case ScanStage::PATTERN_CONFIRMED: return "PATTERN_CONFIRMED";
        case ScanStage::SIGNAL_EMITTED: return "SIGNAL_EMITTED";
        default: return "NO_SIGNAL";
    }
}

const char* toString(SignalStrength strength) {
    switch (strength) {
        case SignalStrength::STRONG: return "STRONG";
        case SignalStrength::MODERATE: return "MODERATE";
        default: return "WEAK";
    }
}

PeakReversalStrategy::PeakReversalStrategy(PeakReversalConfig config)
    : config_(std::move(config))
{
    config_.validate();
}

int PeakReversalStrategy::requiredLookback() const {
    return std::max({config_.min_history_bars,
                     config_.ema_fast_period,
                     config_.ema_slow_period,
                     config_.peak_ema_period});
}

Decision PeakReversalStrategy::decide(const std::string& symbol, const std::vector<Candle>& candles) const {
    Decision decision;
    decision.symbol = symbol;
    decision.strategy_name = config_.name;
    if (!candles.empty()) {
        decision.timestamp = candles.back().timestamp;
        decision.current_price = candles.back().close;
    }

    // Insufficient history is a normal NO_SIGNAL
    if (candles.size() < static_cast<size_t>(requiredLookback())) {
        decision.reason = "insufficient_history";
        return decision;
    }

    const auto highs = analytics::TechnicalIndicators::extractHighPrices(candles);
    const auto closes = analytics::TechnicalIndicators::extractClosePrices(candles);

    // 1. Peak
    const auto peak = analytics::PeakDetector::findPeak(
        highs, closes,
        config_.recent_window, config_.total_window,
        config_.peak_ema_period, config_.peak_ema_multiple);
    if (!peak.found()) {
        decision.reason = std::string("no_peak:") + analytics::toString(peak.reason);
        return decision;
    }
    const size_t peak_index = *peak.index;
    decision.last_passed = ScanStage::PEAK_FOUND;
    decision.peak_index = static_cast<long long>(peak_index);
    decision.peak_price = candles[peak_index].high;

    // 2. Post-peak pattern
    const std::vector<Candle> after_peak(candles.begin() + static_cast<std::ptrdiff_t>(peak_index) + 1, candles.end());
    const auto pattern = analytics::PatternClassifier::classify(
        candles[peak_index], after_peak, config_.pattern_buffer, config_.max_pattern_bars);
    decision.pattern = pattern.tag;
    if (pattern.tag == analytics::PatternTag::NONE) {
        decision.reason = "pattern_none";
        return decision;
    }
    decision.last_passed = ScanStage::PATTERN_CONFIRMED;

    // 3. Pullback into the selected EMA
    const int period = (pattern.tag == analytics::PatternTag::ALL)
        ? config_.ema_fast_period
        : config_.ema_slow_period;
    const auto ema = analytics::TechnicalIndicators::computeEMASeries(closes, period);
    if (!ema.back().has_value()) {
        decision.reason = "ema_undefined";
        return decision;
    }
    const double ema_value = *ema.back();
    decision.ema_period_used = period;

    const Candle& current = candles.back();
    if (!(current.low < ema_value)) {
        decision.reason = "low_above_ema";
        return decision;
    }

    decision.signal = SignalType::BUY;
    decision.stage = ScanStage::SIGNAL_EMITTED;
    decision.last_passed = ScanStage::SIGNAL_EMITTED;
    decision.direction = Direction::LONG;
    decision.entry_price = ema_value;
    decision.tp_price = ema_value * (1.0 + config_.tp_ratio);
    decision.sl_price = ema_value * (1.0 - config_.sl_ratio);
    decision.risk_reward = (decision.tp_price - decision.entry_price) /
                           (decision.entry_price - decision.sl_price);
    decision.volume_ratio = calculateVolumeRatio(candles);
    decision.strength = calculateSignalStrength(
        candles, decision.peak_price, current.close, decision.volume_ratio);
    decision.reason = std::string("pattern_") + analytics::toString(pattern.tag);

    LOG_DEBUG("{} BUY: entry={:.8f} tp={:.8f} sl={:.8f} ema={} strength={}",
              symbol, decision.entry_price, decision.tp_price, decision.sl_price,
              period, toString(decision.strength));
    return decision;
}

double PeakReversalStrategy::calculateVolumeRatio(const std::vector<Candle>& candles, int lookback) {
    if (candles.empty() || lookback <= 0) {
        return 1.0;
    }
    const size_t count = std::min(candles.size(), static_cast<size_t>(lookback));
    double sum = 0.0;
    for (size_t i = candles.size() - count; i < candles.size(); ++i) {
        sum += candles[i].volume;
    }
    const double avg = sum / static_cast<double>(count);
    return avg > 0.0 ? candles.back().volume / avg : 1.0;
}

SignalStrength PeakReversalStrategy::calculateSignalStrength(
    const std::vector<Candle>& candles,
    double peak_price,
    double current_price,
    double volume_ratio
) {
    int score = 0;

    if (peak_price > 0.0) {
        const double pullback = std::abs((current_price - peak_price) / peak_price);
        if (pullback >= 0.15 && pullback <= 0.30) {
            score += 2;
        } else if (pullback >= 0.10 && pullback < 0.15) {
            score += 1;
        }
    }

    if (volume_ratio > 1.5) {
        score += 2;
    } else if (volume_ratio > 1.0) {
        score += 1;
    }

    const auto closes = analytics::TechnicalIndicators::extractClosePrices(candles);
    const std::vector<double> last20(closes.end() - static_cast<std::ptrdiff_t>(std::min<size_t>(20, closes.size())),
                                     closes.end());
    if (analytics::TechnicalIndicators::calculateReturnVolatility(last20) < 0.03) {
        score += 1;
    }

    const std::vector<double> last15(closes.end() - static_cast<std::ptrdiff_t>(std::min<size_t>(15, closes.size())),
                                     closes.end());
    const auto rsi = analytics::TechnicalIndicators::calculateRSI(last15, 14);
    if (rsi && *rsi < 40.0) {
        score += 2;
    } else if (rsi && *rsi < 50.0) {
        score += 1;
    }

    if (score >= 5) return SignalStrength::STRONG;
    if (score >= 3) return SignalStrength::MODERATE;
    return SignalStrength::WEAK;
}

bool PeakReversalStrategy::passesQualityGate(const Decision& decision) const {
    if (!decision.isBuy()) {
        return false;
    }
    if (decision.risk_reward < config_.min_risk_reward) {
        LOG_DEBUG("{}: risk/reward too low ({:.2f})", decision.symbol, decision.risk_reward);
        return false;
    }
    if (decision.strength == SignalStrength::WEAK) {
        LOG_DEBUG("{}: signal strength too weak", decision.symbol);
        return false;
    }
    if (decision.volume_ratio < config_.min_volume_ratio) {
        LOG_DEBUG("{}: volume too low ({:.2f})", decision.symbol, decision.volume_ratio);
        return false;
    }
    return true;
}

std::string PeakReversalStrategy::normalizePair(const std::string& symbol) const {
    std::string upper;
    upper.reserve(symbol.size());
    for (unsigned char c : symbol) {
        if (!std::isspace(c)) {
            upper.push_back(static_cast<char>(std::toupper(c)));
        }
    }
    std::string quote = config_.quote_asset;
    std::transform(quote.begin(), quote.end(), quote.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    const bool has_quote = upper.size() > quote.size() &&
        upper.compare(upper.size() - quote.size(), quote.size(), quote) == 0;
    return has_quote ? upper : upper + quote;
}

std::vector<std::string> PeakReversalStrategy::filterSymbols(const std::vector<SymbolInfo>& universe) const {
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto& info : universe) {
        if (info.symbol.empty()) continue;
        if (info.market_cap < config_.min_market_cap || info.market_cap > config_.max_market_cap) {
            continue;
        }
        auto pair = normalizePair(info.symbol);
        if (seen.insert(pair).second) {
            out.push_back(std::move(pair));
        }
    }
    LOG_INFO("Universe filter: {} -> {} symbols", universe.size(), out.size());
    return out;
}

} // namespace strategy
} // namespace peakrev
