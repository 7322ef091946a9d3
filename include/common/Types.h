#pragma once

#include <string>
#include <vector>

namespace peakrev {

enum class Direction { LONG, SHORT };
enum class ExitType { TP, SL, CLOSE };
enum class TradeResult { WIN, LOSS };

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

inline const char* toString(Direction d) {
    return d == Direction::LONG ? "LONG" : "SHORT";
}

inline const char* toString(ExitType t) {
    switch (t) {
        case ExitType::TP: return "TP";
        case ExitType::SL: return "SL";
        default: return "CLOSE";
    }
}

inline const char* toString(TradeResult r) {
    return r == TradeResult::WIN ? "WIN" : "LOSS";
}

// Zero return counts as a loss.
inline TradeResult classifyReturn(double return_pct) {
    return return_pct > 0.0 ? TradeResult::WIN : TradeResult::LOSS;
}

} // namespace peakrev
