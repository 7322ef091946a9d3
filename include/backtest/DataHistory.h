#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace peakrev {
namespace backtest {

class DataHistory {
public:
    // Load candles from a CSV file
    // Expected format: timestamp,open,high,low,close,volume
    // strict: out-of-order or duplicate timestamps throw DataLoadError;
    // otherwise the series is sorted and duplicates dropped with a warning.
    static std::vector<Candle> loadCSV(const std::string& file_path, bool strict = false);

    // Load candles from a JSON array ({"timestamp","open",...} or {"t","o",...})
    static std::vector<Candle> loadJSON(const std::string& file_path, bool strict = false);

    // Dispatch on the file extension
    static std::vector<Candle> load(const std::string& file_path, bool strict = false);

    // Group daily candles into Monday-based UTC weeks
    static std::vector<Candle> aggregateWeekly(const std::vector<Candle>& daily);

    // Candles with start_ms <= timestamp <= end_ms
    static std::vector<Candle> filterByTime(const std::vector<Candle>& candles,
                                            long long start_ms,
                                            long long end_ms);

    static bool isStrictlyIncreasing(const std::vector<Candle>& candles);

    // Second-resolution timestamps are scaled to milliseconds
    static long long toMsTimestamp(long long ts);

private:
    static void normalizeOrder(std::vector<Candle>& candles, bool strict, const std::string& source);
};

} // namespace backtest
} // namespace peakrev
