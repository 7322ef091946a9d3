#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include "common/Errors.h"
#include "common/Logger.h"

namespace peakrev {
namespace backtest {

namespace {

constexpr long long MS_PER_DAY = 24LL * 60 * 60 * 1000;

// Floor division for pre-1970 timestamps
long long floorDiv(long long a, long long b) {
    long long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

double readNumber(const nlohmann::json& item, const char* long_key, const char* short_key) {
    if (item.contains(long_key)) return item.at(long_key).get<double>();
    if (item.contains(short_key)) return item.at(short_key).get<double>();
    return 0.0;
}

} // namespace

std::vector<Candle> DataHistory::loadCSV(const std::string& file_path, bool strict) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        throw DataLoadError("cannot open CSV file: " + file_path);
    }

    auto trim = [](std::string s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
            s.erase(s.begin());
        }
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
            s.pop_back();
        }
        return s;
    };

    auto normalizeCell = [&](std::string s) {
        s = trim(std::move(s));

        // Strip UTF-8 BOM if present at first cell.
        if (s.size() >= 3 &&
            static_cast<unsigned char>(s[0]) == 0xEF &&
            static_cast<unsigned char>(s[1]) == 0xBB &&
            static_cast<unsigned char>(s[2]) == 0xBF) {
            s = s.substr(3);
        }

        // Accept quoted CSV cells.
        if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
            s = s.substr(1, s.size() - 2);
        }
        return trim(std::move(s));
    };

    std::string line;
    int skipped = 0;

    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 6) continue;
        if (row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0])) && row[0][0] != '-') {
            // Header or malformed row.
            continue;
        }

        try {
            Candle candle;
            candle.timestamp = toMsTimestamp(std::stoll(row[0]));
            candle.open = std::stod(row[1]);
            candle.high = std::stod(row[2]);
            candle.low = std::stod(row[3]);
            candle.close = std::stod(row[4]);
            candle.volume = std::stod(row[5]);
            candles.push_back(candle);
        } catch (const std::exception& e) {
            if (strict) {
                throw DataLoadError("unparseable row '" + line + "' in " + file_path);
            }
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
            ++skipped;
        }
    }

    normalizeOrder(candles, strict, file_path);
    LOG_INFO("Loaded {} candles from {} ({} rows skipped)", candles.size(), file_path, skipped);
    return candles;
}

std::vector<Candle> DataHistory::loadJSON(const std::string& file_path, bool strict) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        throw DataLoadError("cannot open JSON file: " + file_path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw DataLoadError("malformed JSON in " + file_path + ": " + e.what());
    }
    if (!j.is_array()) {
        throw DataLoadError("expected a JSON array of candles in " + file_path);
    }

    for (const auto& item : j) {
        try {
            Candle candle;
            if (item.contains("timestamp")) candle.timestamp = item["timestamp"].get<long long>();
            else if (item.contains("t")) candle.timestamp = item["t"].get<long long>();
            candle.timestamp = toMsTimestamp(candle.timestamp);

            candle.open = readNumber(item, "open", "o");
            candle.high = readNumber(item, "high", "h");
            candle.low = readNumber(item, "low", "l");
            candle.close = readNumber(item, "close", "c");
            candle.volume = readNumber(item, "volume", "v");
            candles.push_back(candle);
        } catch (const nlohmann::json::exception& e) {
            if (strict) {
                throw DataLoadError("bad candle object in " + file_path + ": " + e.what());
            }
            LOG_WARN("Skipping candle object in {}: {}", file_path, e.what());
        }
    }

    normalizeOrder(candles, strict, file_path);
    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> DataHistory::load(const std::string& file_path, bool strict) {
    if (file_path.find(".json") != std::string::npos) {
        return loadJSON(file_path, strict);
    }
    return loadCSV(file_path, strict);
}

std::vector<Candle> DataHistory::aggregateWeekly(const std::vector<Candle>& daily) {
    std::vector<Candle> weekly;
    long long current_week = 0;

    for (const auto& c : daily) {
        // 1970-01-01 was a Thursday; +3 shifts week boundaries to Monday
        const long long day = floorDiv(c.timestamp, MS_PER_DAY);
        const long long week = floorDiv(day + 3, 7);

        if (weekly.empty() || week != current_week) {
            Candle bar = c;
            bar.timestamp = (week * 7 - 3) * MS_PER_DAY;
            weekly.push_back(bar);
            current_week = week;
            continue;
        }

        Candle& bar = weekly.back();
        bar.high = std::max(bar.high, c.high);
        bar.low = std::min(bar.low, c.low);
        bar.close = c.close;
        bar.volume += c.volume;
    }

    LOG_DEBUG("Resampled {} daily candles into {} weekly candles", daily.size(), weekly.size());
    return weekly;
}

std::vector<Candle> DataHistory::filterByTime(const std::vector<Candle>& candles,
                                              long long start_ms,
                                              long long end_ms) {
    std::vector<Candle> out;
    for (const auto& c : candles) {
        if (c.timestamp >= start_ms && c.timestamp <= end_ms) {
            out.push_back(c);
        }
    }
    return out;
}

bool DataHistory::isStrictlyIncreasing(const std::vector<Candle>& candles) {
    for (std::size_t i = 1; i < candles.size(); ++i) {
        if (candles[i].timestamp <= candles[i - 1].timestamp) {
            return false;
        }
    }
    return true;
}

long long DataHistory::toMsTimestamp(long long ts) {
    // < 1e11 cannot be a millisecond timestamp after 1973
    if (ts > -100000000000LL && ts < 100000000000LL) {
        return ts * 1000;
    }
    return ts;
}

void DataHistory::normalizeOrder(std::vector<Candle>& candles, bool strict, const std::string& source) {
    if (isStrictlyIncreasing(candles)) {
        return;
    }
    if (strict) {
        throw DataLoadError("timestamps are not strictly increasing in " + source);
    }

    std::stable_sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp < b.timestamp;
    });
    const auto before = candles.size();
    candles.erase(std::unique(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp == b.timestamp;
    }), candles.end());
    LOG_WARN("{}: candles re-sorted, {} duplicate timestamp(s) dropped", source, before - candles.size());
}

} // namespace backtest
} // namespace peakrev
