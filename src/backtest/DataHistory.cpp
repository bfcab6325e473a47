#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <set>
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/TimeUtils.h"

namespace capsim {
namespace backtest {

namespace {
std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
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
}

bool isAllDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

// ISO-8601 문자열 또는 epoch sec/ms 숫자 문자열
long long parseTimestampText(const std::string& text) {
    if (isAllDigits(text)) {
        return utils::toMsTimestamp(std::stoll(text));
    }
    return utils::parseIso8601Ms(text);
}

long long parseTimestampValue(const nlohmann::json& value) {
    if (value.is_number_integer() || value.is_number_unsigned()) {
        return utils::toMsTimestamp(value.get<long long>());
    }
    if (value.is_number_float()) {
        return utils::toMsTimestamp(std::llround(value.get<double>()));
    }
    if (value.is_string()) {
        return parseTimestampText(value.get<std::string>());
    }
    throw MalformedInputError("timestamp must be a string or a number, got " + value.dump());
}

const nlohmann::json* findField(const nlohmann::json& item, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = item.find(key);
        if (it != item.end() && !it->is_null()) {
            return &(*it);
        }
    }
    return nullptr;
}

double requireNumber(const nlohmann::json& item, std::initializer_list<const char*> keys,
                     const std::string& context) {
    const nlohmann::json* field = findField(item, keys);
    if (field == nullptr) {
        throw MalformedInputError(context + ": missing field '" + *keys.begin() + "'");
    }
    if (!field->is_number()) {
        throw MalformedInputError(context + ": field '" + *keys.begin() + "' is not a number");
    }
    return field->get<double>();
}

bool isPositivePrice(double v) {
    return std::isfinite(v) && v > 0.0;
}

std::string lowerExtension(const std::string& file_path) {
    std::string ext = std::filesystem::path(file_path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}
}

std::vector<Candle> DataHistory::loadCSV(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        throw MalformedInputError("Failed to open CSV file: " + file_path);
    }

    std::string line;
    int line_no = 0;

    while (std::getline(file, line)) {
        ++line_no;
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.empty() || row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0]))) {
            // Header row.
            continue;
        }
        if (row.size() < 6) {
            throw MalformedInputError(file_path + ":" + std::to_string(line_no) +
                                      ": expected 6 columns, got " + std::to_string(row.size()));
        }

        try {
            Candle candle;
            candle.timestamp = parseTimestampText(row[0]);
            candle.open = std::stod(row[1]);
            candle.high = std::stod(row[2]);
            candle.low = std::stod(row[3]);
            candle.close = std::stod(row[4]);
            candle.volume = std::stod(row[5]);
            candles.push_back(candle);
        } catch (const std::invalid_argument& e) {
            throw MalformedInputError(file_path + ":" + std::to_string(line_no) + ": " + e.what());
        } catch (const std::out_of_range& e) {
            throw MalformedInputError(file_path + ":" + std::to_string(line_no) +
                                      ": value out of range (" + e.what() + ")");
        }
    }

    validateCandles(candles);
    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> DataHistory::loadJSON(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        throw MalformedInputError("Failed to open JSON file: " + file_path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw MalformedInputError("Error parsing JSON file: " + file_path + " - " + e.what());
    }

    const nlohmann::json& rows = (j.is_object() && j.contains("candles")) ? j["candles"] : j;
    if (!rows.is_array()) {
        throw MalformedInputError(file_path + ": expected a JSON array of candles");
    }

    size_t index = 0;
    for (const auto& item : rows) {
        const std::string context = file_path + "[" + std::to_string(index++) + "]";
        if (!item.is_object()) {
            throw MalformedInputError(context + ": candle must be an object");
        }

        const nlohmann::json* ts = findField(item, {"timestamp", "t", "candle_date_time_utc"});
        if (ts == nullptr) {
            throw MalformedInputError(context + ": missing field 'timestamp'");
        }

        Candle candle;
        try {
            candle.timestamp = parseTimestampValue(*ts);
        } catch (const std::invalid_argument& e) {
            throw MalformedInputError(context + ": " + e.what());
        }
        candle.open = requireNumber(item, {"open", "o", "opening_price"}, context);
        candle.high = requireNumber(item, {"high", "h", "high_price"}, context);
        candle.low = requireNumber(item, {"low", "l", "low_price"}, context);
        candle.close = requireNumber(item, {"close", "c", "trade_price"}, context);
        const nlohmann::json* volume = findField(item, {"volume", "v", "candle_acc_trade_volume"});
        candle.volume = (volume != nullptr && volume->is_number()) ? volume->get<double>() : 0.0;
        candles.push_back(candle);
    }

    // Ensure sorted by timestamp ascending
    std::stable_sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp < b.timestamp;
    });

    validateCandles(candles);
    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> DataHistory::loadCandles(const std::string& file_path) {
    if (lowerExtension(file_path) == ".json") {
        return loadJSON(file_path);
    }
    return loadCSV(file_path);
}

std::vector<Signal> DataHistory::parseSignals(const nlohmann::json& j) {
    const nlohmann::json* rows = &j;
    if (j.is_object()) {
        auto it = j.find("signals");
        if (it == j.end()) {
            throw MalformedInputError("signal file: missing 'signals' array");
        }
        rows = &(*it);
    }
    if (!rows->is_array()) {
        throw MalformedInputError("signal file: 'signals' must be an array");
    }

    static const std::set<std::string> known_keys = {
        "timestamp", "price", "entry_price", "score", "metadata"
    };

    std::vector<Signal> signals;
    signals.reserve(rows->size());

    size_t index = 0;
    for (const auto& item : *rows) {
        const std::string context = "signals[" + std::to_string(index++) + "]";
        if (!item.is_object()) {
            throw MalformedInputError(context + ": signal must be an object");
        }

        Signal signal;
        auto ts = item.find("timestamp");
        if (ts == item.end()) {
            throw MalformedInputError(context + ": missing field 'timestamp'");
        }
        try {
            signal.timestamp = parseTimestampValue(*ts);
        } catch (const std::invalid_argument& e) {
            throw MalformedInputError(context + ": " + e.what());
        }

        signal.price = requireNumber(item, {"price", "entry_price"}, context);
        if (!isPositivePrice(signal.price)) {
            throw MalformedInputError(context + ": price must be positive");
        }

        auto score = item.find("score");
        if (score != item.end() && !score->is_null()) {
            if (!score->is_number()) {
                throw MalformedInputError(context + ": score must be a number");
            }
            signal.score = score->get<double>();
        }

        auto metadata = item.find("metadata");
        if (metadata != item.end() && metadata->is_object()) {
            signal.metadata = *metadata;
        }
        // market_state 등 나머지 키는 metadata 로 보존
        for (auto it = item.begin(); it != item.end(); ++it) {
            if (known_keys.count(it.key()) == 0 && !signal.metadata.contains(it.key())) {
                signal.metadata[it.key()] = it.value();
            }
        }

        signals.push_back(std::move(signal));
    }

    return normalizeSignals(std::move(signals));
}

std::vector<Signal> DataHistory::loadSignalsJSON(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw MalformedInputError("Failed to open signal file: " + file_path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw MalformedInputError("Error parsing signal file: " + file_path + " - " + e.what());
    }

    auto signals = parseSignals(j);
    LOG_INFO("Loaded {} signals from {}", signals.size(), file_path);
    return signals;
}

std::vector<Signal> DataHistory::normalizeSignals(std::vector<Signal> signals) {
    const bool was_sorted = std::is_sorted(signals.begin(), signals.end(),
        [](const Signal& a, const Signal& b) { return a.timestamp < b.timestamp; });

    std::stable_sort(signals.begin(), signals.end(),
        [](const Signal& a, const Signal& b) { return a.timestamp < b.timestamp; });

    const size_t before = signals.size();
    signals.erase(std::unique(signals.begin(), signals.end(),
        [](const Signal& a, const Signal& b) { return a.timestamp == b.timestamp; }),
        signals.end());
    const size_t dropped = before - signals.size();

    if (!was_sorted) {
        LOG_WARN("Signals were not in time order; sorted {} records", signals.size());
    }
    if (dropped > 0) {
        LOG_WARN("Dropped {} signals with duplicate timestamps (first occurrence kept)", dropped);
    }
    return signals;
}

void DataHistory::validateCandles(const std::vector<Candle>& candles) {
    for (size_t i = 0; i < candles.size(); ++i) {
        const Candle& c = candles[i];
        const std::string where = "candle #" + std::to_string(i) + " (" +
                                  utils::formatIso8601(c.timestamp) + ")";

        if (!isPositivePrice(c.open) || !isPositivePrice(c.high) ||
            !isPositivePrice(c.low) || !isPositivePrice(c.close)) {
            throw MalformedInputError(where + ": prices must be positive and finite");
        }
        if (c.high < c.low) {
            throw MalformedInputError(where + ": high < low");
        }
        if (!std::isfinite(c.volume) || c.volume < 0.0) {
            throw MalformedInputError(where + ": volume must be >= 0");
        }
        if (i > 0 && c.timestamp <= candles[i - 1].timestamp) {
            throw MalformedInputError(where + (c.timestamp == candles[i - 1].timestamp
                                               ? ": duplicate timestamp"
                                               : ": timestamps not increasing"));
        }
    }
}

void DataHistory::validateSignals(const std::vector<Signal>& signals) {
    for (size_t i = 0; i < signals.size(); ++i) {
        const Signal& s = signals[i];
        const std::string where = "signal #" + std::to_string(i) + " (" +
                                  utils::formatIso8601(s.timestamp) + ")";
        if (!isPositivePrice(s.price)) {
            throw MalformedInputError(where + ": price must be positive and finite");
        }
        if (i > 0 && s.timestamp <= signals[i - 1].timestamp) {
            throw MalformedInputError(where + ": signals must be sorted and de-duplicated");
        }
    }
}

std::vector<Candle> DataHistory::filterByDate(const std::vector<Candle>& candles,
                                              const std::string& start_date,
                                              const std::string& end_date) {
    long long start_ms = 0;
    long long end_ms = 0;
    try {
        start_ms = start_date.empty() ? std::numeric_limits<long long>::min()
                                      : utils::parseIso8601Ms(start_date);
        end_ms = end_date.empty() ? std::numeric_limits<long long>::max()
                                  : utils::parseIso8601Ms(end_date);
    } catch (const std::invalid_argument& e) {
        throw MalformedInputError(std::string("invalid date filter: ") + e.what());
    }

    std::vector<Candle> filtered;
    std::copy_if(candles.begin(), candles.end(), std::back_inserter(filtered),
                 [&](const Candle& c) { return c.timestamp >= start_ms && c.timestamp <= end_ms; });
    return filtered;
}

} // namespace backtest
} // namespace capsim
