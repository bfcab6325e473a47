#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace capsim {
namespace backtest {

// 입력 데이터 로드 + 검증. 잘못된 데이터는 실행 전에 MalformedInputError 로 거부
class DataHistory {
public:
    // Load candles from a CSV file
    // Expected format: timestamp,open,high,low,close,volume
    // timestamp: ISO-8601 or epoch sec/ms. Header rows are skipped.
    static std::vector<Candle> loadCSV(const std::string& file_path);

    // Load candles from a JSON array (Upbit format keys accepted).
    // Upbit returns newest first, so rows are sorted ascending before validation.
    static std::vector<Candle> loadJSON(const std::string& file_path);

    // Extension-based dispatch (.json -> loadJSON, otherwise CSV)
    static std::vector<Candle> loadCandles(const std::string& file_path);

    // {"signals": [...]} or a bare array
    static std::vector<Signal> loadSignalsJSON(const std::string& file_path);
    static std::vector<Signal> parseSignals(const nlohmann::json& j);

    // 타임스탬프 기준 정렬 + 중복 제거 (먼저 나온 레코드 유지)
    static std::vector<Signal> normalizeSignals(std::vector<Signal> signals);

    // 엄격 증가 타임스탬프, 양수 가격, high >= low
    static void validateCandles(const std::vector<Candle>& candles);
    static void validateSignals(const std::vector<Signal>& signals);

    // Filter candles by time range (ISO-8601 bounds, both inclusive; empty = unbounded)
    static std::vector<Candle> filterByDate(const std::vector<Candle>& candles,
                                            const std::string& start_date,
                                            const std::string& end_date);
};

} // namespace backtest
} // namespace capsim
