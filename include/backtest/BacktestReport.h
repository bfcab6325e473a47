#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "analytics/StatisticsAggregator.h"
#include "backtest/BacktestTypes.h"
#include "risk/PositionSizer.h"

namespace capsim {
namespace backtest {

// 한 번의 실행 결과. 필드 이름은 외부 계약 (JSON 키)
struct BacktestReport {
    std::string market;
    analytics::PerformanceStats stats;
    std::vector<Trade> trades;
    std::vector<EquityPoint> equity_curve;
    SignalFunnel signal_funnel;
    risk::KellyEstimate last_sizing;

    nlohmann::json toJson() const;
};

nlohmann::json tradeToJson(const Trade& trade);

} // namespace backtest
} // namespace capsim
