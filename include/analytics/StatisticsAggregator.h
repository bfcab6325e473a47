#pragma once

#include <map>
#include <string>
#include <vector>

#include "backtest/BacktestTypes.h"

namespace capsim {
namespace analytics {

// 손실 거래가 없을 때의 profit factor
constexpr double PROFIT_FACTOR_NO_LOSS = 99.9;

struct KellySummary {
    double full = 0.0;
    double half = 0.0;
    double quarter = 0.0;
};

struct PerformanceStats {
    double initial_capital = 0.0;
    double final_capital = 0.0;
    double total_return_pct = 0.0;

    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double win_rate = 0.0;             // 0~1

    double avg_return_pct = 0.0;
    double avg_win_pct = 0.0;
    double avg_loss_pct = 0.0;         // 음수
    double sharpe_ratio = 0.0;
    double max_drawdown_pct = 0.0;
    double profit_factor = 0.0;
    double expectancy = 0.0;           // 거래당 평균 손익 (KRW)
    double total_fees = 0.0;
    double avg_holding_hours = 0.0;

    std::map<std::string, int> exit_reason_counts;
    KellySummary kelly;
};

// 완료된 거래 로그에 대한 순수 함수. NaN/Inf 는 결과에 남기지 않는다.
class StatisticsAggregator {
public:
    // equity_curve 가 비어 있으면 거래 로그의 capital_after 로 재구성
    static PerformanceStats aggregate(double initial_capital,
                                      const std::vector<backtest::Trade>& trades,
                                      const std::vector<backtest::EquityPoint>& equity_curve);
    static PerformanceStats aggregate(double initial_capital,
                                      const std::vector<backtest::Trade>& trades);

    // 청산 시점 자본 곡선 기준 최대 낙폭 (%)
    static double maxDrawdownPct(double initial_capital,
                                 const std::vector<backtest::EquityPoint>& equity_curve);

    // mean / sample stdev. 거래 2건 미만이거나 stdev 0 이면 0
    static double sharpeRatio(const std::vector<double>& returns_pct);

    // 전체 로그 기준 Kelly (0~1), 정의되지 않으면 0
    static double kellyCriterion(double win_rate, double avg_win, double avg_loss_abs);
};

} // namespace analytics
} // namespace capsim
