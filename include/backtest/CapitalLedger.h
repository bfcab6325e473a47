#pragma once

#include <vector>

#include "backtest/BacktestConfig.h"
#include "backtest/BacktestTypes.h"

namespace capsim {
namespace backtest {

// 현금의 단일 진실 공급원. 진입 1회, 청산 1회씩만 자본을 갱신한다.
class CapitalLedger {
public:
    CapitalLedger(double initial_capital, const CostModel& cost, long long start_time = 0);

    // committed = capital_available * fraction
    // fee = committed * (fee_rate + slippage_rate)
    // quantity = (committed - fee) / entry_price  (수수료를 먼저 빼고 나눈다)
    // 최소 주문 미달 등은 SkipReason, 이미 포지션이 있으면 DoubleEntryError
    EntryResult enter(double capital_available, double fraction,
                      double entry_price, long long entry_time);

    // 열린 포지션을 Trade 로 확정. 포지션이 없으면 NoPositionError
    Trade exit(const Position& position, double exit_price,
               long long exit_time, ExitReason reason);

    bool hasOpenPosition() const { return has_open_position_; }
    double currentCapital() const { return state_.current_capital; }
    double initialCapital() const { return initial_capital_; }

    // 미투입 현금 + 열린 포지션의 원가
    double bookEquity() const;

    const CapitalState& state() const { return state_; }
    const std::vector<EquityPoint>& equityCurve() const { return equity_curve_; }
    const CostModel& costModel() const { return cost_; }

private:
    void updateDrawdown();

    double initial_capital_;
    CostModel cost_;
    CapitalState state_;
    std::vector<EquityPoint> equity_curve_;

    bool has_open_position_ = false;
    long long open_entry_time_ = 0;
    double open_committed_ = 0.0;
};

} // namespace backtest
} // namespace capsim
