#include "backtest/CapitalLedger.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace capsim {
namespace backtest {

namespace {
// 부동소수 누적 오차 허용치 (KRW)
constexpr double CAPITAL_EPSILON = 1e-6;
}

CapitalLedger::CapitalLedger(double initial_capital, const CostModel& cost, long long start_time)
    : initial_capital_(initial_capital)
    , cost_(cost)
{
    if (!std::isfinite(initial_capital) || initial_capital <= 0.0) {
        throw ConfigError("initial capital must be positive");
    }

    state_.current_capital = initial_capital;
    state_.peak_capital = initial_capital;
    equity_curve_.push_back({start_time, initial_capital});
}

double CapitalLedger::bookEquity() const {
    return state_.current_capital + (has_open_position_ ? open_committed_ : 0.0);
}

EntryResult CapitalLedger::enter(double capital_available, double fraction,
                                 double entry_price, long long entry_time) {
    if (has_open_position_) {
        throw DoubleEntryError("enter() called while a position opened at " +
                               std::to_string(open_entry_time_) + " is still open");
    }

    // 호출자가 오래된 자본 값을 넘기는 경우 (복리 계산 버그)
    if (capital_available > state_.current_capital + CAPITAL_EPSILON) {
        throw InvariantViolationError("capital_available " + std::to_string(capital_available) +
                                      " exceeds ledger cash " + std::to_string(state_.current_capital));
    }

    if (!std::isfinite(entry_price) || entry_price <= 0.0) {
        return SkipReason::INVALID_PRICE;
    }
    if (!std::isfinite(fraction) || fraction <= 0.0 || fraction > 1.0) {
        return SkipReason::INVALID_FRACTION;
    }

    const double committed = capital_available * fraction;
    if (committed < cost_.min_order_value || committed <= 0.0) {
        LOG_DEBUG("Entry skipped: committed {:.0f} < min order {:.0f}",
                  committed, cost_.min_order_value);
        return SkipReason::INSUFFICIENT_CAPITAL;
    }

    const double fee = committed * cost_.costRate();
    const double quantity = (committed - fee) / entry_price;

    Position position;
    position.entry_time = entry_time;
    position.entry_price = entry_price;
    position.asset_quantity = quantity;
    position.capital_committed = committed;
    position.entry_fee = fee;
    position.peak_price_since_entry = entry_price;
    position.trailing_armed = false;

    state_.current_capital -= committed;
    state_.total_fees += fee;

    has_open_position_ = true;
    open_entry_time_ = entry_time;
    open_committed_ = committed;

    updateDrawdown();

    LOG_DEBUG("Ledger enter: committed {:.0f} | fee {:.0f} | qty {:.8f} @ {:.0f} | cash {:.0f}",
              committed, fee, quantity, entry_price, state_.current_capital);
    return position;
}

Trade CapitalLedger::exit(const Position& position, double exit_price,
                          long long exit_time, ExitReason reason) {
    if (!has_open_position_) {
        throw NoPositionError("exit() called with no open position");
    }
    if (position.entry_time != open_entry_time_ ||
        std::abs(position.capital_committed - open_committed_) > CAPITAL_EPSILON) {
        throw InvariantViolationError("exit() called with a position the ledger did not open");
    }
    if (!std::isfinite(exit_price) || exit_price <= 0.0) {
        throw InvariantViolationError("exit price must be positive, got " + std::to_string(exit_price));
    }

    const double capital_before = state_.current_capital + open_committed_;

    const double gross = position.asset_quantity * exit_price;
    const double exit_fee = gross * cost_.costRate();
    const double net = gross - exit_fee;

    // 미투입 현금 + 순청산대금 (초기 자본으로 되돌리지 않는다)
    state_.current_capital += net;
    state_.total_fees += exit_fee;
    state_.realized_pnl += net - position.capital_committed;

    has_open_position_ = false;
    open_committed_ = 0.0;

    Trade trade;
    trade.entry_time = position.entry_time;
    trade.entry_price = position.entry_price;
    trade.exit_time = exit_time;
    trade.exit_price = exit_price;
    trade.quantity = position.asset_quantity;
    trade.capital_before = capital_before;
    trade.capital_after = state_.current_capital;
    trade.capital_committed = position.capital_committed;
    trade.net_proceeds = net;
    trade.entry_fee = position.entry_fee;
    trade.exit_fee = exit_fee;
    trade.pnl = net - position.capital_committed;
    trade.return_pct = (net - position.capital_committed) / position.capital_committed * 100.0;
    trade.exit_reason = reason;
    trade.holding_duration_ms = exit_time - position.entry_time;
    trade.signal_score = position.signal_score;

    updateDrawdown();
    equity_curve_.push_back({exit_time, state_.current_capital});

    LOG_DEBUG("Ledger exit: net {:.0f} | fee {:.0f} | pnl {:+.0f} ({:+.2f}%) | cash {:.0f}",
              net, exit_fee, trade.pnl, trade.return_pct, state_.current_capital);
    return trade;
}

void CapitalLedger::updateDrawdown() {
    // 청산 시점 기준 자본 곡선 (미실현 손익은 추적하지 않음)
    const double equity = bookEquity();
    state_.peak_capital = std::max(state_.peak_capital, equity);
    if (state_.peak_capital > 0.0) {
        const double drawdown = (state_.peak_capital - equity) / state_.peak_capital * 100.0;
        state_.max_drawdown_pct = std::max(state_.max_drawdown_pct, drawdown);
    }
}

} // namespace backtest
} // namespace capsim
