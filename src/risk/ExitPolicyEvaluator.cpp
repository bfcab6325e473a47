#include "risk/ExitPolicyEvaluator.h"

#include <algorithm>

namespace capsim {
namespace risk {

const char* positionStateToString(PositionState state) {
    switch (state) {
        case PositionState::HOLDING:          return "HOLDING";
        case PositionState::EXIT_TAKE_PROFIT: return "EXIT_TAKE_PROFIT";
        case PositionState::EXIT_STOP_LOSS:   return "EXIT_STOP_LOSS";
        case PositionState::EXIT_TRAILING:    return "EXIT_TRAILING";
        case PositionState::EXIT_TIMEOUT:     return "EXIT_TIMEOUT";
        default:                              return "UNKNOWN";
    }
}

PositionState stateOf(const ExitDecision& decision) {
    if (!shouldExit(decision)) {
        return PositionState::HOLDING;
    }
    switch (reasonOf(decision)) {
        case backtest::ExitReason::TAKE_PROFIT:   return PositionState::EXIT_TAKE_PROFIT;
        case backtest::ExitReason::STOP_LOSS:     return PositionState::EXIT_STOP_LOSS;
        case backtest::ExitReason::TRAILING_STOP: return PositionState::EXIT_TRAILING;
        case backtest::ExitReason::TIMEOUT:       return PositionState::EXIT_TIMEOUT;
        default:                                  return PositionState::HOLDING;
    }
}

ExitPolicyEvaluator::ExitPolicyEvaluator(const ExitConfig& config)
    : config_(config)
{
}

double ExitPolicyEvaluator::stopLossPrice(const backtest::Position& position) const {
    return position.entry_price * (1.0 - config_.stop_loss);
}

double ExitPolicyEvaluator::takeProfitPrice(const backtest::Position& position) const {
    return position.entry_price * (1.0 + config_.take_profit);
}

void ExitPolicyEvaluator::updateTracking(backtest::Position& position, const Candle& bar,
                                         const ExitConfig& config) {
    position.peak_price_since_entry = std::max(position.peak_price_since_entry, bar.high);

    const auto& trailing = config.trailing_stop;
    if (trailing.enabled && !position.trailing_armed && position.entry_price > 0.0) {
        const double peak_profit =
            (position.peak_price_since_entry - position.entry_price) / position.entry_price;
        if (peak_profit >= trailing.activation_pct) {
            position.trailing_armed = true;
        }
    }
}

void ExitPolicyEvaluator::updateTracking(backtest::Position& position, const Candle& bar) const {
    updateTracking(position, bar, config_);
}

ExitDecision ExitPolicyEvaluator::evaluate(const backtest::Position& position, const Candle& bar) const {
    const double entry = position.entry_price;
    if (entry <= 0.0) {
        return backtest::Hold{};
    }

    // 1. 손절 우선: 같은 봉에서 익절/손절이 동시에 닿으면 손절
    //    갭으로 시가가 더 아래여도 체결가는 손절가로 고정
    if (config_.stop_loss > 0.0 && (entry - bar.low) / entry >= config_.stop_loss) {
        return backtest::Exit{backtest::ExitReason::STOP_LOSS, stopLossPrice(position)};
    }

    // 2. 익절 (지정가 체결 가정)
    if (config_.take_profit > 0.0 && (bar.high - entry) / entry >= config_.take_profit) {
        return backtest::Exit{backtest::ExitReason::TAKE_PROFIT, takeProfitPrice(position)};
    }

    // 3. 트레일링 스탑
    const auto& trailing = config_.trailing_stop;
    if (trailing.enabled && position.trailing_armed && trailing.trail_pct > 0.0) {
        const double pullback = (position.peak_price_since_entry - bar.close) / entry;
        if (pullback >= trailing.trail_pct) {
            return backtest::Exit{backtest::ExitReason::TRAILING_STOP, bar.close};
        }
    }

    // 4. 보유 시간 초과
    if (config_.max_hold_duration_ms > 0 &&
        bar.timestamp - position.entry_time >= config_.max_hold_duration_ms) {
        return backtest::Exit{backtest::ExitReason::TIMEOUT, bar.close};
    }

    return backtest::Hold{};
}

} // namespace risk
} // namespace capsim
