#pragma once

#include <variant>

#include "backtest/BacktestTypes.h"
#include "risk/RiskConfig.h"

namespace capsim {
namespace risk {

// 열린 포지션의 상태. HOLDING 외에는 모두 종료 상태
enum class PositionState {
    HOLDING,
    EXIT_TAKE_PROFIT,
    EXIT_STOP_LOSS,
    EXIT_TRAILING,
    EXIT_TIMEOUT
};

const char* positionStateToString(PositionState state);

using ExitDecision = std::variant<backtest::Hold, backtest::Exit>;

inline bool shouldExit(const ExitDecision& decision) {
    return std::holds_alternative<backtest::Exit>(decision);
}

// shouldExit() 가 false 면 std::bad_variant_access
inline backtest::ExitReason reasonOf(const ExitDecision& decision) {
    return std::get<backtest::Exit>(decision).reason;
}

inline double priceOf(const ExitDecision& decision) {
    return std::get<backtest::Exit>(decision).price;
}

PositionState stateOf(const ExitDecision& decision);

// 봉 하나에 대한 청산 판단. 자본은 건드리지 않는다.
// 순서: 손절(저가) -> 익절(고가) -> 트레일링(종가) -> 보유시간 초과(종가)
class ExitPolicyEvaluator {
public:
    explicit ExitPolicyEvaluator(const ExitConfig& config);

    ExitDecision evaluate(const backtest::Position& position, const Candle& bar) const;

    // 고점 갱신 + 트레일링 활성화. evaluate() 전에 엔진이 호출
    void updateTracking(backtest::Position& position, const Candle& bar) const;
    static void updateTracking(backtest::Position& position, const Candle& bar,
                               const ExitConfig& config);

    double stopLossPrice(const backtest::Position& position) const;
    double takeProfitPrice(const backtest::Position& position) const;

    const ExitConfig& config() const { return config_; }

private:
    ExitConfig config_;
};

} // namespace risk
} // namespace capsim
