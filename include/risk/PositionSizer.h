#pragma once

#include <vector>

#include "backtest/BacktestTypes.h"
#include "risk/RiskConfig.h"

namespace capsim {
namespace risk {

// 어떤 분기로 비율이 결정됐는지 (로그/리포트용)
enum class SizingBranch {
    FIXED,
    INSUFFICIENT_HISTORY,   // min_trades 미만 -> default_fraction
    NO_LOSSES,              // reward/risk 정의 불가 -> max_fraction
    NON_POSITIVE_REWARD,    // 이익 거래 없음 (reward/risk <= 0) -> max_fraction
    NEGATIVE_KELLY,         // -> min_fraction
    KELLY
};

const char* sizingBranchToString(SizingBranch branch);

struct KellyEstimate {
    int sample_size = 0;
    int wins = 0;
    int losses = 0;
    double win_rate = 0.0;
    double avg_win_pct = 0.0;
    double avg_loss_pct = 0.0;         // 절대값
    double reward_risk = 0.0;
    double raw_kelly = 0.0;
    double damped_kelly = 0.0;
    double fraction = 0.0;             // 최종 투입 비율
    SizingBranch branch = SizingBranch::INSUFFICIENT_HISTORY;
};

class PositionSizer {
public:
    explicit PositionSizer(const SizingConfig& config);

    // 최근 lookback_trades 개 거래로 Kelly 비율 계산 후 [min_fraction, max_fraction] 로 clamp.
    // signal 은 현재 비율에 영향을 주지 않는다.
    double size(const std::vector<backtest::Trade>& trade_history,
                const Signal& signal,
                const SizingConfig& bounds);
    double size(const std::vector<backtest::Trade>& trade_history, const Signal& signal);

    // 부수효과 없는 추정
    static KellyEstimate estimate(const std::vector<backtest::Trade>& trade_history,
                                  const SizingConfig& config);

    const KellyEstimate& lastEstimate() const { return last_estimate_; }
    const SizingConfig& config() const { return config_; }

private:
    SizingConfig config_;
    KellyEstimate last_estimate_;
};

} // namespace risk
} // namespace capsim
