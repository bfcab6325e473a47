#include "risk/PositionSizer.h"
#include "common/Logger.h"

#include <algorithm>

namespace capsim {
namespace risk {

const char* sizingBranchToString(SizingBranch branch) {
    switch (branch) {
        case SizingBranch::FIXED:                return "FIXED";
        case SizingBranch::INSUFFICIENT_HISTORY: return "INSUFFICIENT_HISTORY";
        case SizingBranch::NO_LOSSES:            return "NO_LOSSES";
        case SizingBranch::NON_POSITIVE_REWARD:  return "NON_POSITIVE_REWARD";
        case SizingBranch::NEGATIVE_KELLY:       return "NEGATIVE_KELLY";
        case SizingBranch::KELLY:                return "KELLY";
        default:                                 return "UNKNOWN";
    }
}

PositionSizer::PositionSizer(const SizingConfig& config)
    : config_(config)
{
}

KellyEstimate PositionSizer::estimate(const std::vector<backtest::Trade>& trade_history,
                                      const SizingConfig& config) {
    KellyEstimate est;

    if (config.mode == SizingMode::FIXED) {
        est.branch = SizingBranch::FIXED;
        est.fraction = config.fixed_fraction;
        return est;
    }

    // 롤링 윈도우: 가장 최근 lookback_trades 개
    const size_t window = static_cast<size_t>(std::max(config.lookback_trades, 1));
    const size_t begin = trade_history.size() > window ? trade_history.size() - window : 0;

    double win_sum = 0.0;
    double loss_sum = 0.0;
    for (size_t i = begin; i < trade_history.size(); ++i) {
        const double r = trade_history[i].return_pct;
        if (r > 0.0) {
            ++est.wins;
            win_sum += r;
        } else if (r < 0.0) {
            ++est.losses;
            loss_sum += -r;
        }
    }
    est.sample_size = static_cast<int>(trade_history.size() - begin);

    if (est.sample_size > 0) {
        est.win_rate = static_cast<double>(est.wins) / est.sample_size;
    }
    if (est.wins > 0) {
        est.avg_win_pct = win_sum / est.wins;
    }
    if (est.losses > 0) {
        est.avg_loss_pct = loss_sum / est.losses;
    }

    if (est.sample_size < config.min_trades) {
        est.branch = SizingBranch::INSUFFICIENT_HISTORY;
        est.fraction = std::clamp(config.default_fraction, config.min_fraction, config.max_fraction);
        return est;
    }

    if (est.losses == 0) {
        est.branch = SizingBranch::NO_LOSSES;
        est.fraction = config.max_fraction;
        return est;
    }

    est.reward_risk = est.avg_win_pct / est.avg_loss_pct;
    if (est.reward_risk <= 0.0) {
        // 이익 거래 없음 (b = 0)
        est.branch = SizingBranch::NON_POSITIVE_REWARD;
        est.fraction = config.max_fraction;
        return est;
    }

    // f = p - q / b
    est.raw_kelly = est.win_rate - (1.0 - est.win_rate) / est.reward_risk;

    if (est.raw_kelly < 0.0) {
        est.branch = SizingBranch::NEGATIVE_KELLY;
        est.fraction = config.min_fraction;
        return est;
    }

    est.damped_kelly = est.raw_kelly * config.effectiveDamping();
    est.branch = SizingBranch::KELLY;
    est.fraction = std::clamp(est.damped_kelly, config.min_fraction, config.max_fraction);
    return est;
}

double PositionSizer::size(const std::vector<backtest::Trade>& trade_history,
                           const Signal& signal,
                           const SizingConfig& bounds) {
    last_estimate_ = estimate(trade_history, bounds);

    LOG_DEBUG("Sizing @ {} (score {}): {} | n={} p={:.3f} b={:.3f} kelly={:.4f} -> fraction {:.4f}",
              signal.timestamp, signal.score.value_or(0.0),
              sizingBranchToString(last_estimate_.branch),
              last_estimate_.sample_size, last_estimate_.win_rate,
              last_estimate_.reward_risk, last_estimate_.raw_kelly,
              last_estimate_.fraction);

    return last_estimate_.fraction;
}

double PositionSizer::size(const std::vector<backtest::Trade>& trade_history, const Signal& signal) {
    return size(trade_history, signal, config_);
}

} // namespace risk
} // namespace capsim
