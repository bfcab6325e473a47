#include "analytics/StatisticsAggregator.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace capsim {
namespace analytics {

namespace {
double finiteOr(double value, double fallback = 0.0) {
    return std::isfinite(value) ? value : fallback;
}
}

double StatisticsAggregator::sharpeRatio(const std::vector<double>& returns_pct) {
    if (returns_pct.size() < 2) {
        return 0.0;
    }

    const double n = static_cast<double>(returns_pct.size());
    const double mean = std::accumulate(returns_pct.begin(), returns_pct.end(), 0.0) / n;

    double variance = 0.0;
    for (double r : returns_pct) {
        variance += (r - mean) * (r - mean);
    }
    variance /= (n - 1.0);
    const double std_dev = std::sqrt(variance);

    if (!(std_dev > 1e-12)) {
        return 0.0;
    }
    return finiteOr(mean / std_dev);
}

double StatisticsAggregator::maxDrawdownPct(double initial_capital,
                                            const std::vector<backtest::EquityPoint>& equity_curve) {
    double peak = initial_capital;
    double max_dd = 0.0;
    for (const auto& point : equity_curve) {
        peak = std::max(peak, point.capital);
        if (peak > 0.0) {
            max_dd = std::max(max_dd, (peak - point.capital) / peak * 100.0);
        }
    }
    return finiteOr(max_dd);
}

double StatisticsAggregator::kellyCriterion(double win_rate, double avg_win, double avg_loss_abs) {
    if (avg_loss_abs <= 0.0 || win_rate <= 0.0 || win_rate >= 1.0) {
        return 0.0;
    }
    const double b = avg_win / avg_loss_abs;
    if (!(b > 0.0)) {
        return 0.0;
    }
    const double kelly = (win_rate * b - (1.0 - win_rate)) / b;
    return std::clamp(finiteOr(kelly), 0.0, 1.0);
}

PerformanceStats StatisticsAggregator::aggregate(double initial_capital,
                                                 const std::vector<backtest::Trade>& trades) {
    return aggregate(initial_capital, trades, {});
}

PerformanceStats StatisticsAggregator::aggregate(double initial_capital,
                                                 const std::vector<backtest::Trade>& trades,
                                                 const std::vector<backtest::EquityPoint>& equity_curve) {
    PerformanceStats stats;
    stats.initial_capital = initial_capital;
    stats.total_trades = static_cast<int>(trades.size());

    std::vector<backtest::EquityPoint> curve = equity_curve;
    if (curve.empty()) {
        curve.push_back({trades.empty() ? 0 : trades.front().entry_time, initial_capital});
        for (const auto& trade : trades) {
            curve.push_back({trade.exit_time, trade.capital_after});
        }
    }

    if (!trades.empty()) {
        stats.final_capital = trades.back().capital_after;
    } else {
        stats.final_capital = curve.back().capital;
    }

    // 복리 수익률: 거래별 수익률 합이 아니라 최종/초기 자본
    if (initial_capital > 0.0) {
        stats.total_return_pct =
            finiteOr((stats.final_capital - initial_capital) / initial_capital * 100.0);
    }
    stats.max_drawdown_pct = maxDrawdownPct(initial_capital, curve);

    if (trades.empty()) {
        return stats;
    }

    std::vector<double> returns;
    returns.reserve(trades.size());

    double gross_profit = 0.0;
    double gross_loss_abs = 0.0;
    double win_return_sum = 0.0;
    double loss_return_sum = 0.0;
    double pnl_sum = 0.0;
    double holding_hours_sum = 0.0;

    for (const auto& trade : trades) {
        returns.push_back(trade.return_pct);
        pnl_sum += trade.pnl;
        holding_hours_sum += trade.holdingHours();
        stats.total_fees += trade.entry_fee + trade.exit_fee;
        stats.exit_reason_counts[backtest::exitReasonToString(trade.exit_reason)]++;

        if (trade.pnl > 0.0) {
            stats.winning_trades++;
            gross_profit += trade.pnl;
            win_return_sum += trade.return_pct;
        } else if (trade.pnl < 0.0) {
            stats.losing_trades++;
            gross_loss_abs += -trade.pnl;
            loss_return_sum += trade.return_pct;
        }
    }

    const double n = static_cast<double>(trades.size());
    stats.win_rate = static_cast<double>(stats.winning_trades) / n;
    stats.avg_return_pct = finiteOr(std::accumulate(returns.begin(), returns.end(), 0.0) / n);
    stats.expectancy = finiteOr(pnl_sum / n);
    stats.avg_holding_hours = finiteOr(holding_hours_sum / n);
    if (stats.winning_trades > 0) {
        stats.avg_win_pct = finiteOr(win_return_sum / stats.winning_trades);
    }
    if (stats.losing_trades > 0) {
        stats.avg_loss_pct = finiteOr(loss_return_sum / stats.losing_trades);
    }

    if (gross_loss_abs > 0.0) {
        stats.profit_factor = finiteOr(gross_profit / gross_loss_abs, PROFIT_FACTOR_NO_LOSS);
    } else if (gross_profit > 0.0) {
        stats.profit_factor = PROFIT_FACTOR_NO_LOSS;
    }

    stats.sharpe_ratio = sharpeRatio(returns);

    stats.kelly.full = kellyCriterion(stats.win_rate, stats.avg_win_pct, std::abs(stats.avg_loss_pct));
    stats.kelly.half = stats.kelly.full * 0.5;
    stats.kelly.quarter = stats.kelly.full * 0.25;

    return stats;
}

} // namespace analytics
} // namespace capsim
