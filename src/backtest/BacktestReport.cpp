#include "backtest/BacktestReport.h"
#include "common/TimeUtils.h"

namespace capsim {
namespace backtest {

nlohmann::json tradeToJson(const Trade& trade) {
    nlohmann::json j;
    j["entry_time"] = utils::formatIso8601(trade.entry_time);
    j["entry_price"] = trade.entry_price;
    j["exit_time"] = utils::formatIso8601(trade.exit_time);
    j["exit_price"] = trade.exit_price;
    j["quantity"] = trade.quantity;
    j["capital_before"] = trade.capital_before;
    j["capital_after"] = trade.capital_after;
    j["capital_committed"] = trade.capital_committed;
    j["net_proceeds"] = trade.net_proceeds;
    j["entry_fee"] = trade.entry_fee;
    j["exit_fee"] = trade.exit_fee;
    j["pnl"] = trade.pnl;
    j["return_pct"] = trade.return_pct;
    j["exit_reason"] = exitReasonToString(trade.exit_reason);
    // 초 단위
    j["holding_duration"] = static_cast<double>(trade.holding_duration_ms) / MS_PER_SECOND;
    if (trade.signal_score) {
        j["signal_score"] = *trade.signal_score;
    } else {
        j["signal_score"] = nullptr;
    }
    return j;
}

nlohmann::json BacktestReport::toJson() const {
    nlohmann::json j;
    j["market"] = market;
    j["initial_capital"] = stats.initial_capital;
    j["final_capital"] = stats.final_capital;
    j["total_return_pct"] = stats.total_return_pct;
    j["total_trades"] = stats.total_trades;
    j["win_rate"] = stats.win_rate;
    j["avg_return_pct"] = stats.avg_return_pct;
    j["sharpe_ratio"] = stats.sharpe_ratio;
    j["max_drawdown_pct"] = stats.max_drawdown_pct;
    j["profit_factor"] = stats.profit_factor;

    j["winning_trades"] = stats.winning_trades;
    j["losing_trades"] = stats.losing_trades;
    j["avg_win_pct"] = stats.avg_win_pct;
    j["avg_loss_pct"] = stats.avg_loss_pct;
    j["avg_holding_hours"] = stats.avg_holding_hours;
    j["total_fees"] = stats.total_fees;
    j["expectancy"] = stats.expectancy;
    j["exit_reasons"] = stats.exit_reason_counts;
    j["kelly"] = {
        {"full", stats.kelly.full},
        {"half", stats.kelly.half},
        {"quarter", stats.kelly.quarter},
        {"last_sizing_branch", risk::sizingBranchToString(last_sizing.branch)},
        {"last_fraction", last_sizing.fraction}
    };
    j["signal_funnel"] = {
        {"total", signal_funnel.total},
        {"entered", signal_funnel.entered},
        {"ignored_position_open", signal_funnel.ignored_position_open},
        {"skipped_insufficient_capital", signal_funnel.skipped_insufficient_capital},
        {"skipped_invalid", signal_funnel.skipped_invalid},
        {"before_first_bar", signal_funnel.before_first_bar},
        {"after_last_bar", signal_funnel.after_last_bar}
    };

    nlohmann::json curve = nlohmann::json::array();
    for (const auto& point : equity_curve) {
        curve.push_back({{"time", utils::formatIso8601(point.timestamp)}, {"capital", point.capital}});
    }
    j["equity_curve"] = std::move(curve);

    nlohmann::json trade_list = nlohmann::json::array();
    for (const auto& trade : trades) {
        trade_list.push_back(tradeToJson(trade));
    }
    j["trades"] = std::move(trade_list);
    return j;
}

} // namespace backtest
} // namespace capsim
