#include "backtest/BacktestEngine.h"
#include "analytics/StatisticsAggregator.h"
#include "backtest/DataHistory.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/TimeUtils.h"

namespace capsim {
namespace backtest {

BacktestEngine::BacktestEngine(const BacktestConfig& config, std::string run_id)
    : config_(config)
    , run_id_(std::move(run_id))
    , sizer_(config.sizing)
    , exit_policy_(config.exit)
{
    config_.validate();
}

void BacktestEngine::reset(long long start_time) {
    ledger_ = std::make_unique<CapitalLedger>(config_.initial_capital, config_.cost, start_time);
    position_.reset();
    first_bar_time_ = start_time;
    last_exit_time_ = start_time;
    trades_.clear();
    funnel_ = SignalFunnel{};
    journal_.clear();
}

BacktestReport BacktestEngine::run(const std::vector<Candle>& bars, const std::vector<Signal>& signals) {
    // 시뮬레이션 시작 전에 입력을 거부 (실행 중 발견 금지)
    DataHistory::validateCandles(bars);
    DataHistory::validateSignals(signals);

    reset(bars.empty() ? 0 : bars.front().timestamp);
    funnel_.total = static_cast<int>(signals.size());

    LOG_INFO("[{}] Starting backtest: {} candles, {} signals, capital {:.0f}",
             run_id_, bars.size(), signals.size(), config_.initial_capital);

    size_t next_signal = 0;
    for (const Candle& bar : bars) {
        processBar(bar, signals, next_signal);
    }

    // 데이터 종료: 열린 포지션은 마지막 종가로 강제 청산
    if (position_) {
        const Candle& last = bars.back();
        LOG_INFO("[{}] End of data, force exit at {:.0f}", run_id_, last.close);
        closePosition(Exit{ExitReason::END_OF_PERIOD, last.close}, last.timestamp);
    }

    for (; next_signal < signals.size(); ++next_signal) {
        funnel_.after_last_bar++;
        recordSkip(signals[next_signal], "AFTER_LAST_BAR");
    }
    if (bars.empty() && !signals.empty()) {
        LOG_WARN("[{}] No candles supplied, {} signals cannot be executed", run_id_, signals.size());
    }

    BacktestReport report = buildReport();

    journal(core::JournalEventType::RUN_COMPLETED,
            bars.empty() ? 0 : bars.back().timestamp,
            {
                {"final_capital", report.stats.final_capital},
                {"total_return_pct", report.stats.total_return_pct},
                {"total_trades", report.stats.total_trades},
                {"ignored_position_open", funnel_.ignored_position_open}
            });

    LOG_INFO("[{}] Backtest completed: {} trades | return {:+.2f}% | win rate {:.1f}% | MDD {:.2f}%",
             run_id_, report.stats.total_trades, report.stats.total_return_pct,
             report.stats.win_rate * 100.0, report.stats.max_drawdown_pct);
    LOG_INFO("[{}] Final capital: {:.0f}", run_id_, report.stats.final_capital);
    return report;
}

void BacktestEngine::processBar(const Candle& bar,
                                const std::vector<Signal>& signals, size_t& next_signal) {
    // 1. 열린 포지션 청산 판단
    evaluateOpenPosition(bar);

    // 2. 이 봉까지 도착한 신호 소비
    while (next_signal < signals.size() && signals[next_signal].timestamp <= bar.timestamp) {
        const Signal& signal = signals[next_signal++];

        if (signal.timestamp < first_bar_time_) {
            funnel_.before_first_bar++;
            recordSkip(signal, "BEFORE_FIRST_BAR");
            continue;
        }

        // 청산 시각 이전에 도착한 신호는 포지션 보유 중이었던 것
        if (position_ || signal.timestamp < last_exit_time_) {
            // 단일 포지션 정책: 보유 중 신호는 무시하되 집계한다
            funnel_.ignored_position_open++;
            LOG_DEBUG("[{}] Signal @ {} ignored: position open",
                      run_id_, utils::formatIso8601(signal.timestamp));
            recordSkip(signal, "POSITION_OPEN");
            continue;
        }

        Decision entry_decision = decideEntry(signal);
        if (const auto* enter = std::get_if<Enter>(&entry_decision)) {
            openPosition(signal, *enter);
            // 봉 시각(시가 시각)보다 늦은 진입이면 이 봉 전체가 진입 이후 구간
            evaluateOpenPosition(bar);
        }
    }
}

void BacktestEngine::evaluateOpenPosition(const Candle& bar) {
    Decision exit_decision = decideExit(bar);
    if (const auto* exit = std::get_if<Exit>(&exit_decision)) {
        closePosition(*exit, bar.timestamp);
    }
}

Decision BacktestEngine::decideExit(const Candle& bar) {
    // 진입 시각 이하로 찍힌 봉은 범위가 진입 시점보다 앞설 수 있으므로 제외
    if (!position_ || bar.timestamp <= position_->entry_time) {
        return Hold{};
    }

    exit_policy_.updateTracking(*position_, bar);
    const risk::ExitDecision decision = exit_policy_.evaluate(*position_, bar);
    if (risk::shouldExit(decision)) {
        LOG_DEBUG("[{}] Exit triggered on bar {}: {}", run_id_, utils::formatIso8601(bar.timestamp),
                  risk::positionStateToString(risk::stateOf(decision)));
        return std::get<Exit>(decision);
    }
    return Hold{};
}

Decision BacktestEngine::decideEntry(const Signal& signal) {
    const double fraction = sizer_.size(trades_, signal, config_.sizing);
    return Enter{fraction};
}

void BacktestEngine::openPosition(const Signal& signal, const Enter& enter) {
    EntryResult result = ledger_->enter(ledger_->currentCapital(), enter.fraction,
                                        signal.price, signal.timestamp);

    if (const auto* skip = std::get_if<SkipReason>(&result)) {
        if (*skip == SkipReason::INSUFFICIENT_CAPITAL) {
            funnel_.skipped_insufficient_capital++;
        } else {
            funnel_.skipped_invalid++;
        }
        LOG_WARN("[{}] Signal @ {} skipped: {} (cash {:.0f}, fraction {:.3f})",
                 run_id_, utils::formatIso8601(signal.timestamp), skipReasonToString(*skip),
                 ledger_->currentCapital(), enter.fraction);
        recordSkip(signal, skipReasonToString(*skip));
        return;
    }

    position_ = std::get<Position>(std::move(result));
    position_->signal_score = signal.score;
    funnel_.entered++;

    const auto& sizing = sizer_.lastEstimate();
    LOG_INFO("[{}] Position opened @ {:.0f} | committed {:.0f} ({:.1f}%, {}) | qty {:.8f}",
             run_id_, position_->entry_price, position_->capital_committed,
             enter.fraction * 100.0, risk::sizingBranchToString(sizing.branch),
             position_->asset_quantity);

    journal(core::JournalEventType::POSITION_OPENED, position_->entry_time,
            {
                {"entry_price", position_->entry_price},
                {"quantity", position_->asset_quantity},
                {"capital_committed", position_->capital_committed},
                {"entry_fee", position_->entry_fee},
                {"fraction", enter.fraction},
                {"sizing_branch", risk::sizingBranchToString(sizing.branch)}
            });
}

void BacktestEngine::closePosition(const Exit& exit, long long exit_time) {
    if (!position_) {
        throw NoPositionError("closePosition() without an open position");
    }

    Trade trade = ledger_->exit(*position_, exit.price, exit_time, exit.reason);
    position_.reset();
    last_exit_time_ = exit_time;

    LOG_INFO("[{}] Position closed ({}) @ {:.0f} | pnl {:+.0f} ({:+.2f}%) | capital {:.0f}",
             run_id_, exitReasonToString(trade.exit_reason), trade.exit_price,
             trade.pnl, trade.return_pct, trade.capital_after);

    Logger::getInstance().logTrade(config_.market,
                                   utils::formatIso8601(trade.entry_time),
                                   utils::formatIso8601(trade.exit_time),
                                   trade.entry_price, trade.exit_price, trade.quantity,
                                   trade.pnl, trade.return_pct,
                                   exitReasonToString(trade.exit_reason));

    journal(core::JournalEventType::POSITION_CLOSED, trade.exit_time, tradeToJson(trade));
    trades_.push_back(std::move(trade));
}

void BacktestEngine::recordSkip(const Signal& signal, const std::string& reason) {
    journal(core::JournalEventType::SIGNAL_SKIPPED, signal.timestamp,
            {{"reason", reason}, {"price", signal.price}});
}

void BacktestEngine::journal(core::JournalEventType type, long long ts_ms, nlohmann::json payload) {
    core::JournalEvent event;
    event.ts_ms = ts_ms;
    event.type = type;
    event.run_id = run_id_;
    event.market = config_.market;
    event.payload = std::move(payload);
    journal_.push_back(std::move(event));
}

BacktestReport BacktestEngine::buildReport() const {
    BacktestReport report;
    report.market = config_.market;
    report.trades = trades_;
    report.equity_curve = ledger_->equityCurve();
    report.signal_funnel = funnel_;
    report.last_sizing = sizer_.lastEstimate();
    report.stats = analytics::StatisticsAggregator::aggregate(
        config_.initial_capital, trades_, report.equity_curve);
    return report;
}

} // namespace backtest
} // namespace capsim
