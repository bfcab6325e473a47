#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "backtest/BacktestConfig.h"
#include "backtest/BacktestReport.h"
#include "backtest/BacktestTypes.h"
#include "backtest/CapitalLedger.h"
#include "common/Types.h"
#include "core/model/JournalTypes.h"
#include "risk/ExitPolicyEvaluator.h"
#include "risk/PositionSizer.h"

namespace capsim {
namespace backtest {

// 단일 자산, 단일 포지션 시뮬레이션.
// 원장/사이저/포지션은 엔진 인스턴스가 소유하며 실행 간 공유하지 않는다.
class BacktestEngine {
public:
    explicit BacktestEngine(const BacktestConfig& config, std::string run_id = "base");

    // 입력 검증 후 봉 단위로 진행. 호출마다 상태를 새로 만든다.
    BacktestReport run(const std::vector<Candle>& bars, const std::vector<Signal>& signals);

    const std::vector<Trade>& trades() const { return trades_; }
    const SignalFunnel& signalFunnel() const { return funnel_; }
    const std::vector<core::JournalEvent>& journalEvents() const { return journal_; }
    const BacktestConfig& config() const { return config_; }
    const std::string& runId() const { return run_id_; }

private:
    void reset(long long start_time);

    // 봉 하나: 청산 판단 -> 도착한 신호 소비 (봉 시각 이전 진입이면 같은 봉에서 청산 판단)
    void processBar(const Candle& bar, const std::vector<Signal>& signals, size_t& next_signal);

    void evaluateOpenPosition(const Candle& bar);
    Decision decideExit(const Candle& bar);
    Decision decideEntry(const Signal& signal);

    void openPosition(const Signal& signal, const Enter& enter);
    void closePosition(const Exit& exit, long long exit_time);
    void recordSkip(const Signal& signal, const std::string& reason);
    void journal(core::JournalEventType type, long long ts_ms, nlohmann::json payload);

    BacktestReport buildReport() const;

    BacktestConfig config_;
    std::string run_id_;

    risk::PositionSizer sizer_;
    risk::ExitPolicyEvaluator exit_policy_;
    std::unique_ptr<CapitalLedger> ledger_;

    std::optional<Position> position_;
    long long first_bar_time_ = 0;
    long long last_exit_time_ = 0;

    std::vector<Trade> trades_;
    SignalFunnel funnel_;
    std::vector<core::JournalEvent> journal_;
};

} // namespace backtest
} // namespace capsim
