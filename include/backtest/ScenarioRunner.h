#pragma once

#include <optional>
#include <string>
#include <vector>

#include "backtest/BacktestConfig.h"
#include "backtest/BacktestReport.h"
#include "common/Types.h"
#include "core/model/JournalTypes.h"

namespace capsim {
namespace backtest {

struct ScenarioResult {
    std::string name;
    std::optional<BacktestReport> report;      // 실패 시 비어 있음
    std::vector<core::JournalEvent> journal;
    std::string error;

    bool ok() const { return report.has_value(); }
};

// 같은 입력(읽기 전용)에 대해 서로 다른 설정의 백테스트를 병렬 실행.
// 시나리오마다 BacktestEngine 을 따로 만든다. 결과는 입력 순서대로 반환.
class ScenarioRunner {
public:
    // max_workers <= 0 이면 hardware_concurrency
    explicit ScenarioRunner(int max_workers = 0);

    std::vector<ScenarioResult> runAll(const std::vector<ScenarioConfig>& scenarios,
                                       const std::vector<Candle>& bars,
                                       const std::vector<Signal>& signals) const;

    int workerCount() const { return max_workers_; }

private:
    static ScenarioResult runOne(const ScenarioConfig& scenario,
                                 const std::vector<Candle>& bars,
                                 const std::vector<Signal>& signals);

    int max_workers_;
};

} // namespace backtest
} // namespace capsim
