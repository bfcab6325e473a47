#include "backtest/ScenarioRunner.h"
#include "backtest/BacktestEngine.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <atomic>
#include <thread>

namespace capsim {
namespace backtest {

ScenarioRunner::ScenarioRunner(int max_workers)
    : max_workers_(max_workers)
{
    if (max_workers_ <= 0) {
        max_workers_ = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    }
}

ScenarioResult ScenarioRunner::runOne(const ScenarioConfig& scenario,
                                      const std::vector<Candle>& bars,
                                      const std::vector<Signal>& signals) {
    ScenarioResult result;
    result.name = scenario.name;

    // 한 시나리오의 실패가 다른 시나리오를 멈추지 않도록 에러를 결과에 기록
    try {
        BacktestEngine engine(scenario.config, scenario.name);
        result.report = engine.run(bars, signals);
        result.journal = engine.journalEvents();
    } catch (const BacktestError& e) {
        result.error = e.what();
        LOG_ERROR("[{}] Scenario failed: {}", scenario.name, e.what());
    } catch (const std::exception& e) {
        result.error = std::string("unexpected error: ") + e.what();
        LOG_ERROR("[{}] Scenario failed with unexpected error: {}", scenario.name, e.what());
    }
    return result;
}

std::vector<ScenarioResult> ScenarioRunner::runAll(const std::vector<ScenarioConfig>& scenarios,
                                                   const std::vector<Candle>& bars,
                                                   const std::vector<Signal>& signals) const {
    std::vector<ScenarioResult> results(scenarios.size());
    if (scenarios.empty()) {
        return results;
    }

    const size_t workers = std::min(static_cast<size_t>(max_workers_), scenarios.size());
    LOG_INFO("Running {} scenarios on {} workers", scenarios.size(), workers);

    std::atomic<size_t> next_index{0};
    auto worker = [&]() {
        for (size_t i = next_index.fetch_add(1); i < scenarios.size(); i = next_index.fetch_add(1)) {
            // 각 슬롯은 한 스레드만 쓴다
            results[i] = runOne(scenarios[i], bars, signals);
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (size_t t = 0; t < workers; ++t) {
        threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    const auto failed = std::count_if(results.begin(), results.end(),
                                      [](const ScenarioResult& r) { return !r.ok(); });
    if (failed > 0) {
        LOG_WARN("{} of {} scenarios failed", failed, scenarios.size());
    }
    return results;
}

} // namespace backtest
} // namespace capsim
