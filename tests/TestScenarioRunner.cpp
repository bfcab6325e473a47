#include "backtest/BacktestEngine.h"
#include "backtest/ScenarioRunner.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

using namespace capsim;
using namespace capsim::backtest;

namespace {
constexpr long long T0 = 1704067200000LL;
constexpr long long H = MS_PER_HOUR;

// 완만한 상승 + 주기적 급락
std::vector<Candle> makeBars() {
    std::vector<Candle> bars;
    double price = 50000000.0;
    for (int i = 0; i < 200; ++i) {
        const double drift = (i % 17 == 16) ? -0.035 : 0.004;
        const double next = price * (1.0 + drift);
        const double high = std::max(price, next) * 1.002;
        const double low = std::min(price, next) * 0.998;
        bars.emplace_back(price, high, low, next, 1.0, T0 + i * H);
        price = next;
    }
    return bars;
}

std::vector<Signal> makeSignals(const std::vector<Candle>& bars) {
    std::vector<Signal> signals;
    for (size_t i = 0; i < bars.size(); i += 5) {
        signals.emplace_back(bars[i].timestamp, bars[i].close);
    }
    return signals;
}

ScenarioConfig scenario(const std::string& name, double tp, double sl) {
    ScenarioConfig s;
    s.name = name;
    s.config.exit.take_profit = tp;
    s.config.exit.stop_loss = sl;
    s.config.sizing.min_trades = 3;
    return s;
}
}

int main() {
    const auto bars = makeBars();
    const auto signals = makeSignals(bars);

    std::vector<ScenarioConfig> scenarios = {
        scenario("tp3_sl1", 0.03, 0.01),
        scenario("tp5_sl2", 0.05, 0.02),
        scenario("tp8_sl3", 0.08, 0.03),
        scenario("no_tp", 0.0, 0.02),
    };
    ScenarioConfig broken = scenario("broken", 0.05, 0.02);
    broken.config.sizing.min_fraction = 0.9;
    broken.config.sizing.max_fraction = 0.5;
    scenarios.insert(scenarios.begin() + 2, broken);

    // 1. 병렬 실행 결과 == 순차 실행 결과, 입력 순서 유지
    {
        ScenarioRunner runner(4);
        assert(runner.workerCount() == 4);
        const auto results = runner.runAll(scenarios, bars, signals);
        assert(results.size() == scenarios.size());

        for (size_t i = 0; i < scenarios.size(); ++i) {
            assert(results[i].name == scenarios[i].name);
            if (scenarios[i].name == "broken") {
                assert(!results[i].ok());
                assert(!results[i].error.empty());
                assert(results[i].journal.empty());
                continue;
            }

            assert(results[i].ok());
            BacktestEngine engine(scenarios[i].config, scenarios[i].name);
            const auto expected = engine.run(bars, signals);
            const auto& got = *results[i].report;
            assert(got.stats.total_trades == expected.stats.total_trades);
            assert(got.stats.final_capital == expected.stats.final_capital);
            assert(got.trades.size() == expected.trades.size());
            assert(got.signal_funnel.entered == expected.signal_funnel.entered);
            assert(results[i].journal.size() == engine.journalEvents().size());
            for (const auto& event : results[i].journal) {
                assert(event.run_id == scenarios[i].name);
            }
        }
    }

    // 2. 단일 워커도 동일
    {
        ScenarioRunner sequential(1);
        ScenarioRunner parallel(8);
        const auto a = sequential.runAll(scenarios, bars, signals);
        const auto b = parallel.runAll(scenarios, bars, signals);
        assert(a.size() == b.size());
        for (size_t i = 0; i < a.size(); ++i) {
            assert(a[i].ok() == b[i].ok());
            if (a[i].ok()) {
                assert(a[i].report->stats.final_capital == b[i].report->stats.final_capital);
            }
        }
    }

    // 3. 빈 시나리오 목록
    {
        ScenarioRunner runner;
        assert(runner.workerCount() >= 1);
        assert(runner.runAll({}, bars, signals).empty());
    }

    std::cout << "[TEST] ScenarioRunner PASSED\n";
    return 0;
}
