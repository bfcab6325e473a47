#include "backtest/BacktestEngine.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace capsim;
using namespace capsim::backtest;

namespace {
constexpr long long T0 = 1704067200000LL;   // 2024-01-01T00:00:00Z
constexpr long long H = MS_PER_HOUR;

bool near(double a, double b, double tol) {
    return std::abs(a - b) <= tol;
}

BacktestConfig allInConfig() {
    BacktestConfig config;
    config.initial_capital = 10000000.0;
    config.cost.fee_rate = 0.0005;
    config.cost.slippage_rate = 0.0002;
    config.sizing.mode = risk::SizingMode::FIXED;
    config.sizing.fixed_fraction = 1.0;
    config.exit.take_profit = 0.05;
    config.exit.stop_loss = 0.02;
    return config;
}

// 변동 없는 봉
Candle flat(double price, long long t) {
    return Candle(price, price * 1.001, price * 0.999, price, 1.0, t);
}

double sumPnl(const std::vector<Trade>& trades) {
    double sum = 0.0;
    for (const auto& t : trades) sum += t.net_proceeds - t.capital_committed;
    return sum;
}
}

int main() {
    // 익절 시나리오: 10,000,000 * 0.9993 / 50,000,000 * 52,500,000 * 0.9993
    {
        BacktestEngine engine(allInConfig());
        const std::vector<Candle> bars = {
            flat(50000000.0, T0),
            Candle(50000000.0, 52600000.0, 49900000.0, 52000000.0, 1.0, T0 + H),
        };
        const std::vector<Signal> signals = {Signal(T0, 50000000.0)};

        const auto report = engine.run(bars, signals);
        const double expected = (10000000.0 * (1.0 - 0.0007) / 50000000.0) * 52500000.0 * (1.0 - 0.0007);

        assert(report.stats.total_trades == 1);
        assert(report.trades[0].exit_reason == ExitReason::TAKE_PROFIT);
        assert(near(report.trades[0].exit_price, 52500000.0, 1e-6));
        assert(near(report.stats.final_capital, expected, 100.0));
        assert(near(report.stats.final_capital, 10485305.0, 100.0));
        assert(near(report.stats.total_return_pct, 4.853, 0.01));
        assert(report.stats.win_rate == 1.0);
        assert(report.stats.profit_factor == analytics::PROFIT_FACTOR_NO_LOSS);
        assert(report.trades[0].holding_duration_ms == H);
    }

    // 손절 시나리오: 49,000,000 청산, 약 -2.14%
    {
        BacktestEngine engine(allInConfig());
        const std::vector<Candle> bars = {
            flat(50000000.0, T0),
            Candle(50000000.0, 50200000.0, 48900000.0, 49200000.0, 1.0, T0 + H),
        };
        const auto report = engine.run(bars, {Signal(T0, 50000000.0)});

        assert(report.stats.total_trades == 1);
        assert(report.trades[0].exit_reason == ExitReason::STOP_LOSS);
        assert(near(report.trades[0].exit_price, 49000000.0, 1e-6));
        assert(near(report.trades[0].return_pct, -2.14, 0.01));
        assert(report.stats.win_rate == 0.0);
        assert(report.stats.profit_factor == 0.0);
        assert(report.stats.max_drawdown_pct > 2.0);
    }

    // 복리: 두 번째 거래는 첫 거래 후 자본을 투입
    {
        BacktestEngine engine(allInConfig());
        const std::vector<Candle> bars = {
            flat(100.0, T0),
            Candle(100.0, 106.0, 99.5, 105.0, 1.0, T0 + H),
            flat(100.0, T0 + 2 * H),
            Candle(100.0, 106.0, 99.5, 105.0, 1.0, T0 + 3 * H),
        };
        const std::vector<Signal> signals = {Signal(T0, 100.0), Signal(T0 + 2 * H, 100.0)};
        const auto report = engine.run(bars, signals);

        assert(report.trades.size() == 2);
        const Trade& first = report.trades[0];
        const Trade& second = report.trades[1];
        assert(near(second.capital_committed, first.capital_after, 1e-6));
        assert(second.capital_committed > 10000000.0);
        assert(near(second.return_pct, first.return_pct, 1e-9));
        // 복리 수익률은 거래별 수익률 합보다 크다
        assert(report.stats.total_return_pct > first.return_pct + second.return_pct);
    }

    // 자본 보존 (Kelly 사이징, 부분 투입 포함)
    {
        BacktestConfig config = allInConfig();
        config.sizing.mode = risk::SizingMode::KELLY;
        config.sizing.min_trades = 2;
        BacktestEngine engine(config);

        std::vector<Candle> bars;
        std::vector<Signal> signals;
        for (int i = 0; i < 8; ++i) {
            const long long t = T0 + i * 2 * H;
            bars.push_back(flat(100.0, t));
            const bool win = (i % 3 != 0);
            bars.push_back(win ? Candle(100.0, 106.0, 99.5, 104.0, 1.0, t + H)
                               : Candle(100.0, 100.5, 97.0, 97.5, 1.0, t + H));
            signals.push_back(Signal(t, 100.0));
        }
        const auto report = engine.run(bars, signals);

        assert(report.stats.total_trades == 8);
        assert(near(report.stats.final_capital, 10000000.0 + sumPnl(report.trades), 1e-4));
        assert(near(report.stats.final_capital, report.equity_curve.back().capital, 1e-9));
        assert(report.stats.winning_trades == 5);
        assert(report.stats.losing_trades == 3);
        // 처음 두 거래는 기록 부족 -> default_fraction
        assert(near(report.trades[0].capital_committed, 10000000.0 * 0.3, 1e-6));
    }

    // 신호 없음
    {
        BacktestEngine engine(allInConfig());
        const auto report = engine.run({flat(100.0, T0), flat(100.0, T0 + H)}, {});
        assert(report.stats.total_trades == 0);
        assert(report.stats.win_rate == 0.0);
        assert(report.stats.sharpe_ratio == 0.0);
        assert(report.stats.final_capital == 10000000.0);
        assert(report.stats.total_return_pct == 0.0);
    }

    // 데이터 종료 강제 청산 + 보유 중 신호 무시
    {
        BacktestEngine engine(allInConfig());
        const std::vector<Candle> bars = {
            flat(100.0, T0), flat(101.0, T0 + H), flat(102.0, T0 + 2 * H),
        };
        const std::vector<Signal> signals = {
            Signal(T0, 100.0), Signal(T0 + H, 101.0), Signal(T0 + 2 * H, 102.0),
        };
        const auto report = engine.run(bars, signals);

        assert(report.stats.total_trades == 1);
        assert(report.trades[0].exit_reason == ExitReason::END_OF_PERIOD);
        assert(near(report.trades[0].exit_price, 102.0, 1e-9));
        assert(report.trades[0].exit_time == T0 + 2 * H);
        assert(report.signal_funnel.entered == 1);
        assert(report.signal_funnel.ignored_position_open == 2);
        assert(report.stats.exit_reason_counts.at("END_OF_PERIOD") == 1);

        int skipped_events = 0;
        for (const auto& e : engine.journalEvents()) {
            if (e.type == core::JournalEventType::SIGNAL_SKIPPED) {
                assert(e.payload.at("reason") == "POSITION_OPEN");
                ++skipped_events;
            }
        }
        assert(skipped_events == 2);
        assert(engine.journalEvents().front().type == core::JournalEventType::POSITION_OPENED);
        assert(engine.journalEvents().back().type == core::JournalEventType::RUN_COMPLETED);
    }

    // 진입 시각과 같은 시각의 봉은 청산 판단 대상이 아님
    {
        BacktestEngine engine(allInConfig());
        const std::vector<Candle> bars = {
            Candle(100.0, 100.5, 90.0, 100.0, 1.0, T0),      // 손절 범위지만 진입 시각 봉
            Candle(100.0, 106.0, 99.5, 104.0, 1.0, T0 + H),
        };
        const auto report = engine.run(bars, {Signal(T0, 100.0)});
        assert(report.trades.size() == 1);
        assert(report.trades[0].exit_reason == ExitReason::TAKE_PROFIT);
    }

    // 봉 중간에 진입: 다음 봉(시가 시각이 진입 이후)은 진입 봉이라도 청산 판단
    {
        BacktestEngine engine(allInConfig());
        const std::vector<Candle> bars = {
            flat(100.0, T0),
            Candle(100.0, 100.5, 80.0, 82.0, 1.0, T0 + H),     // 진입 이후 급락
            Candle(82.0, 106.0, 99.0, 104.0, 1.0, T0 + 2 * H),
        };
        const auto report = engine.run(bars, {Signal(T0 + H / 2, 100.0)});
        const double expected = 0.98 * (1.0 - 0.0007) * (1.0 - 0.0007) * 100.0 - 100.0;

        assert(report.trades.size() == 1);
        assert(report.trades[0].entry_time == T0 + H / 2);
        assert(report.trades[0].exit_reason == ExitReason::STOP_LOSS);
        assert(near(report.trades[0].exit_price, 98.0, 1e-9));
        assert(report.trades[0].exit_time == T0 + H);
        assert(near(report.trades[0].return_pct, expected, 1e-6));
        assert(near(report.stats.total_return_pct, -2.14, 0.01));
        assert(report.signal_funnel.entered == 1);
    }

    // 청산 봉 시각의 신호는 재진입, 청산 이전 시각의 신호는 무시
    {
        BacktestEngine engine(allInConfig());
        const std::vector<Candle> bars = {
            flat(100.0, T0),
            Candle(100.0, 106.0, 99.5, 104.0, 1.0, T0 + 2 * H),
            flat(104.0, T0 + 3 * H),
        };
        const std::vector<Signal> signals = {
            Signal(T0, 100.0), Signal(T0 + H, 103.0), Signal(T0 + 2 * H, 104.0),
        };
        const auto report = engine.run(bars, signals);
        assert(report.trades.size() == 2);
        assert(report.trades[0].exit_reason == ExitReason::TAKE_PROFIT);
        assert(report.trades[1].entry_time == T0 + 2 * H);
        assert(report.trades[1].entry_price == 104.0);
        assert(report.trades[1].exit_reason == ExitReason::END_OF_PERIOD);
        assert(report.signal_funnel.ignored_position_open == 1);
    }

    // 범위 밖 신호 집계
    {
        BacktestEngine engine(allInConfig());
        const std::vector<Signal> signals = {
            Signal(T0 - H, 100.0), Signal(T0 + 10 * H, 100.0),
        };
        const auto report = engine.run({flat(100.0, T0), flat(100.0, T0 + H)}, signals);
        assert(report.stats.total_trades == 0);
        assert(report.signal_funnel.before_first_bar == 1);
        assert(report.signal_funnel.after_last_bar == 1);
        assert(report.signal_funnel.total == 2);
    }

    // 최소 주문 미달은 스킵되고 실행은 계속
    {
        BacktestConfig config = allInConfig();
        config.cost.min_order_value = 20000000.0;
        BacktestEngine engine(config);
        const auto report = engine.run({flat(100.0, T0), flat(100.0, T0 + H)}, {Signal(T0, 100.0)});
        assert(report.stats.total_trades == 0);
        assert(report.signal_funnel.skipped_insufficient_capital == 1);
        assert(report.stats.final_capital == 10000000.0);
    }

    // 잘못된 입력은 실행 전에 거부
    {
        BacktestEngine engine(allInConfig());
        bool threw = false;
        try {
            engine.run({flat(100.0, T0), flat(100.0, T0)}, {});
        } catch (const MalformedInputError&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            engine.run({flat(100.0, T0)}, {Signal(T0 + H, 100.0), Signal(T0, 100.0)});
        } catch (const MalformedInputError&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            engine.run({Candle(100.0, 99.0, 101.0, 100.0, 1.0, T0)}, {});
        } catch (const MalformedInputError&) {
            threw = true;
        }
        assert(threw);
    }

    // 재실행은 동일한 결과 (상태 초기화)
    {
        BacktestEngine engine(allInConfig());
        const std::vector<Candle> bars = {
            flat(100.0, T0), Candle(100.0, 106.0, 99.5, 104.0, 1.0, T0 + H),
        };
        const std::vector<Signal> signals = {Signal(T0, 100.0)};
        const auto first = engine.run(bars, signals);
        const auto second = engine.run(bars, signals);
        assert(first.stats.final_capital == second.stats.final_capital);
        assert(second.trades.size() == 1);
    }

    // 리포트 JSON 필드
    {
        BacktestEngine engine(allInConfig());
        const std::vector<Candle> bars = {
            flat(100.0, T0), Candle(100.0, 106.0, 99.5, 104.0, 1.0, T0 + H),
        };
        const std::vector<Signal> signals = {Signal(T0, 100.0)};
        const auto j = engine.run(bars, signals).toJson();

        for (const char* key : {"initial_capital", "final_capital", "total_return_pct", "total_trades",
                                "win_rate", "avg_return_pct", "sharpe_ratio", "max_drawdown_pct",
                                "profit_factor", "trades", "signal_funnel", "equity_curve", "kelly"}) {
            assert(j.contains(key));
        }
        assert(j["total_trades"].get<int>() == 1);
        assert(j["exit_reasons"]["TAKE_PROFIT"].get<int>() == 1);
        assert(j["kelly"]["last_sizing_branch"] == "FIXED");
        assert(j["signal_funnel"]["entered"].get<int>() == 1);
        assert(j["equity_curve"].size() == 2);

        const auto& trade = j["trades"][0];
        assert(trade["entry_time"] == "2024-01-01T00:00:00Z");
        assert(trade["exit_time"] == "2024-01-01T01:00:00Z");
        assert(trade["exit_reason"] == "TAKE_PROFIT");
        assert(near(trade["holding_duration"].get<double>(), 3600.0, 1e-9));
        assert(trade["signal_score"].is_null());
    }

    // 잘못된 설정
    {
        BacktestConfig config = allInConfig();
        config.sizing.min_fraction = 0.6;
        config.sizing.max_fraction = 0.5;
        bool threw = false;
        try {
            BacktestEngine engine(config);
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] BacktestEngine PASSED\n";
    return 0;
}
