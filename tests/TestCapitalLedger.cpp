#include "backtest/CapitalLedger.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <variant>

using namespace capsim;
using namespace capsim::backtest;

namespace {
bool near(double a, double b, double tol) {
    return std::abs(a - b) <= tol;
}

CostModel upbitCost() {
    CostModel cost;
    cost.fee_rate = 0.0005;
    cost.slippage_rate = 0.0002;
    cost.min_order_value = 5000.0;
    return cost;
}
}

int main() {
    // 진입: 수수료를 먼저 빼고 가격으로 나눈다
    {
        CapitalLedger ledger(10000000.0, upbitCost());
        auto result = ledger.enter(ledger.currentCapital(), 1.0, 50000000.0, 1000);
        assert(std::holds_alternative<Position>(result));
        const auto& pos = std::get<Position>(result);

        assert(near(pos.capital_committed, 10000000.0, 1e-6));
        assert(near(pos.entry_fee, 7000.0, 1e-6));
        assert(near(pos.asset_quantity, (10000000.0 - 7000.0) / 50000000.0, 1e-12));
        assert(near(pos.peak_price_since_entry, 50000000.0, 1e-9));
        assert(!pos.trailing_armed);
        assert(ledger.hasOpenPosition());
        assert(near(ledger.currentCapital(), 0.0, 1e-6));
        assert(near(ledger.bookEquity(), 10000000.0, 1e-6));
    }

    // 같은 가격 왕복: -2*(fee+slippage)*100 근사, 절대 0 이상이 아님
    {
        CapitalLedger ledger(10000000.0, upbitCost());
        auto result = ledger.enter(ledger.currentCapital(), 1.0, 50000000.0, 1000);
        const Position pos = std::get<Position>(result);
        Trade trade = ledger.exit(pos, 50000000.0, 2000, ExitReason::TIMEOUT);

        assert(trade.return_pct < 0.0);
        assert(near(trade.return_pct, -2.0 * 0.0007 * 100.0, 0.001));
        assert(near(trade.pnl, trade.net_proceeds - trade.capital_committed, 1e-6));
        assert(trade.holding_duration_ms == 1000);
        assert(!ledger.hasOpenPosition());
        assert(near(ledger.state().total_fees, trade.entry_fee + trade.exit_fee, 1e-6));
    }

    // 부분 투입: 미투입 현금 + 순청산대금
    {
        CapitalLedger ledger(1000000.0, upbitCost());
        auto result = ledger.enter(ledger.currentCapital(), 0.5, 100.0, 0);
        const Position pos = std::get<Position>(result);
        assert(near(ledger.currentCapital(), 500000.0, 1e-6));

        Trade trade = ledger.exit(pos, 110.0, 10, ExitReason::TAKE_PROFIT);
        assert(near(trade.capital_before, 1000000.0, 1e-6));
        assert(near(ledger.currentCapital(), 500000.0 + trade.net_proceeds, 1e-6));
        assert(near(trade.capital_after, ledger.currentCapital(), 1e-9));
        assert(near(ledger.state().realized_pnl, trade.pnl, 1e-6));
    }

    // 복리: 두 번째 진입은 갱신된 자본을 사용
    {
        CapitalLedger ledger(10000000.0, upbitCost());
        const Position first = std::get<Position>(ledger.enter(ledger.currentCapital(), 1.0, 100.0, 0));
        Trade t1 = ledger.exit(first, 105.0, 10, ExitReason::TAKE_PROFIT);

        const Position second = std::get<Position>(ledger.enter(ledger.currentCapital(), 1.0, 100.0, 20));
        assert(near(second.capital_committed, t1.capital_after, 1e-6));
        assert(second.capital_committed > 10000000.0);
    }

    // 최소 주문 미달은 예외가 아니라 SkipReason
    {
        CapitalLedger ledger(10000.0, upbitCost());
        auto result = ledger.enter(ledger.currentCapital(), 0.4, 100.0, 0);
        assert(std::holds_alternative<SkipReason>(result));
        assert(std::get<SkipReason>(result) == SkipReason::INSUFFICIENT_CAPITAL);
        assert(!ledger.hasOpenPosition());
        assert(near(ledger.currentCapital(), 10000.0, 1e-9));

        assert(std::get<SkipReason>(ledger.enter(10000.0, 0.5, 0.0, 0)) == SkipReason::INVALID_PRICE);
        assert(std::get<SkipReason>(ledger.enter(10000.0, 1.5, 100.0, 0)) == SkipReason::INVALID_FRACTION);
        assert(std::get<SkipReason>(ledger.enter(10000.0, 0.0, 100.0, 0)) == SkipReason::INVALID_FRACTION);
    }

    // 불변식 위반은 예외
    {
        CapitalLedger ledger(10000000.0, upbitCost());
        const Position pos = std::get<Position>(ledger.enter(ledger.currentCapital(), 0.5, 100.0, 0));

        bool threw = false;
        try {
            ledger.enter(ledger.currentCapital(), 0.5, 100.0, 1);
        } catch (const DoubleEntryError&) {
            threw = true;
        }
        assert(threw);

        ledger.exit(pos, 100.0, 5, ExitReason::TIMEOUT);

        threw = false;
        try {
            ledger.exit(pos, 100.0, 6, ExitReason::TIMEOUT);
        } catch (const NoPositionError&) {
            threw = true;
        }
        assert(threw);

        // 오래된 자본 값으로 진입 시도
        threw = false;
        try {
            ledger.enter(20000000.0, 1.0, 100.0, 7);
        } catch (const InvariantViolationError&) {
            threw = true;
        }
        assert(threw);
    }

    // 최대 낙폭과 자본 곡선
    {
        CapitalLedger ledger(1000000.0, upbitCost(), 0);
        const Position a = std::get<Position>(ledger.enter(ledger.currentCapital(), 1.0, 100.0, 0));
        ledger.exit(a, 110.0, 10, ExitReason::TAKE_PROFIT);
        const double peak = ledger.currentCapital();

        const Position b = std::get<Position>(ledger.enter(ledger.currentCapital(), 1.0, 100.0, 20));
        ledger.exit(b, 90.0, 30, ExitReason::STOP_LOSS);
        const double trough = ledger.currentCapital();

        assert(near(ledger.state().peak_capital, peak, 1e-6));
        assert(near(ledger.state().max_drawdown_pct, (peak - trough) / peak * 100.0, 1e-9));
        assert(ledger.equityCurve().size() == 3);
        assert(ledger.equityCurve().front().capital == 1000000.0);
        assert(ledger.equityCurve().back().timestamp == 30);
    }

    {
        bool threw = false;
        try {
            CapitalLedger ledger(0.0, upbitCost());
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] CapitalLedger PASSED\n";
    return 0;
}
