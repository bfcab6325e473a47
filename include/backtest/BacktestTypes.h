#pragma once

#include <optional>
#include <string>
#include <variant>

#include "common/Types.h"

namespace capsim {
namespace backtest {

enum class ExitReason {
    TAKE_PROFIT,
    STOP_LOSS,
    TRAILING_STOP,
    TIMEOUT,
    END_OF_PERIOD       // 데이터 종료 시 엔진이 강제 청산
};

inline const char* exitReasonToString(ExitReason reason) {
    switch (reason) {
        case ExitReason::TAKE_PROFIT:   return "TAKE_PROFIT";
        case ExitReason::STOP_LOSS:     return "STOP_LOSS";
        case ExitReason::TRAILING_STOP: return "TRAILING_STOP";
        case ExitReason::TIMEOUT:       return "TIMEOUT";
        case ExitReason::END_OF_PERIOD: return "END_OF_PERIOD";
        default:                        return "UNKNOWN";
    }
}

// 진입이 거절된 이유 (예외가 아니라 값으로 반환)
enum class SkipReason {
    INSUFFICIENT_CAPITAL,   // committed < min_order_value
    INVALID_PRICE,
    INVALID_FRACTION
};

inline const char* skipReasonToString(SkipReason reason) {
    switch (reason) {
        case SkipReason::INSUFFICIENT_CAPITAL: return "INSUFFICIENT_CAPITAL";
        case SkipReason::INVALID_PRICE:        return "INVALID_PRICE";
        case SkipReason::INVALID_FRACTION:     return "INVALID_FRACTION";
        default:                               return "UNKNOWN";
    }
}

// 열린 포지션 (엔진이 단독 소유)
struct Position {
    long long entry_time = 0;
    double entry_price = 0.0;
    double asset_quantity = 0.0;
    double capital_committed = 0.0;
    double entry_fee = 0.0;
    double peak_price_since_entry = 0.0;
    bool trailing_armed = false;
    std::optional<double> signal_score;
};

// 청산 완료된 거래 기록 (append-only)
struct Trade {
    long long entry_time = 0;
    double entry_price = 0.0;
    long long exit_time = 0;
    double exit_price = 0.0;
    double quantity = 0.0;

    double capital_before = 0.0;       // 진입 직전 현금
    double capital_after = 0.0;        // 청산 직후 현금
    double capital_committed = 0.0;
    double net_proceeds = 0.0;         // 청산 대금 - 청산 비용
    double entry_fee = 0.0;
    double exit_fee = 0.0;
    double pnl = 0.0;                  // net_proceeds - capital_committed
    double return_pct = 0.0;

    ExitReason exit_reason = ExitReason::END_OF_PERIOD;
    long long holding_duration_ms = 0;
    std::optional<double> signal_score;

    double holdingHours() const {
        return static_cast<double>(holding_duration_ms) / static_cast<double>(MS_PER_HOUR);
    }
};

struct EquityPoint {
    long long timestamp = 0;
    double capital = 0.0;
};

// CapitalLedger 만 갱신
struct CapitalState {
    double current_capital = 0.0;      // 미투입 현금
    double peak_capital = 0.0;
    double max_drawdown_pct = 0.0;
    double realized_pnl = 0.0;
    double total_fees = 0.0;
};

// 신호 처리 집계 (무시된 신호도 흔적을 남긴다)
struct SignalFunnel {
    int total = 0;
    int entered = 0;
    int ignored_position_open = 0;
    int skipped_insufficient_capital = 0;
    int skipped_invalid = 0;
    int before_first_bar = 0;
    int after_last_bar = 0;
};

// 진입 결과: 포지션 또는 스킵 사유
using EntryResult = std::variant<Position, SkipReason>;

// 엔진 한 스텝의 결정
struct Hold {};
struct Enter {
    double fraction = 0.0;
};
struct Exit {
    ExitReason reason = ExitReason::END_OF_PERIOD;
    double price = 0.0;
};

using Decision = std::variant<Hold, Enter, Exit>;

} // namespace backtest
} // namespace capsim
