#pragma once

#include "common/Types.h"

namespace capsim {
namespace risk {

// 포지션 크기 결정 방식
enum class SizingMode {
    KELLY,          // 최근 거래 기록 기반 Kelly
    FIXED           // 모든 신호에 fixed_fraction 사용 (전액 복리 모드 = 1.0)
};

// 포지션 사이징 설정
struct SizingConfig {
    SizingMode mode = SizingMode::KELLY;
    double min_fraction = 0.10;
    double max_fraction = 0.50;
    bool half_kelly = true;
    double damping = 0.5;              // half_kelly=true 일 때 적용되는 감쇠 계수
    int lookback_trades = 50;          // 롤링 윈도우 길이
    int min_trades = 10;               // 이보다 적으면 default_fraction
    double default_fraction = 0.30;
    double fixed_fraction = 1.0;

    double effectiveDamping() const { return half_kelly ? damping : 1.0; }
};

// 트레일링 스탑: activation_pct 도달 후 고점 대비 trail_pct 하락 시 청산
struct TrailingStopConfig {
    bool enabled = false;
    double activation_pct = 0.03;
    double trail_pct = 0.01;
};

// 청산 정책 설정 (0 이하 값은 해당 트리거 비활성화)
struct ExitConfig {
    double take_profit = 0.05;
    double stop_loss = 0.02;
    TrailingStopConfig trailing_stop;
    long long max_hold_duration_ms = 72 * MS_PER_HOUR;
};

} // namespace risk
} // namespace capsim
