#pragma once

#include <string>

#include "risk/RiskConfig.h"

namespace capsim {
namespace backtest {

// 거래 비용 모델 (Upbit KRW 마켓 기준 기본값)
struct CostModel {
    double fee_rate = 0.0005;          // 0.05%
    double slippage_rate = 0.0002;     // 0.02%
    double min_order_value = 5000.0;   // 최소 주문 5천원

    // 진입/청산 각각에 적용되는 비용률
    double costRate() const { return fee_rate + slippage_rate; }
};

// 한 번의 백테스트 실행에 필요한 전체 설정
struct BacktestConfig {
    std::string market = "KRW-BTC";
    double initial_capital = 10000000.0;
    CostModel cost;
    risk::SizingConfig sizing;
    risk::ExitConfig exit;

    // 잘못된 값이면 ConfigError
    void validate() const;
};

// 시나리오 = 이름 + 기본 설정에 부분 override 를 적용한 설정
struct ScenarioConfig {
    std::string name;
    BacktestConfig config;
};

} // namespace backtest
} // namespace capsim
