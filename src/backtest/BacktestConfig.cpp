#include "backtest/BacktestConfig.h"
#include "common/Errors.h"

#include <cmath>
#include <string>

namespace capsim {
namespace backtest {

namespace {
void require(bool condition, const std::string& message) {
    if (!condition) {
        throw ConfigError(message);
    }
}

bool isFiniteNonNegative(double v) {
    return std::isfinite(v) && v >= 0.0;
}
}

void BacktestConfig::validate() const {
    require(std::isfinite(initial_capital) && initial_capital > 0.0,
            "initial_capital must be positive");

    require(isFiniteNonNegative(cost.fee_rate), "cost.fee_rate must be >= 0");
    require(isFiniteNonNegative(cost.slippage_rate), "cost.slippage_rate must be >= 0");
    require(cost.costRate() < 1.0, "cost.fee_rate + cost.slippage_rate must be < 1");
    require(isFiniteNonNegative(cost.min_order_value), "cost.min_order_value must be >= 0");

    require(std::isfinite(sizing.min_fraction) && sizing.min_fraction >= 0.0,
            "sizing.min_fraction must be >= 0");
    require(std::isfinite(sizing.max_fraction) && sizing.max_fraction > 0.0 && sizing.max_fraction <= 1.0,
            "sizing.max_fraction must be in (0, 1]");
    require(sizing.min_fraction <= sizing.max_fraction,
            "sizing.min_fraction must not exceed sizing.max_fraction");
    require(sizing.default_fraction > 0.0 && sizing.default_fraction <= 1.0,
            "sizing.default_fraction must be in (0, 1]");
    require(sizing.fixed_fraction > 0.0 && sizing.fixed_fraction <= 1.0,
            "sizing.fixed_fraction must be in (0, 1]");
    require(sizing.damping > 0.0 && sizing.damping <= 1.0, "sizing.damping must be in (0, 1]");
    require(sizing.lookback_trades > 0, "sizing.lookback_trades must be positive");
    require(sizing.min_trades >= 0, "sizing.min_trades must be >= 0");

    require(std::isfinite(exit.take_profit), "exit.take_profit must be finite");
    require(std::isfinite(exit.stop_loss) && exit.stop_loss < 1.0, "exit.stop_loss must be < 1");
    require(exit.max_hold_duration_ms >= 0, "exit.max_hold_duration must be >= 0");
    if (exit.trailing_stop.enabled) {
        require(exit.trailing_stop.activation_pct >= 0.0, "exit.trailing_stop.activation_pct must be >= 0");
        require(exit.trailing_stop.trail_pct > 0.0, "exit.trailing_stop.trail_pct must be positive");
    }
}

} // namespace backtest
} // namespace capsim
