#include "strategy/StrategyConfig.h"
#include "common/Errors.h"

#include <algorithm>
#include <cmath>
#include <type_traits>

namespace trendlab {
namespace strategy {

namespace {
template<class> inline constexpr bool always_false_v = false;

void validate(const SmaCrossoverConfig& cfg) {
    if (cfg.short_window < 1) {
        throw ValidationError("short_window must be >= 1");
    }
    if (cfg.long_window <= cfg.short_window) {
        throw ValidationError("long_window must be greater than short_window");
    }
}

void validate(const MeanReversionZScoreConfig& cfg) {
    if (cfg.lookback < 5) {
        throw ValidationError("mr_lookback must be >= 5");
    }
    if (!std::isfinite(cfg.entry_z) || cfg.entry_z <= 0.0) {
        throw ValidationError("mr_entry_z must be > 0");
    }
    if (!std::isfinite(cfg.exit_z) || cfg.exit_z < 0.0) {
        throw ValidationError("mr_exit_z must be >= 0");
    }
    if (cfg.stop_loss_pct.has_value() &&
        (!(*cfg.stop_loss_pct > 0.0) || !(*cfg.stop_loss_pct < 1.0))) {
        throw ValidationError("mr_stop_loss_pct must be in (0, 1)");
    }
    if (cfg.max_holding_bars.has_value() && *cfg.max_holding_bars < 1) {
        throw ValidationError("mr_max_holding_bars must be >= 1");
    }
}
}

void validateStrategyConfig(const StrategyConfig& config) {
    std::visit([](const auto& cfg) { validate(cfg); }, config);
}

std::string strategyName(const StrategyConfig& config) {
    return std::visit([](const auto& cfg) -> std::string {
        using T = std::decay_t<decltype(cfg)>;
        if constexpr (std::is_same_v<T, SmaCrossoverConfig>) {
            return "sma_crossover";
        } else if constexpr (std::is_same_v<T, MeanReversionZScoreConfig>) {
            return "mean_reversion_zscore";
        } else {
            static_assert(always_false_v<T>, "unhandled strategy config");
        }
    }, config);
}

Timeframe strategyTimeframe(const StrategyConfig& config) {
    return std::visit([](const auto& cfg) { return cfg.timeframe; }, config);
}

bool allowsShort(const StrategyConfig& config) {
    return std::visit([](const auto& cfg) -> bool {
        using T = std::decay_t<decltype(cfg)>;
        if constexpr (std::is_same_v<T, SmaCrossoverConfig>) {
            return cfg.position_mode == PositionMode::LONG_SHORT;
        } else {
            return cfg.allow_short;
        }
    }, config);
}

int warmupBars(const StrategyConfig& config) {
    return std::visit([](const auto& cfg) -> int {
        using T = std::decay_t<decltype(cfg)>;
        if constexpr (std::is_same_v<T, SmaCrossoverConfig>) {
            return std::max(cfg.short_window, cfg.long_window);
        } else {
            return cfg.lookback;
        }
    }, config);
}

} // namespace strategy
} // namespace trendlab
