#pragma once

#include <optional>
#include <string>
#include <variant>

#include "common/Types.h"

namespace trendlab {
namespace strategy {

struct SmaCrossoverConfig {
    int short_window = 5;
    int long_window = 20;
    Timeframe timeframe = Timeframe::WEEKLY;
    PositionMode position_mode = PositionMode::LONG_ONLY;
};

struct MeanReversionZScoreConfig {
    int lookback = 20;
    double entry_z = 2.0;
    double exit_z = 0.5;

    // nullopt disables the rule; 0 is not a "disabled" marker
    std::optional<double> stop_loss_pct;
    std::optional<int> max_holding_bars;

    bool allow_short = true;
    Timeframe timeframe = Timeframe::WEEKLY;
};

// Exactly one strategy is active per request
using StrategyConfig = std::variant<SmaCrossoverConfig, MeanReversionZScoreConfig>;

// Throws ValidationError describing the first out-of-range parameter
void validateStrategyConfig(const StrategyConfig& config);

std::string strategyName(const StrategyConfig& config);
Timeframe strategyTimeframe(const StrategyConfig& config);
bool allowsShort(const StrategyConfig& config);

// Bars needed before the first defined signal
int warmupBars(const StrategyConfig& config);

} // namespace strategy
} // namespace trendlab
