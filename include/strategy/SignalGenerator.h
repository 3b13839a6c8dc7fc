#pragma once

#include <optional>
#include <vector>

#include "analytics/TechnicalIndicators.h"
#include "common/Types.h"
#include "strategy/StrategyConfig.h"

namespace trendlab {
namespace strategy {

// Signal evaluated with data through the bar's close. The position state machine
// applies it one bar later.
struct SignalBar {
    bool ready = false;

    // Trend strategies: the state the strategy wants to hold
    std::optional<PositionState> target;

    // Threshold strategies: conditions whose meaning depends on the current state
    bool enter_long = false;
    bool exit_long = false;
    bool enter_short = false;
    bool exit_short = false;

    // z-score, or short SMA minus long SMA
    std::optional<double> value;
};

struct CrossoverEvent {
    size_t bar_index = 0;
    PositionState state = PositionState::CASH;
};

struct SignalSeries {
    std::vector<SignalBar> bars;
    std::optional<size_t> first_ready;      // nullopt: history never covers the longest window
    std::vector<CrossoverEvent> crossovers; // ordering changes only, not every bar
};

class SignalGenerator {
public:
    static SignalSeries generate(const std::vector<double>& closes, const StrategyConfig& config);

    static SignalSeries smaCrossover(const std::vector<double>& closes, const SmaCrossoverConfig& config);
    static SignalSeries meanReversion(const std::vector<double>& closes, const MeanReversionZScoreConfig& config);

    // Threshold evaluation on a precomputed z-score series
    static SignalSeries fromZScores(const analytics::IndicatorSeries& zscores,
                                    const MeanReversionZScoreConfig& config);
};

} // namespace strategy
} // namespace trendlab
