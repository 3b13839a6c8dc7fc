#pragma once

#include <string>
#include <vector>

#include "common/Date.h"

namespace trendlab {

using Price = double;
using Amount = double;

enum class Timeframe { WEEKLY, DAILY };
enum class PositionMode { LONG_ONLY, LONG_SHORT };
enum class PositionState { CASH, LONG, SHORT };

struct Bar {
    Date date;
    Price close;

    Bar() : close(0) {}
    Bar(const Date& d, Price c) : date(d), close(c) {}
};

struct EquityPoint {
    Date date;
    Amount equity;

    EquityPoint() : equity(0) {}
    EquityPoint(const Date& d, Amount e) : date(d), equity(e) {}
};

// max_drawdown is a non-negative fraction (0.25 == 25% below the running peak)
struct MetricSummary {
    double cumulative_return = 0.0;
    double cagr = 0.0;
    double max_drawdown = 0.0;
    double volatility = 0.0;
    double sharpe_ratio = 0.0;
};

struct SeriesResult {
    std::string symbol;
    std::vector<EquityPoint> equity_curve;
    MetricSummary metrics;
};

struct PortfolioHolding {
    std::string symbol;
    double weight = 0.0;
    bool in_market = false;
};

inline const char* positionStateToString(PositionState state) {
    switch (state) {
        case PositionState::CASH: return "CASH";
        case PositionState::LONG: return "LONG";
        case PositionState::SHORT: return "SHORT";
    }
    return "UNKNOWN";
}

inline const char* timeframeToString(Timeframe timeframe) {
    return (timeframe == Timeframe::DAILY) ? "daily" : "weekly";
}

inline const char* positionModeToString(PositionMode mode) {
    return (mode == PositionMode::LONG_SHORT) ? "long_short" : "long_only";
}

inline int periodsPerYear(Timeframe timeframe) {
    return (timeframe == Timeframe::DAILY) ? 252 : 52;
}

inline std::vector<double> extractCloses(const std::vector<Bar>& bars) {
    std::vector<double> closes;
    closes.reserve(bars.size());
    for (const auto& bar : bars) {
        closes.push_back(bar.close);
    }
    return closes;
}

} // namespace trendlab
