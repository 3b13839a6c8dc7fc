#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "strategy/StrategyConfig.h"

namespace trendlab {
namespace backtest {

struct BacktestRequest {
    std::string ticker;
    std::optional<Date> start_date;   // warm-up history begins here; horizon start when unset
    std::optional<Date> end_date;     // today when unset
    double initial_capital = 10000.0;
    std::string horizon = "1Y";
    strategy::StrategyConfig strategy = strategy::SmaCrossoverConfig{};
};

struct PortfolioBacktestRequest {
    std::vector<std::string> tickers;
    std::optional<Date> start_date;
    std::optional<Date> end_date;
    double initial_capital = 10000.0;
    std::string horizon = "1Y";
    bool use_ranking = false;
    int top_n = 1;
};

struct BacktestResponse {
    SeriesResult strategy;
    SeriesResult buy_and_hold;
    std::vector<SeriesResult> benchmarks;
};

struct PortfolioBacktestResponse {
    SeriesResult strategy;
    SeriesResult buy_and_hold;
    SeriesResult benchmark;
    std::vector<PortfolioHolding> current_holdings;
};

struct DateRange {
    Date start;
    Date end;
};

} // namespace backtest
} // namespace trendlab
