#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "backtest/BacktestTypes.h"
#include "strategy/StrategyConfig.h"

namespace trendlab {
namespace api {

// Values used for fields the request leaves out
struct RequestDefaults {
    double initial_capital = 10000.0;
    std::string horizon = "1Y";
    strategy::SmaCrossoverConfig sma_crossover;
    strategy::MeanReversionZScoreConfig mean_reversion;
};

// Throw ValidationError naming the offending field
backtest::BacktestRequest parseBacktestRequest(const nlohmann::json& body,
                                               const RequestDefaults& defaults = {});
backtest::PortfolioBacktestRequest parsePortfolioRequest(const nlohmann::json& body,
                                                         const RequestDefaults& defaults = {});

nlohmann::json toJson(const MetricSummary& metrics);
nlohmann::json toJson(const SeriesResult& series);
nlohmann::json toJson(const PortfolioHolding& holding);
nlohmann::json toJson(const backtest::BacktestResponse& response);
nlohmann::json toJson(const backtest::PortfolioBacktestResponse& response);

nlohmann::json errorJson(int status_code, const std::string& kind, const std::string& message);
nlohmann::json healthJson();

} // namespace api
} // namespace trendlab
