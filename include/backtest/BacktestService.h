#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "backtest/BacktestTypes.h"
#include "data/IBarProvider.h"
#include "strategy/PositionStateMachine.h"
#include "strategy/SignalGenerator.h"

namespace trendlab {
namespace backtest {

struct ServiceSettings {
    std::vector<std::string> benchmark_symbols{"SPY", "QQQ", "DIA"};
    std::string portfolio_benchmark = "SPY";
    int momentum_lookback_bars = 12;
    bool parallel_symbols = true;
    strategy::SmaCrossoverConfig portfolio_strategy;   // per-symbol strategy in portfolio mode
    std::optional<Date> today;   // fixed "today" for reproducible runs
};

// Output of the per-symbol pipeline over the full fetched history
struct SymbolRun {
    std::string symbol;
    std::vector<Bar> bars;
    strategy::SignalSeries signals;
    strategy::PositionPath path;
    std::vector<EquityPoint> equity_curve;   // starts at the first ready signal
};

// Validates requests, fetches bars, runs signal -> position -> equity -> metrics per symbol
// (in parallel when enabled), and assembles strategy, buy-and-hold and benchmark series.
// Holds no per-request state; concurrent calls are safe when the provider is.
class BacktestService {
public:
    BacktestService(std::shared_ptr<data::IBarProvider> provider, ServiceSettings settings);

    BacktestResponse runBacktest(const BacktestRequest& request) const;
    PortfolioBacktestResponse runPortfolioBacktest(const PortfolioBacktestRequest& request) const;

    // Upper-cased, trimmed; throws ValidationError on empty or malformed symbols
    static std::string normalizeSymbol(const std::string& symbol);
    // Normalized, first occurrence kept; throws ValidationError when nothing remains
    static std::vector<std::string> normalizeSymbols(const std::vector<std::string>& symbols);

    static bool isValidHorizon(const std::string& horizon);
    // [end - horizon, end]; throws ValidationError for unknown codes
    static DateRange resolveHorizon(const std::string& horizon, const Date& end);

    static SymbolRun runSymbol(const std::string& symbol,
                               std::vector<Bar> bars,
                               const strategy::StrategyConfig& config,
                               double initial_capital);

    // Points dated >= window_start, scaled so the first kept point equals initial_capital
    static std::vector<EquityPoint> clipAndRebase(const std::vector<EquityPoint>& curve,
                                                  const Date& window_start,
                                                  double initial_capital);

private:
    struct ResolvedWindow {
        DateRange fetch;     // includes warm-up history
        Date window_start;   // first reported date
    };

    ResolvedWindow resolveWindow(const std::optional<Date>& start_date,
                                 const std::optional<Date>& end_date,
                                 const std::string& horizon) const;

    SeriesResult makeSeries(const std::string& symbol,
                            const std::vector<EquityPoint>& curve,
                            const Date& window_start,
                            double initial_capital,
                            Timeframe timeframe) const;

    SeriesResult benchmarkSeries(const std::string& symbol,
                                 const ResolvedWindow& window,
                                 double initial_capital,
                                 Timeframe timeframe) const;

    void logTransitions(const SymbolRun& run) const;

    std::shared_ptr<data::IBarProvider> provider_;
    ServiceSettings settings_;
};

} // namespace backtest
} // namespace trendlab
