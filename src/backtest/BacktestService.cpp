#include "backtest/BacktestService.h"
#include "backtest/EquitySimulator.h"
#include "backtest/MetricsCalculator.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "data/SeriesAlignment.h"
#include "portfolio/PortfolioAllocator.h"
#include "portfolio/PortfolioEquitySimulator.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <functional>
#include <future>
#include <set>
#include <stdexcept>

namespace trendlab {
namespace backtest {

namespace {
constexpr size_t kMaxSymbolLength = 15;
const char* const kPortfolioSymbol = "PORTFOLIO";
const char* const kEqualWeightSymbol = "EQUAL_WEIGHT";

// Runs every task and returns results in task order. Exceptions surface from get().
template<typename T>
std::vector<T> runAll(std::vector<std::function<T()>> tasks, bool parallel) {
    std::vector<T> results;
    results.reserve(tasks.size());

    if (!parallel || tasks.size() < 2) {
        for (auto& task : tasks) {
            results.push_back(task());
        }
        return results;
    }

    std::vector<std::future<T>> futures;
    futures.reserve(tasks.size());
    for (auto& task : tasks) {
        futures.push_back(std::async(std::launch::async, task));
    }
    for (auto& future : futures) {
        results.push_back(future.get());
    }
    return results;
}

void validateCapital(double initial_capital) {
    if (!std::isfinite(initial_capital) || initial_capital <= 0.0) {
        throw ValidationError("initial_capital must be > 0");
    }
}
}

BacktestService::BacktestService(std::shared_ptr<data::IBarProvider> provider, ServiceSettings settings)
    : provider_(std::move(provider)), settings_(std::move(settings)) {
    if (!provider_) {
        throw std::invalid_argument("BacktestService requires a bar provider");
    }
    if (settings_.momentum_lookback_bars < 1) {
        throw std::invalid_argument("momentum_lookback_bars must be >= 1");
    }
}

std::string BacktestService::normalizeSymbol(const std::string& symbol) {
    std::string out;
    out.reserve(symbol.size());
    for (unsigned char c : symbol) {
        if (std::isspace(c)) {
            continue;
        }
        out.push_back(static_cast<char>(std::toupper(c)));
    }

    if (out.empty()) {
        throw ValidationError("symbol must not be empty");
    }
    if (out.size() > kMaxSymbolLength) {
        throw ValidationError("symbol is too long: " + out);
    }
    for (char c : out) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '-') {
            throw ValidationError("symbol contains invalid characters: " + out);
        }
    }
    return out;
}

std::vector<std::string> BacktestService::normalizeSymbols(const std::vector<std::string>& symbols) {
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto& raw : symbols) {
        const std::string symbol = normalizeSymbol(raw);
        if (seen.insert(symbol).second) {
            out.push_back(symbol);
        }
    }

    if (out.empty()) {
        throw ValidationError("tickers must contain at least one symbol");
    }
    return out;
}

bool BacktestService::isValidHorizon(const std::string& horizon) {
    return horizon == "1M" || horizon == "6M" || horizon == "1Y" ||
           horizon == "5Y" || horizon == "10Y";
}

DateRange BacktestService::resolveHorizon(const std::string& horizon, const Date& end) {
    DateRange range;
    range.end = end;
    if (horizon == "1M") {
        range.start = end.addMonths(-1);
    } else if (horizon == "6M") {
        range.start = end.addMonths(-6);
    } else if (horizon == "1Y") {
        range.start = end.addYears(-1);
    } else if (horizon == "5Y") {
        range.start = end.addYears(-5);
    } else if (horizon == "10Y") {
        range.start = end.addYears(-10);
    } else {
        throw ValidationError("Unsupported horizon: " + horizon);
    }
    return range;
}

BacktestService::ResolvedWindow BacktestService::resolveWindow(const std::optional<Date>& start_date,
                                                               const std::optional<Date>& end_date,
                                                               const std::string& horizon) const {
    const Date end = end_date ? *end_date : (settings_.today ? *settings_.today : Date::today());
    const DateRange horizon_range = resolveHorizon(horizon, end);

    ResolvedWindow window;
    window.fetch.end = end;
    if (start_date) {
        if (*start_date >= end) {
            throw ValidationError("start_date must be before end_date");
        }
        window.fetch.start = *start_date;
        window.window_start = std::max(*start_date, horizon_range.start);
    } else {
        window.fetch.start = horizon_range.start;
        window.window_start = horizon_range.start;
    }
    return window;
}

SymbolRun BacktestService::runSymbol(const std::string& symbol,
                                     std::vector<Bar> bars,
                                     const strategy::StrategyConfig& config,
                                     double initial_capital) {
    SymbolRun run;
    run.symbol = symbol;
    run.bars = std::move(bars);

    const auto closes = extractCloses(run.bars);
    run.signals = strategy::SignalGenerator::generate(closes, config);
    run.path = strategy::PositionStateMachine::resolve(run.signals, closes, config);

    if (run.signals.first_ready) {
        run.equity_curve = EquitySimulator::simulate(run.bars, run.path.realized,
                                                     initial_capital, *run.signals.first_ready);
    }
    return run;
}

std::vector<EquityPoint> BacktestService::clipAndRebase(const std::vector<EquityPoint>& curve,
                                                        const Date& window_start,
                                                        double initial_capital) {
    const auto first = std::find_if(curve.begin(), curve.end(), [&](const EquityPoint& point) {
        return point.date >= window_start;
    });

    std::vector<EquityPoint> out(first, curve.end());
    if (out.empty() || out.front().equity <= 0.0) {
        return out;
    }

    const double scale = initial_capital / out.front().equity;
    if (scale != 1.0) {
        for (auto& point : out) {
            point.equity *= scale;
        }
    }
    return out;
}

SeriesResult BacktestService::makeSeries(const std::string& symbol,
                                         const std::vector<EquityPoint>& curve,
                                         const Date& window_start,
                                         double initial_capital,
                                         Timeframe timeframe) const {
    SeriesResult series;
    series.symbol = symbol;
    series.equity_curve = clipAndRebase(curve, window_start, initial_capital);
    series.metrics = MetricsCalculator::compute(series.equity_curve, periodsPerYear(timeframe));
    return series;
}

SeriesResult BacktestService::benchmarkSeries(const std::string& symbol,
                                              const ResolvedWindow& window,
                                              double initial_capital,
                                              Timeframe timeframe) const {
    const auto bars = provider_->getBars(symbol, window.fetch.start, window.fetch.end, timeframe);
    return makeSeries(symbol, EquitySimulator::buyAndHold(bars, initial_capital),
                      window.window_start, initial_capital, timeframe);
}

void BacktestService::logTransitions(const SymbolRun& run) const {
    for (const auto& transition : run.path.transitions) {
        const auto& bar = run.bars[transition.bar_index];
        Logger::getInstance().logTransition(
            run.symbol,
            bar.date.toString(),
            positionStateToString(transition.from),
            positionStateToString(transition.to),
            bar.close,
            strategy::transitionReasonToString(transition.reason));
    }
}

BacktestResponse BacktestService::runBacktest(const BacktestRequest& request) const {
    const std::string symbol = normalizeSymbol(request.ticker);
    if (!isValidHorizon(request.horizon)) {
        throw ValidationError("Unsupported horizon: " + request.horizon);
    }
    validateCapital(request.initial_capital);
    strategy::validateStrategyConfig(request.strategy);

    const ResolvedWindow window = resolveWindow(request.start_date, request.end_date, request.horizon);
    const Timeframe timeframe = strategy::strategyTimeframe(request.strategy);
    const double capital = request.initial_capital;

    LOG_INFO("Backtest {} [{}] {} {} ~ {} (window from {})",
             symbol, strategy::strategyName(request.strategy), timeframeToString(timeframe),
             window.fetch.start.toString(), window.fetch.end.toString(), window.window_start.toString());

    std::vector<std::function<std::vector<SeriesResult>()>> tasks;
    tasks.push_back([&]() {
        const auto bars = provider_->getBars(symbol, window.fetch.start, window.fetch.end, timeframe);
        const SymbolRun run = runSymbol(symbol, bars, request.strategy, capital);
        logTransitions(run);

        if (!run.signals.first_ready) {
            LOG_WARN("{}: {} bars do not cover the {}-bar warm-up; strategy curve is empty",
                     symbol, run.bars.size(), strategy::warmupBars(request.strategy));
        }

        return std::vector<SeriesResult>{
            makeSeries(symbol, run.equity_curve, window.window_start, capital, timeframe),
            makeSeries(symbol, EquitySimulator::buyAndHold(run.bars, capital),
                       window.window_start, capital, timeframe)
        };
    });
    for (const auto& benchmark : settings_.benchmark_symbols) {
        tasks.push_back([&, benchmark]() {
            return std::vector<SeriesResult>{benchmarkSeries(benchmark, window, capital, timeframe)};
        });
    }

    auto results = runAll(std::move(tasks), settings_.parallel_symbols);

    BacktestResponse response;
    response.strategy = std::move(results[0][0]);
    response.buy_and_hold = std::move(results[0][1]);
    for (size_t i = 1; i < results.size(); ++i) {
        response.benchmarks.push_back(std::move(results[i][0]));
    }

    LOG_INFO("Backtest {} done: {} strategy points, cumulative return {:.4f}",
             symbol, response.strategy.equity_curve.size(), response.strategy.metrics.cumulative_return);
    return response;
}

PortfolioBacktestResponse BacktestService::runPortfolioBacktest(const PortfolioBacktestRequest& request) const {
    const std::vector<std::string> symbols = normalizeSymbols(request.tickers);
    if (!isValidHorizon(request.horizon)) {
        throw ValidationError("Unsupported horizon: " + request.horizon);
    }
    validateCapital(request.initial_capital);
    if (request.use_ranking &&
        (request.top_n < 1 || static_cast<size_t>(request.top_n) > symbols.size())) {
        throw ValidationError("top_n must be between 1 and " + std::to_string(symbols.size()));
    }

    const strategy::StrategyConfig config = settings_.portfolio_strategy;
    strategy::validateStrategyConfig(config);

    const ResolvedWindow window = resolveWindow(request.start_date, request.end_date, request.horizon);
    const Timeframe timeframe = strategy::strategyTimeframe(config);
    const double capital = request.initial_capital;

    LOG_INFO("Portfolio backtest {} symbols, ranking={} top_n={}, {} ~ {}",
             symbols.size(), request.use_ranking, request.top_n,
             window.fetch.start.toString(), window.fetch.end.toString());

    std::vector<std::function<std::vector<Bar>()>> fetches;
    for (const auto& symbol : symbols) {
        fetches.push_back([&, symbol]() {
            return provider_->getBars(symbol, window.fetch.start, window.fetch.end, timeframe);
        });
    }
    const auto fetched = runAll(std::move(fetches), settings_.parallel_symbols);
    const std::vector<Date> calendar = data::commonCalendar(fetched);
    if (calendar.empty()) {
        LOG_WARN("Portfolio symbols share no trading dates; curves are empty");
    }

    std::vector<std::function<SymbolRun()>> pipelines;
    for (size_t s = 0; s < symbols.size(); ++s) {
        pipelines.push_back([&, s]() {
            return runSymbol(symbols[s], data::restrictToCalendar(fetched[s], calendar), config, capital);
        });
    }
    const auto runs = runAll(std::move(pipelines), settings_.parallel_symbols);

    // Synchronization point: allocation needs every symbol's positions
    std::vector<portfolio::SymbolTrack> tracks;
    std::optional<size_t> start_index = calendar.empty() ? std::nullopt : std::optional<size_t>(0);
    for (const auto& run : runs) {
        logTransitions(run);

        portfolio::SymbolTrack track;
        track.symbol = run.symbol;
        track.closes = extractCloses(run.bars);
        track.positions = run.path.realized;
        tracks.push_back(std::move(track));

        if (!run.signals.first_ready) {
            start_index.reset();
        } else if (start_index) {
            start_index = std::max(*start_index, *run.signals.first_ready);
        }
    }

    portfolio::AllocationConfig allocation;
    allocation.use_ranking = request.use_ranking;
    allocation.top_n = request.use_ranking ? request.top_n : static_cast<int>(symbols.size());
    allocation.momentum_lookback = settings_.momentum_lookback_bars;
    allocation.position_mode = settings_.portfolio_strategy.position_mode;

    const portfolio::PortfolioAllocator allocator(allocation);
    const auto rows = allocator.allocate(tracks);

    std::vector<EquityPoint> strategy_curve;
    if (start_index) {
        strategy_curve = portfolio::PortfolioEquitySimulator::simulate(calendar, tracks, rows, capital, *start_index);
    }

    PortfolioBacktestResponse response;
    response.strategy = makeSeries(kPortfolioSymbol, strategy_curve, window.window_start, capital, timeframe);
    response.buy_and_hold = makeSeries(
        kEqualWeightSymbol,
        portfolio::PortfolioEquitySimulator::equalWeightBuyAndHold(calendar, tracks, capital),
        window.window_start, capital, timeframe);
    response.benchmark = benchmarkSeries(settings_.portfolio_benchmark, window, capital, timeframe);
    response.current_holdings = portfolio::PortfolioAllocator::currentHoldings(tracks, rows);

    LOG_INFO("Portfolio backtest done: {} calendar bars, {} strategy points",
             calendar.size(), response.strategy.equity_curve.size());
    return response;
}

} // namespace backtest
} // namespace trendlab
