#include "api/RequestCodec.h"
#include "common/Errors.h"

#include <cmath>
#include <cstdint>
#include <limits>

namespace trendlab {
namespace api {

namespace {
bool hasValue(const nlohmann::json& body, const char* key) {
    return body.contains(key) && !body[key].is_null();
}

std::string requireString(const nlohmann::json& body, const char* key) {
    if (!hasValue(body, key) || !body[key].is_string()) {
        throw ValidationError(std::string(key) + " must be a string");
    }
    return body[key].get<std::string>();
}

std::string stringOr(const nlohmann::json& body, const char* key, const std::string& fallback) {
    if (!hasValue(body, key)) {
        return fallback;
    }
    return requireString(body, key);
}

double numberOr(const nlohmann::json& body, const char* key, double fallback) {
    if (!hasValue(body, key)) {
        return fallback;
    }
    if (!body[key].is_number()) {
        throw ValidationError(std::string(key) + " must be a number");
    }
    return body[key].get<double>();
}

int integerOr(const nlohmann::json& body, const char* key, int fallback) {
    if (!hasValue(body, key)) {
        return fallback;
    }
    const auto& value = body[key];
    const std::string message = std::string(key) + " must be an integer";
    if (value.is_number_unsigned()) {
        const auto u = value.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            throw ValidationError(message);
        }
        return static_cast<int>(u);
    }
    if (value.is_number_integer()) {
        const auto i = value.get<std::int64_t>();
        if (i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max()) {
            throw ValidationError(message);
        }
        return static_cast<int>(i);
    }
    if (value.is_number_float()) {
        const double d = value.get<double>();
        if (std::isfinite(d) && std::floor(d) == d &&
            d >= static_cast<double>(std::numeric_limits<int>::min()) &&
            d <= static_cast<double>(std::numeric_limits<int>::max())) {
            return static_cast<int>(d);
        }
    }
    throw ValidationError(message);
}

bool boolOr(const nlohmann::json& body, const char* key, bool fallback) {
    if (!hasValue(body, key)) {
        return fallback;
    }
    if (!body[key].is_boolean()) {
        throw ValidationError(std::string(key) + " must be a boolean");
    }
    return body[key].get<bool>();
}

std::optional<Date> optionalDate(const nlohmann::json& body, const char* key) {
    if (!hasValue(body, key)) {
        return std::nullopt;
    }
    const std::string text = requireString(body, key);
    try {
        return Date::parse(text);
    } catch (const std::invalid_argument&) {
        throw ValidationError(std::string(key) + " must be a YYYY-MM-DD date");
    }
}

Timeframe parseTimeframe(const std::string& value) {
    if (value == "weekly") return Timeframe::WEEKLY;
    if (value == "daily") return Timeframe::DAILY;
    throw ValidationError("ma_timeframe must be one of weekly, daily");
}

PositionMode parsePositionMode(const std::string& value) {
    if (value == "long_only") return PositionMode::LONG_ONLY;
    if (value == "long_short") return PositionMode::LONG_SHORT;
    throw ValidationError("position_mode must be one of long_only, long_short");
}

nlohmann::json toJson(const EquityPoint& point) {
    nlohmann::json j;
    j["date"] = point.date.toString();
    j["equity"] = point.equity;
    return j;
}
}

backtest::BacktestRequest parseBacktestRequest(const nlohmann::json& body, const RequestDefaults& defaults) {
    if (!body.is_object()) {
        throw ValidationError("request body must be a JSON object");
    }

    backtest::BacktestRequest request;
    request.ticker = requireString(body, "ticker");
    request.start_date = optionalDate(body, "start_date");
    request.end_date = optionalDate(body, "end_date");
    request.initial_capital = numberOr(body, "initial_capital", defaults.initial_capital);
    request.horizon = stringOr(body, "horizon", defaults.horizon);

    const std::string strategy_type = stringOr(body, "strategy_type", "sma_crossover");
    const Timeframe timeframe = hasValue(body, "ma_timeframe")
        ? parseTimeframe(requireString(body, "ma_timeframe"))
        : defaults.sma_crossover.timeframe;

    if (strategy_type == "sma_crossover") {
        strategy::SmaCrossoverConfig sma = defaults.sma_crossover;
        sma.timeframe = timeframe;
        if (hasValue(body, "position_mode")) {
            sma.position_mode = parsePositionMode(requireString(body, "position_mode"));
        }
        request.strategy = sma;
    } else if (strategy_type == "mean_reversion_zscore") {
        strategy::MeanReversionZScoreConfig mr = defaults.mean_reversion;
        mr.timeframe = hasValue(body, "ma_timeframe") ? timeframe : defaults.mean_reversion.timeframe;
        mr.lookback = integerOr(body, "mr_lookback", mr.lookback);
        mr.entry_z = numberOr(body, "mr_entry_z", mr.entry_z);
        mr.exit_z = numberOr(body, "mr_exit_z", mr.exit_z);
        if (hasValue(body, "mr_stop_loss_pct")) {
            mr.stop_loss_pct = numberOr(body, "mr_stop_loss_pct", 0.0);
        }
        if (hasValue(body, "mr_max_holding_bars")) {
            mr.max_holding_bars = integerOr(body, "mr_max_holding_bars", 0);
        }
        mr.allow_short = boolOr(body, "mr_allow_short", mr.allow_short);
        request.strategy = mr;
    } else {
        throw ValidationError("strategy_type must be one of sma_crossover, mean_reversion_zscore");
    }
    return request;
}

backtest::PortfolioBacktestRequest parsePortfolioRequest(const nlohmann::json& body, const RequestDefaults& defaults) {
    if (!body.is_object()) {
        throw ValidationError("request body must be a JSON object");
    }

    backtest::PortfolioBacktestRequest request;
    if (!hasValue(body, "tickers") || !body["tickers"].is_array()) {
        throw ValidationError("tickers must be an array of strings");
    }
    for (const auto& ticker : body["tickers"]) {
        if (!ticker.is_string()) {
            throw ValidationError("tickers must be an array of strings");
        }
        request.tickers.push_back(ticker.get<std::string>());
    }

    request.start_date = optionalDate(body, "start_date");
    request.end_date = optionalDate(body, "end_date");
    request.initial_capital = numberOr(body, "initial_capital", defaults.initial_capital);
    request.horizon = stringOr(body, "horizon", defaults.horizon);
    request.use_ranking = boolOr(body, "use_ranking", false);
    request.top_n = integerOr(body, "top_n", 1);
    return request;
}

nlohmann::json toJson(const MetricSummary& metrics) {
    nlohmann::json j;
    j["cumulative_return"] = metrics.cumulative_return;
    j["cagr"] = metrics.cagr;
    j["max_drawdown"] = metrics.max_drawdown;
    j["volatility"] = metrics.volatility;
    j["sharpe_ratio"] = metrics.sharpe_ratio;
    return j;
}

nlohmann::json toJson(const SeriesResult& series) {
    nlohmann::json curve = nlohmann::json::array();
    for (const auto& point : series.equity_curve) {
        curve.push_back(toJson(point));
    }

    nlohmann::json j;
    j["symbol"] = series.symbol;
    j["equity_curve"] = curve;
    j["metrics"] = toJson(series.metrics);
    return j;
}

nlohmann::json toJson(const PortfolioHolding& holding) {
    nlohmann::json j;
    j["symbol"] = holding.symbol;
    j["weight"] = holding.weight;
    j["in_market"] = holding.in_market;
    return j;
}

nlohmann::json toJson(const backtest::BacktestResponse& response) {
    nlohmann::json benchmarks = nlohmann::json::array();
    for (const auto& benchmark : response.benchmarks) {
        benchmarks.push_back(toJson(benchmark));
    }

    nlohmann::json j;
    j["strategy"] = toJson(response.strategy);
    j["buy_and_hold"] = toJson(response.buy_and_hold);
    j["benchmarks"] = benchmarks;
    return j;
}

nlohmann::json toJson(const backtest::PortfolioBacktestResponse& response) {
    nlohmann::json holdings = nlohmann::json::array();
    for (const auto& holding : response.current_holdings) {
        holdings.push_back(toJson(holding));
    }

    nlohmann::json j;
    j["strategy"] = toJson(response.strategy);
    j["buy_and_hold"] = toJson(response.buy_and_hold);
    j["benchmark"] = toJson(response.benchmark);
    j["current_holdings"] = holdings;
    return j;
}

nlohmann::json errorJson(int status_code, const std::string& kind, const std::string& message) {
    nlohmann::json j;
    j["status"] = status_code;
    j["kind"] = kind;
    j["detail"] = message;
    return j;
}

nlohmann::json healthJson() {
    return nlohmann::json{{"status", "ok"}};
}

} // namespace api
} // namespace trendlab
