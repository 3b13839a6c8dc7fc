#include "api/RequestCodec.h"
#include "common/Errors.h"

#include <cassert>
#include <iostream>
#include <variant>

using namespace trendlab;
using nlohmann::json;

namespace {
template<typename Fn>
bool throwsValidation(Fn fn) {
    try {
        fn();
    } catch (const ValidationError&) {
        return true;
    }
    return false;
}
}

int main() {
    {
        const auto request = api::parseBacktestRequest(json{{"ticker", "AAPL"}});
        assert(request.ticker == "AAPL");
        assert(!request.start_date && !request.end_date);
        assert(request.initial_capital == 10000.0);
        assert(request.horizon == "1Y");
        const auto* sma = std::get_if<strategy::SmaCrossoverConfig>(&request.strategy);
        assert(sma != nullptr);
        assert(sma->short_window == 5 && sma->long_window == 20);
        assert(sma->position_mode == PositionMode::LONG_ONLY);
    }

    {
        const json body = {
            {"ticker", "spy"},
            {"start_date", "2015-01-01"},
            {"end_date", "2024-06-30"},
            {"initial_capital", 2500},
            {"horizon", "5Y"},
            {"strategy_type", "mean_reversion_zscore"},
            {"ma_timeframe", "daily"},
            {"mr_lookback", 30},
            {"mr_entry_z", 1.5},
            {"mr_exit_z", 0.25},
            {"mr_stop_loss_pct", 0.08},
            {"mr_max_holding_bars", 10},
            {"mr_allow_short", false}
        };
        const auto request = api::parseBacktestRequest(body);
        assert(request.start_date && *request.start_date == Date::parse("2015-01-01"));
        assert(request.initial_capital == 2500.0);
        const auto& mr = std::get<strategy::MeanReversionZScoreConfig>(request.strategy);
        assert(mr.lookback == 30);
        assert(mr.entry_z == 1.5 && mr.exit_z == 0.25);
        assert(mr.stop_loss_pct && *mr.stop_loss_pct == 0.08);
        assert(mr.max_holding_bars && *mr.max_holding_bars == 10);
        assert(!mr.allow_short);
        assert(mr.timeframe == Timeframe::DAILY);
    }

    {
        const json body = {{"ticker", "QQQ"}, {"position_mode", "long_short"}, {"mr_stop_loss_pct", nullptr}};
        const auto request = api::parseBacktestRequest(body);
        assert(std::get<strategy::SmaCrossoverConfig>(request.strategy).position_mode == PositionMode::LONG_SHORT);
    }

    assert(throwsValidation([]() { api::parseBacktestRequest(json::array()); }));
    assert(throwsValidation([]() { api::parseBacktestRequest(json{{"horizon", "1Y"}}); }));
    assert(throwsValidation([]() { api::parseBacktestRequest(json{{"ticker", 42}}); }));
    assert(throwsValidation([]() { api::parseBacktestRequest(json{{"ticker", "A"}, {"strategy_type", "rsi"}}); }));
    assert(throwsValidation([]() { api::parseBacktestRequest(json{{"ticker", "A"}, {"ma_timeframe", "monthly"}}); }));
    assert(throwsValidation([]() { api::parseBacktestRequest(json{{"ticker", "A"}, {"start_date", "01/02/2020"}}); }));
    assert(throwsValidation([]() { api::parseBacktestRequest(json{{"ticker", "A"}, {"initial_capital", "lots"}}); }));
    assert(throwsValidation([]() {
        api::parseBacktestRequest(json{{"ticker", "A"}, {"strategy_type", "mean_reversion_zscore"}, {"mr_lookback", 2.5}});
    }));

    {
        // Integers outside the int range are rejected, not wrapped
        assert(throwsValidation([]() {
            api::parsePortfolioRequest(json::parse(
                R"({"tickers": ["AAPL", "MSFT"], "use_ranking": true, "top_n": 4294967297})"));
        }));
        assert(throwsValidation([]() {
            api::parsePortfolioRequest(json::parse(R"({"tickers": ["AAPL"], "top_n": -4294967296})"));
        }));
        assert(throwsValidation([]() {
            api::parseBacktestRequest(json::parse(
                R"({"ticker": "A", "strategy_type": "mean_reversion_zscore", "mr_max_holding_bars": 1e10})"));
        }));
        const auto whole = api::parseBacktestRequest(json::parse(
            R"({"ticker": "A", "strategy_type": "mean_reversion_zscore", "mr_max_holding_bars": 12.0})"));
        assert(*std::get<strategy::MeanReversionZScoreConfig>(whole.strategy).max_holding_bars == 12);
        const auto ranked = api::parsePortfolioRequest(json::parse(R"({"tickers": ["AAPL"], "top_n": 2147483647})"));
        assert(ranked.top_n == 2147483647);
    }

    {
        const json body = {{"tickers", {"AAPL", "MSFT"}}, {"use_ranking", true}, {"top_n", 1}};
        const auto request = api::parsePortfolioRequest(body);
        assert(request.tickers.size() == 2);
        assert(request.use_ranking && request.top_n == 1);
        assert(throwsValidation([]() { api::parsePortfolioRequest(json{{"tickers", "AAPL"}}); }));
        assert(throwsValidation([]() { api::parsePortfolioRequest(json{{"tickers", {"AAPL", 3}}}); }));
    }

    {
        backtest::BacktestResponse response;
        response.strategy.symbol = "AAPL";
        response.strategy.equity_curve.emplace_back(Date::parse("2024-01-05"), 10000.0);
        response.strategy.metrics.max_drawdown = 0.25;
        response.buy_and_hold.symbol = "AAPL";
        response.benchmarks.resize(1);
        response.benchmarks[0].symbol = "SPY";

        const json j = api::toJson(response);
        assert(j["strategy"]["symbol"] == "AAPL");
        assert(j["strategy"]["equity_curve"][0]["date"] == "2024-01-05");
        assert(j["strategy"]["equity_curve"][0]["equity"] == 10000.0);
        assert(j["strategy"]["metrics"]["max_drawdown"] == 0.25);
        assert(j["buy_and_hold"]["equity_curve"].is_array());
        assert(j["benchmarks"].size() == 1);
        assert(j["benchmarks"][0]["symbol"] == "SPY");
    }

    {
        backtest::PortfolioBacktestResponse response;
        response.strategy.symbol = "PORTFOLIO";
        response.current_holdings.push_back(PortfolioHolding{"AAPL", 0.5, true});
        const json j = api::toJson(response);
        assert(j["current_holdings"][0]["weight"] == 0.5);
        assert(j["current_holdings"][0]["in_market"] == true);
        assert(j.contains("benchmark"));
    }

    {
        const json error = api::errorJson(404, "not_found", "No weekly bar data returned for symbol 'X'.");
        assert(error["status"] == 404);
        assert(error["kind"] == "not_found");
        assert(api::healthJson()["status"] == "ok");
    }

    std::cout << "[TEST] RequestCodec PASSED\n";
    return 0;
}
