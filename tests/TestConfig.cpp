#include "common/Config.h"
#include "common/Logger.h"
#include <iostream>
#include <cassert>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>

// Simple manual test runner
int main() {
    using namespace trendlab;

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    Config& config = Config::getInstance();

    // Defaults before anything is loaded
    assert(std::abs(config.getInitialCapital() - 10000.0) < 1e-9);
    assert(config.getDefaultHorizon() == "1Y");
    assert(config.getBenchmarkSymbols().size() == 3);
    assert(config.getPortfolioBenchmark() == "SPY");
    assert(config.getSmaCrossoverConfig().short_window == 5);
    assert(config.getSmaCrossoverConfig().long_window == 20);
    assert(!config.getMeanReversionConfig().stop_loss_pct.has_value());

    // Missing file keeps the defaults
    config.load("/nonexistent/trendlab/config.json");
    assert(config.getMomentumLookbackBars() == 12);

    const nlohmann::json j = {
        {"backtest", {
            {"initial_capital", 25000.0},
            {"default_horizon", "5Y"},
            {"benchmark_symbols", {" spy", "qqq "}},
            {"portfolio_benchmark", "qqq"},
            {"momentum_lookback_bars", 26},
            {"parallel_symbols", false}
        }},
        {"paths", {{"data_dir", "/tmp/bars"}, {"log_dir", "/tmp/trendlab-logs"}}},
        {"logging", {{"level", "debug"}}},
        {"strategies", {
            {"sma_crossover", {
                {"short_window", 10}, {"long_window", 40},
                {"timeframe", "daily"}, {"position_mode", "long_short"}
            }},
            {"mean_reversion_zscore", {
                {"lookback", 30}, {"entry_z", 1.5}, {"exit_z", 0.25},
                {"stop_loss_pct", 0.1}, {"max_holding_bars", nullptr}, {"allow_short", false}
            }}
        }}
    };
    config.loadFromJson(j);

    std::cout << "Initial capital: " << config.getInitialCapital() << std::endl;
    std::cout << "Data dir: " << config.getDataDir() << std::endl;

    assert(std::abs(config.getInitialCapital() - 25000.0) < 1e-9);
    assert(config.getDefaultHorizon() == "5Y");
    assert(config.getBenchmarkSymbols().size() == 2);
    assert(config.getBenchmarkSymbols()[0] == "SPY");
    assert(config.getBenchmarkSymbols()[1] == "QQQ");
    assert(config.getPortfolioBenchmark() == "QQQ");
    assert(config.getMomentumLookbackBars() == 26);
    assert(!config.getParallelSymbols());
    assert(config.getDataDir() == "/tmp/bars");
    assert(config.getLogLevel() == "debug");

    auto sma = config.getSmaCrossoverConfig();
    assert(sma.short_window == 10 && sma.long_window == 40);
    assert(sma.timeframe == Timeframe::DAILY);
    assert(sma.position_mode == PositionMode::LONG_SHORT);

    auto mr = config.getMeanReversionConfig();
    assert(mr.lookback == 30);
    assert(mr.stop_loss_pct.has_value() && std::abs(*mr.stop_loss_pct - 0.1) < 1e-12);
    assert(!mr.max_holding_bars.has_value());
    assert(!mr.allow_short);

    // File on disk
    const auto path = std::filesystem::temp_directory_path() / "trendlab_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"backtest": {"initial_capital": 5000}, "paths": {"data_dir": "/srv/bars"}})";
    }
    config.load(path.string());
    assert(std::abs(config.getInitialCapital() - 5000.0) < 1e-9);
    if (std::getenv("TRENDLAB_DATA_DIR") == nullptr) {
        assert(config.getDataDir() == "/srv/bars");
    }
    std::filesystem::remove(path);

    std::cout << "[TEST] Config Test PASSED!" << std::endl;

    return 0;
}
