#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "strategy/StrategyConfig.h"

namespace trendlab {

class Config {
public:
    static Config& getInstance();

    // Missing file keeps the defaults; a malformed file is reported and ignored
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);

    double getInitialCapital() const { return initial_capital_; }
    const std::vector<std::string>& getBenchmarkSymbols() const { return benchmark_symbols_; }
    const std::string& getPortfolioBenchmark() const { return portfolio_benchmark_; }
    int getMomentumLookbackBars() const { return momentum_lookback_bars_; }
    const std::string& getDefaultHorizon() const { return default_horizon_; }
    bool getParallelSymbols() const { return parallel_symbols_; }

    const std::string& getDataDir() const { return data_dir_; }
    const std::string& getLogDir() const { return log_dir_; }
    const std::string& getLogLevel() const { return log_level_; }

    // Strategy Configs
    strategy::SmaCrossoverConfig getSmaCrossoverConfig() const { return sma_crossover_config_; }
    strategy::MeanReversionZScoreConfig getMeanReversionConfig() const { return mean_reversion_config_; }

    void setDataDir(const std::string& v) { data_dir_ = v; }

private:
    Config() = default;

    double initial_capital_ = 10000.0;
    std::vector<std::string> benchmark_symbols_{"SPY", "QQQ", "DIA"};
    std::string portfolio_benchmark_ = "SPY";
    int momentum_lookback_bars_ = 12;
    std::string default_horizon_ = "1Y";
    bool parallel_symbols_ = true;

    std::string data_dir_ = "data";
    std::string log_dir_ = "logs";
    std::string log_level_ = "info";

    strategy::SmaCrossoverConfig sma_crossover_config_;
    strategy::MeanReversionZScoreConfig mean_reversion_config_;
};

} // namespace trendlab
