#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace trendlab {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string normalizeSymbol(std::string symbol) {
    symbol = trimCopy(symbol);
    std::transform(symbol.begin(), symbol.end(), symbol.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return symbol;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

Timeframe parseTimeframe(const std::string& value, Timeframe fallback) {
    if (value == "daily") return Timeframe::DAILY;
    if (value == "weekly") return Timeframe::WEEKLY;
    return fallback;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::load(const std::string& path) {
    try {
        std::filesystem::path config_path;
        if (std::filesystem::path(path).is_absolute()) {
            config_path = path;
        } else {
            config_path = utils::PathUtils::resolveRelativePath(path);
        }

        if (!std::filesystem::exists(config_path)) {
            std::cerr << "Config file not found: " << config_path << ", using defaults" << std::endl;
        } else {
            std::ifstream file(config_path);
            if (!file.is_open()) {
                std::cerr << "Config file could not be opened: " << config_path << std::endl;
            } else {
                nlohmann::json j;
                file >> j;
                loadFromJson(j);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
    }

    const std::string env_data_dir = readEnvVar("TRENDLAB_DATA_DIR");
    if (!env_data_dir.empty()) {
        data_dir_ = env_data_dir;
    }
}

void Config::loadFromJson(const nlohmann::json& j) {
    if (j.contains("backtest")) {
        const auto& b = j["backtest"];

        initial_capital_ = b.value("initial_capital", 10000.0);
        default_horizon_ = b.value("default_horizon", std::string("1Y"));
        momentum_lookback_bars_ = b.value("momentum_lookback_bars", 12);
        parallel_symbols_ = b.value("parallel_symbols", true);
        portfolio_benchmark_ = normalizeSymbol(b.value("portfolio_benchmark", std::string("SPY")));

        if (b.contains("benchmark_symbols")) {
            benchmark_symbols_ = b["benchmark_symbols"].get<std::vector<std::string>>();
            for (auto& symbol : benchmark_symbols_) {
                symbol = normalizeSymbol(symbol);
            }
        }
    }

    if (j.contains("paths")) {
        const auto& p = j["paths"];
        data_dir_ = p.value("data_dir", std::string("data"));
        log_dir_ = p.value("log_dir", std::string("logs"));
    }

    if (j.contains("logging")) {
        log_level_ = j["logging"].value("level", std::string("info"));
    }

    if (j.contains("strategies") && j["strategies"].contains("sma_crossover")) {
        const auto& s = j["strategies"]["sma_crossover"];
        sma_crossover_config_.short_window = s.value("short_window", 5);
        sma_crossover_config_.long_window = s.value("long_window", 20);
        sma_crossover_config_.timeframe = parseTimeframe(s.value("timeframe", std::string("weekly")), Timeframe::WEEKLY);
        sma_crossover_config_.position_mode = (s.value("position_mode", std::string("long_only")) == "long_short")
            ? PositionMode::LONG_SHORT
            : PositionMode::LONG_ONLY;
    }

    if (j.contains("strategies") && j["strategies"].contains("mean_reversion_zscore")) {
        const auto& s = j["strategies"]["mean_reversion_zscore"];
        mean_reversion_config_.lookback = s.value("lookback", 20);
        mean_reversion_config_.entry_z = s.value("entry_z", 2.0);
        mean_reversion_config_.exit_z = s.value("exit_z", 0.5);
        mean_reversion_config_.allow_short = s.value("allow_short", true);
        mean_reversion_config_.timeframe = parseTimeframe(s.value("timeframe", std::string("weekly")), Timeframe::WEEKLY);

        mean_reversion_config_.stop_loss_pct.reset();
        if (s.contains("stop_loss_pct") && !s["stop_loss_pct"].is_null()) {
            mean_reversion_config_.stop_loss_pct = s["stop_loss_pct"].get<double>();
        }
        mean_reversion_config_.max_holding_bars.reset();
        if (s.contains("max_holding_bars") && !s["max_holding_bars"].is_null()) {
            mean_reversion_config_.max_holding_bars = s["max_holding_bars"].get<int>();
        }
    }
}

} // namespace trendlab
