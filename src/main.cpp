#include "api/RequestCodec.h"
#include "backtest/BacktestService.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "data/CsvBarProvider.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>

using namespace trendlab;

namespace {
constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitValidation = 2;
constexpr int kExitData = 3;
constexpr int kExitInternal = 4;

struct CliOptions {
    std::string command;
    std::string request_path;   // empty: read stdin
    std::string config_path;
    std::string data_dir;
};

void printUsage() {
    std::cerr << "Usage: trendlab <backtest|portfolio-backtest|health> "
                 "[--request FILE] [--config FILE] [--data-dir DIR]\n";
}

bool parseArgs(int argc, char* argv[], CliOptions& options) {
    if (argc < 2) {
        return false;
    }
    options.command = argv[1];

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << "\n";
            return false;
        }
        if (arg == "--request") {
            options.request_path = argv[++i];
        } else if (arg == "--config") {
            options.config_path = argv[++i];
        } else if (arg == "--data-dir") {
            options.data_dir = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
    }
    return true;
}

nlohmann::json readRequest(const std::string& path) {
    std::string text;
    if (path.empty()) {
        text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw ValidationError("Cannot open request file: " + path);
        }
        text.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }

    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError(std::string("Request is not valid JSON: ") + e.what());
    }
}

api::RequestDefaults requestDefaults(const Config& config) {
    api::RequestDefaults defaults;
    defaults.initial_capital = config.getInitialCapital();
    defaults.horizon = config.getDefaultHorizon();
    defaults.sma_crossover = config.getSmaCrossoverConfig();
    defaults.mean_reversion = config.getMeanReversionConfig();
    return defaults;
}

backtest::ServiceSettings serviceSettings(const Config& config) {
    backtest::ServiceSettings settings;
    settings.benchmark_symbols = config.getBenchmarkSymbols();
    settings.portfolio_benchmark = config.getPortfolioBenchmark();
    settings.momentum_lookback_bars = config.getMomentumLookbackBars();
    settings.parallel_symbols = config.getParallelSymbols();
    settings.portfolio_strategy = config.getSmaCrossoverConfig();
    return settings;
}
}

int main(int argc, char* argv[]) {
    CliOptions options;
    if (!parseArgs(argc, argv, options)) {
        printUsage();
        return kExitUsage;
    }

    if (options.command == "health") {
        std::cout << api::healthJson().dump() << std::endl;
        return kExitOk;
    }
    if (options.command != "backtest" && options.command != "portfolio-backtest") {
        printUsage();
        return kExitUsage;
    }

    Config& config = Config::getInstance();
    config.load(options.config_path.empty()
        ? (utils::PathUtils::getConfigDir() / "config.json").string()
        : options.config_path);
    if (!options.data_dir.empty()) {
        config.setDataDir(options.data_dir);
    }

    try {
        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return kExitInternal;
    }

    try {
        auto provider = std::make_shared<data::CsvBarProvider>(
            utils::PathUtils::resolveRelativePath(config.getDataDir()));
        const backtest::BacktestService service(provider, serviceSettings(config));
        const nlohmann::json body = readRequest(options.request_path);

        nlohmann::json response;
        if (options.command == "backtest") {
            response = api::toJson(service.runBacktest(api::parseBacktestRequest(body, requestDefaults(config))));
        } else {
            response = api::toJson(service.runPortfolioBacktest(api::parsePortfolioRequest(body, requestDefaults(config))));
        }

        std::cout << response.dump() << std::endl;
        return kExitOk;

    } catch (const ValidationError& e) {
        LOG_WARN("Rejected request: {}", e.what());
        std::cout << api::errorJson(400, "validation", e.what()).dump() << std::endl;
        return kExitValidation;
    } catch (const DataError& e) {
        LOG_ERROR("Bar data error: {}", e.what());
        std::cout << api::errorJson(statusCodeFor(e.kind()), dataErrorKindToString(e.kind()), e.what()).dump()
                  << std::endl;
        return kExitData;
    } catch (const std::exception& e) {
        LOG_ERROR("Backtest failed: {}", e.what());
        std::cout << api::errorJson(500, "internal", e.what()).dump() << std::endl;
        return kExitInternal;
    }
}
