#include "strategy/SignalGenerator.h"

#include <type_traits>

namespace trendlab {
namespace strategy {

SignalSeries SignalGenerator::generate(const std::vector<double>& closes, const StrategyConfig& config) {
    return std::visit([&](const auto& cfg) -> SignalSeries {
        using T = std::decay_t<decltype(cfg)>;
        if constexpr (std::is_same_v<T, SmaCrossoverConfig>) {
            return smaCrossover(closes, cfg);
        } else {
            static_assert(std::is_same_v<T, MeanReversionZScoreConfig>, "unhandled strategy config");
            return meanReversion(closes, cfg);
        }
    }, config);
}

SignalSeries SignalGenerator::smaCrossover(const std::vector<double>& closes, const SmaCrossoverConfig& config) {
    const auto sma_short = analytics::TechnicalIndicators::rollingMean(closes, config.short_window);
    const auto sma_long = analytics::TechnicalIndicators::rollingMean(closes, config.long_window);
    const PositionState below = (config.position_mode == PositionMode::LONG_SHORT)
        ? PositionState::SHORT
        : PositionState::CASH;

    SignalSeries series;
    series.bars.resize(closes.size());
    PositionState last_target = PositionState::CASH;

    for (size_t i = 0; i < closes.size(); ++i) {
        if (!sma_short[i] || !sma_long[i]) {
            continue;
        }

        auto& bar = series.bars[i];
        bar.ready = true;
        bar.value = *sma_short[i] - *sma_long[i];
        bar.target = (*sma_short[i] > *sma_long[i]) ? PositionState::LONG : below;

        if (!series.first_ready) {
            series.first_ready = i;
        }
        if (*bar.target != last_target) {
            series.crossovers.push_back({i, *bar.target});
            last_target = *bar.target;
        }
    }
    return series;
}

SignalSeries SignalGenerator::meanReversion(const std::vector<double>& closes, const MeanReversionZScoreConfig& config) {
    const auto zscores = analytics::TechnicalIndicators::zScore(closes, config.lookback);
    auto series = fromZScores(zscores, config);

    // A flat window has no z-score but the lookback is still satisfied
    if (closes.size() >= static_cast<size_t>(config.lookback)) {
        const size_t warm = static_cast<size_t>(config.lookback) - 1;
        for (size_t i = warm; i < series.bars.size(); ++i) {
            series.bars[i].ready = true;
        }
        series.first_ready = warm;
    }
    return series;
}

SignalSeries SignalGenerator::fromZScores(const analytics::IndicatorSeries& zscores,
                                          const MeanReversionZScoreConfig& config) {
    SignalSeries series;
    series.bars.resize(zscores.size());

    for (size_t i = 0; i < zscores.size(); ++i) {
        if (!zscores[i]) {
            continue;
        }

        const double z = *zscores[i];
        auto& bar = series.bars[i];
        bar.ready = true;
        bar.value = z;
        bar.enter_long = z <= -config.entry_z;
        bar.exit_long = z >= -config.exit_z;
        if (config.allow_short) {
            bar.enter_short = z >= config.entry_z;
            bar.exit_short = z <= config.exit_z;
        }

        if (!series.first_ready) {
            series.first_ready = i;
        }
    }
    return series;
}

} // namespace strategy
} // namespace trendlab
