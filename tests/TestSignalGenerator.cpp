#include "strategy/SignalGenerator.h"

#include <cassert>
#include <iostream>
#include <vector>

using namespace trendlab;
using namespace trendlab::strategy;

namespace {
std::vector<double> risingCloses(size_t n, double start = 100.0) {
    std::vector<double> closes;
    for (size_t i = 0; i < n; ++i) {
        closes.push_back(start + static_cast<double>(i));
    }
    return closes;
}
}

int main() {
    {
        // No signal before the long window is covered
        const auto series = SignalGenerator::smaCrossover(risingCloses(25), SmaCrossoverConfig{});
        assert(series.bars.size() == 25);
        assert(series.first_ready && *series.first_ready == 19);
        for (size_t i = 0; i < 19; ++i) {
            assert(!series.bars[i].ready);
            assert(!series.bars[i].target);
        }
        for (size_t i = 19; i < 25; ++i) {
            assert(series.bars[i].target && *series.bars[i].target == PositionState::LONG);
        }
        // One crossover, not one event per bar
        assert(series.crossovers.size() == 1);
        assert(series.crossovers[0].bar_index == 19);
    }

    {
        const std::vector<double> closes{
            100, 102, 104, 106, 108, 110, 112, 114, 116, 118, 120, 122, 124, 126, 128,
            126, 124, 122, 120, 118, 116, 114, 112, 110, 108, 106, 104, 102, 100, 98};

        SmaCrossoverConfig long_only;
        SmaCrossoverConfig long_short;
        long_short.position_mode = PositionMode::LONG_SHORT;

        const auto a = SignalSeries(SignalGenerator::generate(closes, long_only));
        const auto b = SignalSeries(SignalGenerator::generate(closes, long_short));

        bool saw_short = false;
        for (size_t i = 0; i < closes.size(); ++i) {
            if (a.bars[i].target) {
                assert(*a.bars[i].target != PositionState::SHORT);
            }
            if (b.bars[i].target && *b.bars[i].target == PositionState::SHORT) {
                saw_short = true;
            }
        }
        assert(saw_short);
        assert(b.crossovers.size() >= 2);
        assert(b.crossovers.back().state == PositionState::SHORT);
    }

    {
        // Too little history: an empty-but-valid series
        const auto series = SignalGenerator::smaCrossover(risingCloses(10), SmaCrossoverConfig{});
        assert(!series.first_ready);
        assert(series.crossovers.empty());
    }

    {
        MeanReversionZScoreConfig cfg;
        cfg.entry_z = 2.0;
        cfg.exit_z = 0.5;
        cfg.allow_short = false;

        analytics::IndicatorSeries z(4);
        z[1] = -2.1;
        z[2] = -0.4;
        z[3] = 2.5;
        const auto series = SignalGenerator::fromZScores(z, cfg);
        assert(!series.bars[0].ready);
        assert(series.bars[1].enter_long && !series.bars[1].exit_long);
        assert(series.bars[2].exit_long && !series.bars[2].enter_long);
        assert(!series.bars[3].enter_short);   // shorting disabled

        cfg.allow_short = true;
        const auto with_short = SignalGenerator::fromZScores(z, cfg);
        assert(with_short.bars[3].enter_short);
        assert(with_short.bars[2].exit_short);
    }

    {
        // Flat prefix: lookback covered but z undefined, so no entry flags
        std::vector<double> closes(30, 100.0);
        MeanReversionZScoreConfig cfg;
        cfg.lookback = 20;
        const auto series = SignalGenerator::meanReversion(closes, cfg);
        assert(series.first_ready && *series.first_ready == 19);
        for (const auto& bar : series.bars) {
            assert(!bar.enter_long && !bar.enter_short);
            assert(!bar.value);
        }
    }

    std::cout << "[TEST] SignalGenerator PASSED\n";
    return 0;
}
