#include "portfolio/PortfolioEquitySimulator.h"
#include "backtest/EquitySimulator.h"

#include <stdexcept>

namespace trendlab {
namespace portfolio {

namespace {
void checkAligned(const std::vector<Date>& calendar, const std::vector<SymbolTrack>& tracks) {
    for (const auto& track : tracks) {
        if (track.closes.size() != calendar.size()) {
            throw std::invalid_argument("track " + track.symbol + " is not aligned to the calendar");
        }
    }
}
}

std::vector<EquityPoint> PortfolioEquitySimulator::simulate(const std::vector<Date>& calendar,
                                                            const std::vector<SymbolTrack>& tracks,
                                                            const std::vector<AllocationRow>& rows,
                                                            double initial_capital,
                                                            size_t start_index) {
    checkAligned(calendar, tracks);
    if (rows.size() != calendar.size()) {
        throw std::invalid_argument("allocation rows are not aligned to the calendar");
    }

    std::vector<EquityPoint> curve;
    if (start_index >= calendar.size()) {
        return curve;
    }
    curve.reserve(calendar.size() - start_index);

    double equity = initial_capital;
    std::vector<backtest::SimulatedAccount> sleeves;
    double cash = initial_capital;

    for (size_t bar = start_index; bar < calendar.size(); ++bar) {
        if (bar > start_index) {
            equity = cash;
            for (size_t s = 0; s < sleeves.size(); ++s) {
                equity += sleeves[s].markToMarket(tracks[s].closes[bar]);
            }
        }
        curve.emplace_back(calendar[bar], equity);

        // Rebalance at this close into the bar's target weights
        sleeves.clear();
        cash = equity;
        for (size_t s = 0; s < tracks.size(); ++s) {
            const double allocation = equity * rows[bar].weights[s];
            backtest::SimulatedAccount sleeve(allocation);
            if (allocation > 0.0) {
                sleeve.transition(tracks[s].positions[bar], tracks[s].closes[bar]);
            }
            cash -= allocation;
            sleeves.push_back(sleeve);
        }
    }
    return curve;
}

std::vector<EquityPoint> PortfolioEquitySimulator::equalWeightBuyAndHold(const std::vector<Date>& calendar,
                                                                         const std::vector<SymbolTrack>& tracks,
                                                                         double initial_capital) {
    checkAligned(calendar, tracks);

    std::vector<EquityPoint> curve;
    if (calendar.empty() || tracks.empty()) {
        return curve;
    }

    const double slice = initial_capital / static_cast<double>(tracks.size());
    std::vector<backtest::SimulatedAccount> sleeves(tracks.size(), backtest::SimulatedAccount(slice));
    for (size_t s = 0; s < tracks.size(); ++s) {
        sleeves[s].transition(PositionState::LONG, tracks[s].closes.front());
    }

    curve.reserve(calendar.size());
    for (size_t bar = 0; bar < calendar.size(); ++bar) {
        double equity = 0.0;
        for (size_t s = 0; s < tracks.size(); ++s) {
            equity += sleeves[s].markToMarket(tracks[s].closes[bar]);
        }
        curve.emplace_back(calendar[bar], equity);
    }
    return curve;
}

} // namespace portfolio
} // namespace trendlab
