#include "backtest/EquitySimulator.h"

#include <stdexcept>

namespace trendlab {
namespace backtest {

SimulatedAccount::SimulatedAccount(double initial_capital)
    : cash_(initial_capital) {}

double SimulatedAccount::markToMarket(double close) const {
    switch (state_) {
        case PositionState::LONG:
            return shares_ * close;
        case PositionState::SHORT:
            if (short_entry_ <= 0.0) {
                return short_notional_;
            }
            return short_notional_ * (2.0 - close / short_entry_);
        case PositionState::CASH:
            break;
    }
    return cash_;
}

void SimulatedAccount::liquidate(double close) {
    cash_ = markToMarket(close);
    shares_ = 0.0;
    short_notional_ = 0.0;
    short_entry_ = 0.0;
    state_ = PositionState::CASH;
}

void SimulatedAccount::transition(PositionState next, double close) {
    if (next == state_) {
        return;
    }
    if (state_ != PositionState::CASH) {
        liquidate(close);
    }

    if (next == PositionState::LONG) {
        shares_ = (close > 0.0) ? cash_ / close : 0.0;
        cash_ = 0.0;
    } else if (next == PositionState::SHORT) {
        short_notional_ = cash_;
        short_entry_ = close;
        cash_ = 0.0;
    }
    state_ = next;
}

std::vector<EquityPoint> EquitySimulator::simulate(const std::vector<Bar>& bars,
                                                   const std::vector<PositionState>& positions,
                                                   double initial_capital,
                                                   size_t start_index) {
    if (bars.size() != positions.size()) {
        throw std::invalid_argument("bars and positions must be aligned");
    }

    std::vector<EquityPoint> curve;
    if (start_index >= bars.size()) {
        return curve;
    }
    curve.reserve(bars.size() - start_index);

    SimulatedAccount account(initial_capital);
    for (size_t i = start_index; i < bars.size(); ++i) {
        account.transition(positions[i], bars[i].close);
        curve.emplace_back(bars[i].date, account.markToMarket(bars[i].close));
    }
    return curve;
}

std::vector<EquityPoint> EquitySimulator::buyAndHold(const std::vector<Bar>& bars, double initial_capital) {
    const std::vector<PositionState> positions(bars.size(), PositionState::LONG);
    return simulate(bars, positions, initial_capital, 0);
}

} // namespace backtest
} // namespace trendlab
