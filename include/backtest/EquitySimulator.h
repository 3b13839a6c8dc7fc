#pragma once

#include <vector>

#include "common/Types.h"

namespace trendlab {
namespace backtest {

// Single-position account: all equity is committed on entry, liquidated on exit.
class SimulatedAccount {
public:
    explicit SimulatedAccount(double initial_capital);

    // Moves to `next` at `close`; no-op when already in that state
    void transition(PositionState next, double close);

    // Mark-to-market value at `close`
    double markToMarket(double close) const;

    PositionState state() const { return state_; }
    double cash() const { return cash_; }

private:
    void liquidate(double close);

    PositionState state_ = PositionState::CASH;
    double cash_;
    double shares_ = 0.0;           // LONG
    double short_notional_ = 0.0;   // SHORT: equity committed at entry
    double short_entry_ = 0.0;
};

class EquitySimulator {
public:
    // Equity at every bar from `start_index`; positions[i] is the state held at bar i's close.
    // Throws std::invalid_argument when bars and positions are not aligned.
    static std::vector<EquityPoint> simulate(const std::vector<Bar>& bars,
                                             const std::vector<PositionState>& positions,
                                             double initial_capital,
                                             size_t start_index = 0);

    // LONG from the first bar onward
    static std::vector<EquityPoint> buyAndHold(const std::vector<Bar>& bars, double initial_capital);
};

} // namespace backtest
} // namespace trendlab
