#pragma once

#include <optional>
#include <vector>

#include "common/Types.h"
#include "strategy/SignalGenerator.h"
#include "strategy/StrategyConfig.h"

namespace trendlab {
namespace strategy {

struct OverrideRules {
    std::optional<double> stop_loss_pct;
    std::optional<int> max_holding_bars;
};

enum class TransitionReason { SIGNAL, STOP_LOSS, MAX_HOLDING };

inline const char* transitionReasonToString(TransitionReason reason) {
    switch (reason) {
        case TransitionReason::SIGNAL: return "signal";
        case TransitionReason::STOP_LOSS: return "stop_loss";
        case TransitionReason::MAX_HOLDING: return "max_holding";
    }
    return "unknown";
}

// Realized position change; bar_index is the bar where the new state takes effect
struct PositionTransition {
    size_t bar_index = 0;
    PositionState from = PositionState::CASH;
    PositionState to = PositionState::CASH;
    TransitionReason reason = TransitionReason::SIGNAL;
};

struct PositionPath {
    std::vector<PositionState> decided;   // state chosen with data through bar i
    std::vector<PositionState> realized;  // state held at bar i == decided[i - 1]
    std::vector<PositionTransition> transitions;
};

// CASH -> LONG/SHORT on entry signals, back to CASH on exit signals or overrides.
// Overrides win over the raw signal when both fire on the same bar.
class PositionStateMachine {
public:
    explicit PositionStateMachine(OverrideRules rules = {}, bool allow_short = false);

    // Consume one bar and return the decided state
    PositionState step(const SignalBar& signal, size_t bar_index, double close);

    PositionState state() const { return state_; }
    TransitionReason lastReason() const { return last_reason_; }

    static PositionPath resolve(const SignalSeries& signals,
                                const std::vector<double>& closes,
                                const OverrideRules& rules,
                                bool allow_short);

    static PositionPath resolve(const SignalSeries& signals,
                                const std::vector<double>& closes,
                                const StrategyConfig& config);

private:
    void enter(PositionState next, size_t bar_index, double close);
    void exit(TransitionReason reason);
    std::optional<TransitionReason> overrideExit(size_t bar_index, double close) const;

    OverrideRules rules_;
    bool allow_short_;

    PositionState state_ = PositionState::CASH;
    double entry_price_ = 0.0;
    size_t entry_bar_ = 0;
    TransitionReason last_reason_ = TransitionReason::SIGNAL;
};

OverrideRules overrideRulesFor(const StrategyConfig& config);

} // namespace strategy
} // namespace trendlab
