#include "strategy/PositionStateMachine.h"

#include <stdexcept>
#include <type_traits>

namespace trendlab {
namespace strategy {

PositionStateMachine::PositionStateMachine(OverrideRules rules, bool allow_short)
    : rules_(rules), allow_short_(allow_short) {}

void PositionStateMachine::enter(PositionState next, size_t bar_index, double close) {
    state_ = next;
    entry_price_ = close;
    entry_bar_ = bar_index;
    last_reason_ = TransitionReason::SIGNAL;
}

void PositionStateMachine::exit(TransitionReason reason) {
    state_ = PositionState::CASH;
    entry_price_ = 0.0;
    entry_bar_ = 0;
    last_reason_ = reason;
}

std::optional<TransitionReason> PositionStateMachine::overrideExit(size_t bar_index, double close) const {
    if (rules_.stop_loss_pct && entry_price_ > 0.0 && close > 0.0) {
        const double pnl = (state_ == PositionState::LONG)
            ? (close / entry_price_) - 1.0
            : (entry_price_ / close) - 1.0;
        if (pnl <= -*rules_.stop_loss_pct) {
            return TransitionReason::STOP_LOSS;
        }
    }

    if (rules_.max_holding_bars &&
        bar_index - entry_bar_ >= static_cast<size_t>(*rules_.max_holding_bars)) {
        return TransitionReason::MAX_HOLDING;
    }
    return std::nullopt;
}

PositionState PositionStateMachine::step(const SignalBar& signal, size_t bar_index, double close) {
    if (state_ == PositionState::CASH) {
        if (!signal.ready) {
            return state_;
        }

        if (signal.target) {
            if (*signal.target == PositionState::LONG ||
                (*signal.target == PositionState::SHORT && allow_short_)) {
                enter(*signal.target, bar_index, close);
            }
        } else if (signal.enter_long) {
            enter(PositionState::LONG, bar_index, close);
        } else if (signal.enter_short && allow_short_) {
            enter(PositionState::SHORT, bar_index, close);
        }
        return state_;
    }

    if (const auto forced = overrideExit(bar_index, close)) {
        exit(*forced);
        return state_;
    }

    if (!signal.ready) {
        return state_;
    }

    if (signal.target) {
        if (*signal.target == state_) {
            return state_;
        }
        if (*signal.target == PositionState::CASH ||
            (*signal.target == PositionState::SHORT && !allow_short_)) {
            exit(TransitionReason::SIGNAL);
        } else {
            // Direct LONG <-> SHORT flip on an opposite crossover
            enter(*signal.target, bar_index, close);
        }
        return state_;
    }

    if ((state_ == PositionState::LONG && signal.exit_long) ||
        (state_ == PositionState::SHORT && signal.exit_short)) {
        exit(TransitionReason::SIGNAL);
    }
    return state_;
}

PositionPath PositionStateMachine::resolve(const SignalSeries& signals,
                                           const std::vector<double>& closes,
                                           const OverrideRules& rules,
                                           bool allow_short) {
    if (signals.bars.size() != closes.size()) {
        throw std::invalid_argument("signal series and closes must be aligned");
    }

    PositionStateMachine machine(rules, allow_short);
    PositionPath path;
    path.decided.reserve(closes.size());
    path.realized.reserve(closes.size());

    std::vector<TransitionReason> reasons;
    reasons.reserve(closes.size());

    for (size_t i = 0; i < closes.size(); ++i) {
        path.decided.push_back(machine.step(signals.bars[i], i, closes[i]));
        reasons.push_back(machine.lastReason());
    }

    PositionState previous = PositionState::CASH;
    for (size_t i = 0; i < closes.size(); ++i) {
        const PositionState held = (i == 0) ? PositionState::CASH : path.decided[i - 1];
        path.realized.push_back(held);
        if (held != previous) {
            PositionTransition transition;
            transition.bar_index = i;
            transition.from = previous;
            transition.to = held;
            transition.reason = reasons[i - 1];
            path.transitions.push_back(transition);
            previous = held;
        }
    }
    return path;
}

PositionPath PositionStateMachine::resolve(const SignalSeries& signals,
                                           const std::vector<double>& closes,
                                           const StrategyConfig& config) {
    return resolve(signals, closes, overrideRulesFor(config), allowsShort(config));
}

OverrideRules overrideRulesFor(const StrategyConfig& config) {
    return std::visit([](const auto& cfg) -> OverrideRules {
        using T = std::decay_t<decltype(cfg)>;
        OverrideRules rules;
        if constexpr (std::is_same_v<T, MeanReversionZScoreConfig>) {
            rules.stop_loss_pct = cfg.stop_loss_pct;
            rules.max_holding_bars = cfg.max_holding_bars;
        }
        return rules;
    }, config);
}

} // namespace strategy
} // namespace trendlab
