#include "portfolio/PortfolioAllocator.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace trendlab {
namespace portfolio {

double AllocationRow::totalWeight() const {
    return std::accumulate(weights.begin(), weights.end(), 0.0);
}

PortfolioAllocator::PortfolioAllocator(AllocationConfig config)
    : config_(config) {
    if (config_.top_n < 1) {
        throw std::invalid_argument("top_n must be >= 1");
    }
}

bool PortfolioAllocator::isActive(PositionState state) const {
    if (state == PositionState::LONG) {
        return true;
    }
    return state == PositionState::SHORT && config_.position_mode == PositionMode::LONG_SHORT;
}

std::vector<size_t> PortfolioAllocator::selectRanked(
    const std::vector<size_t>& active,
    const std::vector<SymbolTrack>& tracks,
    const std::vector<std::vector<std::optional<double>>>& momentum,
    size_t bar) const {
    std::vector<size_t> ranked = active;

    // Defined scores first (descending); undefined scores rank last; ties by symbol
    std::sort(ranked.begin(), ranked.end(), [&](size_t a, size_t b) {
        const auto& ma = momentum[a][bar];
        const auto& mb = momentum[b][bar];
        if (ma.has_value() != mb.has_value()) {
            return ma.has_value();
        }
        if (ma && *ma != *mb) {
            return *ma > *mb;
        }
        return tracks[a].symbol < tracks[b].symbol;
    });

    if (ranked.size() > static_cast<size_t>(config_.top_n)) {
        ranked.resize(static_cast<size_t>(config_.top_n));
    }
    return ranked;
}

std::vector<AllocationRow> PortfolioAllocator::allocate(const std::vector<SymbolTrack>& tracks) const {
    std::vector<AllocationRow> rows;
    if (tracks.empty()) {
        return rows;
    }

    const size_t bar_count = tracks.front().closes.size();
    for (const auto& track : tracks) {
        if (track.closes.size() != bar_count || track.positions.size() != bar_count) {
            throw std::invalid_argument("symbol tracks must share the common calendar");
        }
    }

    std::vector<std::vector<std::optional<double>>> momentum;
    if (config_.use_ranking) {
        momentum.reserve(tracks.size());
        for (const auto& track : tracks) {
            momentum.push_back(analytics::TechnicalIndicators::trailingReturn(
                track.closes, config_.momentum_lookback));
        }
    }

    rows.reserve(bar_count);
    for (size_t bar = 0; bar < bar_count; ++bar) {
        AllocationRow row;
        row.weights.assign(tracks.size(), 0.0);
        row.in_market.assign(tracks.size(), false);

        std::vector<size_t> active;
        for (size_t s = 0; s < tracks.size(); ++s) {
            if (isActive(tracks[s].positions[bar])) {
                active.push_back(s);
                row.in_market[s] = true;
            }
        }

        if (!active.empty()) {
            const std::vector<size_t> selected = config_.use_ranking
                ? selectRanked(active, tracks, momentum, bar)
                : active;
            const double weight = 1.0 / static_cast<double>(selected.size());
            for (size_t s : selected) {
                row.weights[s] = weight;
            }
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<PortfolioHolding> PortfolioAllocator::currentHoldings(const std::vector<SymbolTrack>& tracks,
                                                                  const std::vector<AllocationRow>& rows) {
    std::vector<PortfolioHolding> holdings;
    holdings.reserve(tracks.size());

    for (size_t s = 0; s < tracks.size(); ++s) {
        PortfolioHolding holding;
        holding.symbol = tracks[s].symbol;
        if (!rows.empty()) {
            holding.weight = rows.back().weights[s];
            holding.in_market = rows.back().in_market[s];
        }
        holdings.push_back(holding);
    }
    return holdings;
}

} // namespace portfolio
} // namespace trendlab
