#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"

namespace trendlab {
namespace portfolio {

struct AllocationConfig {
    bool use_ranking = false;
    int top_n = 1;
    int momentum_lookback = 12;     // bars of trailing return used for ranking
    PositionMode position_mode = PositionMode::LONG_ONLY;
};

// One symbol on the common calendar: closes and realized positions share its indexing
struct SymbolTrack {
    std::string symbol;
    std::vector<double> closes;
    std::vector<PositionState> positions;
};

// Weights for one bar, in track order. Sum <= 1; the remainder is cash.
struct AllocationRow {
    std::vector<double> weights;
    std::vector<bool> in_market;

    double totalWeight() const;
};

class PortfolioAllocator {
public:
    explicit PortfolioAllocator(AllocationConfig config);

    // Throws std::invalid_argument when tracks are not the same length
    std::vector<AllocationRow> allocate(const std::vector<SymbolTrack>& tracks) const;

    // Weights and in-market flags of the last row
    static std::vector<PortfolioHolding> currentHoldings(const std::vector<SymbolTrack>& tracks,
                                                         const std::vector<AllocationRow>& rows);

    const AllocationConfig& config() const { return config_; }

private:
    bool isActive(PositionState state) const;

    // Indexes of the top_n active tracks by momentum, ties by symbol
    std::vector<size_t> selectRanked(const std::vector<size_t>& active,
                                     const std::vector<SymbolTrack>& tracks,
                                     const std::vector<std::vector<std::optional<double>>>& momentum,
                                     size_t bar) const;

    AllocationConfig config_;
};

} // namespace portfolio
} // namespace trendlab
