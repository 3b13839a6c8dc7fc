#pragma once

#include <vector>

#include "common/Types.h"
#include "portfolio/PortfolioAllocator.h"

namespace trendlab {
namespace portfolio {

class PortfolioEquitySimulator {
public:
    // Rebalances at every close from `start_index`: each symbol sleeve receives equity * weight,
    // held in the symbol's realized direction until the next close. Unallocated equity stays cash.
    static std::vector<EquityPoint> simulate(const std::vector<Date>& calendar,
                                             const std::vector<SymbolTrack>& tracks,
                                             const std::vector<AllocationRow>& rows,
                                             double initial_capital,
                                             size_t start_index);

    // Capital split evenly at the first bar, each slice bought and held
    static std::vector<EquityPoint> equalWeightBuyAndHold(const std::vector<Date>& calendar,
                                                          const std::vector<SymbolTrack>& tracks,
                                                          double initial_capital);
};

} // namespace portfolio
} // namespace trendlab
