#pragma once

#include <string>
#include <vector>

#include "common/Types.h"

namespace trendlab {
namespace data {

// Supplies dated closes for one symbol. Implementations return bars sorted by date with
// unique dates, never an empty vector: a symbol without bars in range throws
// DataError(NOT_FOUND), any other failure DataError(UPSTREAM).
// Implementations must be safe to call from several threads at once.
class IBarProvider {
public:
    virtual ~IBarProvider() = default;

    virtual std::vector<Bar> getBars(
        const std::string& symbol,
        const Date& start,
        const Date& end,
        Timeframe timeframe
    ) = 0;
};

} // namespace data
} // namespace trendlab
