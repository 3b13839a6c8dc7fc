#pragma once

#include <vector>

#include "common/Types.h"

namespace trendlab {
namespace data {

// Dates present in every series (sorted merge over ordered inputs). Empty input -> empty calendar.
std::vector<Date> commonCalendar(const std::vector<std::vector<Bar>>& series);

// Bars whose dates are in `calendar`; both inputs must be sorted
std::vector<Bar> restrictToCalendar(const std::vector<Bar>& bars, const std::vector<Date>& calendar);

} // namespace data
} // namespace trendlab
