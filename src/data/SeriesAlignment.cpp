#include "data/SeriesAlignment.h"

#include <algorithm>

namespace trendlab {
namespace data {

std::vector<Date> commonCalendar(const std::vector<std::vector<Bar>>& series) {
    std::vector<Date> calendar;
    if (series.empty()) {
        return calendar;
    }

    calendar.reserve(series.front().size());
    for (const auto& bar : series.front()) {
        calendar.push_back(bar.date);
    }

    for (size_t s = 1; s < series.size(); ++s) {
        const auto& bars = series[s];
        std::vector<Date> merged;
        merged.reserve(std::min(calendar.size(), bars.size()));

        size_t i = 0;
        size_t j = 0;
        while (i < calendar.size() && j < bars.size()) {
            if (calendar[i] < bars[j].date) {
                ++i;
            } else if (bars[j].date < calendar[i]) {
                ++j;
            } else {
                merged.push_back(calendar[i]);
                ++i;
                ++j;
            }
        }
        calendar.swap(merged);
    }
    return calendar;
}

std::vector<Bar> restrictToCalendar(const std::vector<Bar>& bars, const std::vector<Date>& calendar) {
    std::vector<Bar> out;
    out.reserve(calendar.size());

    size_t i = 0;
    size_t j = 0;
    while (i < bars.size() && j < calendar.size()) {
        if (bars[i].date < calendar[j]) {
            ++i;
        } else if (calendar[j] < bars[i].date) {
            ++j;
        } else {
            out.push_back(bars[i]);
            ++i;
            ++j;
        }
    }
    return out;
}

} // namespace data
} // namespace trendlab
