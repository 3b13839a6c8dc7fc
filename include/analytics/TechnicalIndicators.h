#pragma once

#include <optional>
#include <vector>

namespace trendlab {
namespace analytics {

// One entry per input bar; nullopt until the window has enough history
using IndicatorSeries = std::vector<std::optional<double>>;

class TechnicalIndicators {
public:
    // Rolling arithmetic mean over `window` bars ending at each index
    static IndicatorSeries rollingMean(const std::vector<double>& values, int window);

    // Rolling sample standard deviation (n - 1 denominator)
    static IndicatorSeries rollingStdDev(const std::vector<double>& values, int window);

    // (value - rolling mean) / rolling stdev; undefined where stdev is zero
    static IndicatorSeries zScore(const std::vector<double>& values, int lookback);

    // values[i] / values[i - lookback] - 1
    static IndicatorSeries trailingReturn(const std::vector<double>& values, int lookback);

    static double calculateMean(const std::vector<double>& values);

    // ddof = 0 population, ddof = 1 sample
    static double calculateStandardDeviation(const std::vector<double>& values, double mean, int ddof = 0);

private:
    static double windowMean(const std::vector<double>& values, size_t end_inclusive, int window);
};

} // namespace analytics
} // namespace trendlab
