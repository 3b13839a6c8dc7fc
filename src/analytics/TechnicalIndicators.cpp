#include "analytics/TechnicalIndicators.h"

#include <cmath>
#include <numeric>

namespace trendlab {
namespace analytics {

namespace {
// Standard deviations below this are treated as a flat window
constexpr double kFlatStdDev = 1e-12;
}

double TechnicalIndicators::windowMean(const std::vector<double>& values, size_t end_inclusive, int window) {
    const size_t begin = end_inclusive + 1 - static_cast<size_t>(window);
    double sum = 0.0;
    for (size_t i = begin; i <= end_inclusive; ++i) {
        sum += values[i];
    }
    return sum / window;
}

IndicatorSeries TechnicalIndicators::rollingMean(const std::vector<double>& values, int window) {
    IndicatorSeries out(values.size());
    if (window < 1) {
        return out;
    }

    for (size_t i = static_cast<size_t>(window) - 1; i < values.size(); ++i) {
        out[i] = windowMean(values, i, window);
    }
    return out;
}

IndicatorSeries TechnicalIndicators::rollingStdDev(const std::vector<double>& values, int window) {
    IndicatorSeries out(values.size());
    if (window < 2) {
        return out;
    }

    for (size_t i = static_cast<size_t>(window) - 1; i < values.size(); ++i) {
        const double mean = windowMean(values, i, window);
        double sq_sum = 0.0;
        for (size_t j = i + 1 - static_cast<size_t>(window); j <= i; ++j) {
            const double diff = values[j] - mean;
            sq_sum += diff * diff;
        }
        out[i] = std::sqrt(sq_sum / (window - 1));
    }
    return out;
}

IndicatorSeries TechnicalIndicators::zScore(const std::vector<double>& values, int lookback) {
    const auto means = rollingMean(values, lookback);
    const auto stdevs = rollingStdDev(values, lookback);

    IndicatorSeries out(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        if (!means[i] || !stdevs[i] || *stdevs[i] < kFlatStdDev) {
            continue;
        }
        out[i] = (values[i] - *means[i]) / *stdevs[i];
    }
    return out;
}

IndicatorSeries TechnicalIndicators::trailingReturn(const std::vector<double>& values, int lookback) {
    IndicatorSeries out(values.size());
    if (lookback < 1) {
        return out;
    }

    for (size_t i = static_cast<size_t>(lookback); i < values.size(); ++i) {
        const double base = values[i - static_cast<size_t>(lookback)];
        if (base > 0.0) {
            out[i] = values[i] / base - 1.0;
        }
    }
    return out;
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double TechnicalIndicators::calculateStandardDeviation(const std::vector<double>& values, double mean, int ddof) {
    if (values.size() <= static_cast<size_t>(ddof)) return 0.0;

    double sq_sum = 0.0;
    for (double v : values) {
        sq_sum += (v - mean) * (v - mean);
    }
    return std::sqrt(sq_sum / (values.size() - ddof));
}

} // namespace analytics
} // namespace trendlab
