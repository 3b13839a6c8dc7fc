#pragma once

#include <vector>

#include "common/Types.h"

namespace trendlab {
namespace backtest {

class MetricsCalculator {
public:
    // Curves with fewer than two points produce all-zero metrics
    static MetricSummary compute(const std::vector<EquityPoint>& curve, int periods_per_year);

    static std::vector<double> periodReturns(const std::vector<EquityPoint>& curve);

    // Largest (peak - equity) / peak, as a non-negative fraction
    static double maxDrawdown(const std::vector<EquityPoint>& curve);
};

} // namespace backtest
} // namespace trendlab
