#include "backtest/MetricsCalculator.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <cmath>

namespace trendlab {
namespace backtest {

namespace {
// Rounding noise from share arithmetic on a flat curve must not produce a Sharpe ratio
constexpr double kFlatVolatility = 1e-12;
}

std::vector<double> MetricsCalculator::periodReturns(const std::vector<EquityPoint>& curve) {
    std::vector<double> returns;
    if (curve.size() < 2) {
        return returns;
    }
    returns.reserve(curve.size() - 1);

    for (size_t i = 1; i < curve.size(); ++i) {
        const double prev = curve[i - 1].equity;
        returns.push_back((prev != 0.0) ? (curve[i].equity / prev) - 1.0 : 0.0);
    }
    return returns;
}

double MetricsCalculator::maxDrawdown(const std::vector<EquityPoint>& curve) {
    double peak = 0.0;
    double worst = 0.0;
    for (const auto& point : curve) {
        peak = std::max(peak, point.equity);
        if (peak > 0.0) {
            worst = std::max(worst, (peak - point.equity) / peak);
        }
    }
    return worst;
}

MetricSummary MetricsCalculator::compute(const std::vector<EquityPoint>& curve, int periods_per_year) {
    MetricSummary summary;
    if (curve.size() < 2 || periods_per_year <= 0) {
        return summary;
    }

    const double first = curve.front().equity;
    const double last = curve.back().equity;
    if (first > 0.0) {
        const double growth = last / first;
        summary.cumulative_return = growth - 1.0;

        const double periods = static_cast<double>(curve.size() - 1);
        summary.cagr = (growth > 0.0)
            ? std::pow(growth, static_cast<double>(periods_per_year) / periods) - 1.0
            : -1.0;
    }

    summary.max_drawdown = maxDrawdown(curve);

    const auto returns = periodReturns(curve);
    const double mean = analytics::TechnicalIndicators::calculateMean(returns);
    const double stdev = analytics::TechnicalIndicators::calculateStandardDeviation(returns, mean, 0);
    summary.volatility = stdev * std::sqrt(static_cast<double>(periods_per_year));
    if (summary.volatility < kFlatVolatility) {
        summary.volatility = 0.0;
    }
    summary.sharpe_ratio = (summary.volatility > 0.0)
        ? (mean * periods_per_year) / summary.volatility
        : 0.0;

    return summary;
}

} // namespace backtest
} // namespace trendlab
