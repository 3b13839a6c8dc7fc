#include "backtest/MetricsCalculator.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace trendlab;
using namespace trendlab::backtest;

namespace {
bool near(double a, double b, double tol = 1e-9) {
    return std::abs(a - b) <= tol;
}

std::vector<EquityPoint> curveOf(const std::vector<double>& values) {
    std::vector<EquityPoint> curve;
    const Date start = Date::parse("2021-01-01");
    for (size_t i = 0; i < values.size(); ++i) {
        curve.emplace_back(start.addDays(static_cast<long long>(7 * i)), values[i]);
    }
    return curve;
}
}

int main() {
    {
        const auto metrics = MetricsCalculator::compute(curveOf({100.0, 110.0, 99.0, 120.0}), 52);
        assert(near(metrics.cumulative_return, 0.2));
        assert(near(metrics.cagr, std::pow(1.2, 52.0 / 3.0) - 1.0));
        assert(near(metrics.max_drawdown, 0.1));
        assert(metrics.volatility > 0.0);
        assert(metrics.sharpe_ratio > 0.0);
    }

    {
        // Cumulative return equals the compounded period returns
        const auto curve = curveOf({1000.0, 1040.0, 1010.0, 1100.0, 1050.0, 1200.0});
        double compounded = 1.0;
        for (const double r : MetricsCalculator::periodReturns(curve)) {
            compounded *= (1.0 + r);
        }
        assert(near(MetricsCalculator::compute(curve, 252).cumulative_return, compounded - 1.0));
    }

    {
        // Flat curve: no volatility, no Sharpe
        const auto metrics = MetricsCalculator::compute(curveOf({500.0, 500.0, 500.0, 500.0}), 52);
        assert(metrics.cumulative_return == 0.0);
        assert(metrics.cagr == 0.0);
        assert(metrics.max_drawdown == 0.0);
        assert(metrics.volatility == 0.0);
        assert(metrics.sharpe_ratio == 0.0);
    }

    {
        const auto empty = MetricsCalculator::compute({}, 52);
        const auto single = MetricsCalculator::compute(curveOf({100.0}), 52);
        assert(empty.cumulative_return == 0.0 && empty.sharpe_ratio == 0.0);
        assert(single.max_drawdown == 0.0 && single.volatility == 0.0);
    }

    {
        // Wiped-out account
        const auto metrics = MetricsCalculator::compute(curveOf({100.0, 50.0, 0.0}), 52);
        assert(near(metrics.cumulative_return, -1.0));
        assert(metrics.cagr == -1.0);
        assert(near(metrics.max_drawdown, 1.0));
    }

    std::cout << "[TEST] Metrics PASSED\n";
    return 0;
}
