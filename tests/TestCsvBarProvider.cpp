#include "data/CsvBarProvider.h"
#include "common/Errors.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace trendlab;

namespace fs = std::filesystem;

int main() {
    const fs::path dir = fs::temp_directory_path() / "trendlab_test_csv_provider";
    fs::remove_all(dir);
    fs::create_directories(dir);

    {
        std::ofstream out(dir / "AAPL_weekly.csv");
        out << "date,close\n"
            << "2023-01-13,101.5\n"
            << "2023-01-06,100.0\n"
            << "2023-01-13,999.0\n"
            << "2023-01-20,not-a-number\n"
            << "2023-01-27T00:00:00Z,104.0\n"
            << "2023-02-03,105.0\n";
    }
    {
        std::ofstream out(dir / "SPY_daily.csv");
        out << "Date,Open,High,Low,Close,Volume\n"
            << "2023-03-01,1,2,0.5,400.25,1000\n"
            << "2023-03-02,1,2,0.5,401.75,1000\n";
    }
    {
        std::ofstream out(dir / "MSFT_weekly.json");
        out << R"([{"date": "2023-01-06", "close": 240.0}, {"t": "2023-01-13", "c": 245.5}])";
    }
    {
        std::ofstream out(dir / "ODD_weekly.csv");
        out << "date,close\n"
            << "2023-01-06,nan\n"
            << "2023-01-13,inf\n"
            << "2023-01-20,0\n"
            << "2023-01-27,-5\n"
            << "2023-02-03,10.5\n";
    }
    {
        std::ofstream out(dir / "ODDJ_weekly.json");
        out << R"([{"date": "2023-01-06", "close": 0.0}, {"date": "2023-01-13", "close": -1.5}, {"date": "2023-01-20", "close": 7.0}])";
    }
    {
        std::ofstream out(dir / "BAD_weekly.json");
        out << "{ not json";
    }

    data::CsvBarProvider provider(dir);

    {
        const auto bars = provider.getBars("aapl", Date::parse("2023-01-01"), Date::parse("2023-01-31"),
                                           Timeframe::WEEKLY);
        // Sorted, first duplicate kept, malformed row skipped, range filtered
        assert(bars.size() == 3);
        assert(bars[0].date == Date::parse("2023-01-06"));
        assert(bars[1].close == 101.5);
        assert(bars[2].date == Date::parse("2023-01-27"));
    }

    {
        const auto bars = provider.getBars("SPY", Date::parse("2023-01-01"), Date::parse("2023-12-31"),
                                           Timeframe::DAILY);
        assert(bars.size() == 2);
        assert(bars[0].close == 400.25);
    }

    {
        const auto bars = provider.getBars("MSFT", Date::parse("2023-01-01"), Date::parse("2023-12-31"),
                                           Timeframe::WEEKLY);
        assert(bars.size() == 2);
        assert(bars[1].close == 245.5);
    }

    {
        // Non-finite and non-positive closes are skipped
        const auto csv = provider.getBars("ODD", Date::parse("2023-01-01"), Date::parse("2023-12-31"),
                                          Timeframe::WEEKLY);
        assert(csv.size() == 1);
        assert(csv[0].date == Date::parse("2023-02-03") && csv[0].close == 10.5);

        const auto json = provider.getBars("ODDJ", Date::parse("2023-01-01"), Date::parse("2023-12-31"),
                                           Timeframe::WEEKLY);
        assert(json.size() == 1);
        assert(json[0].close == 7.0);
    }

    {
        bool not_found = false;
        try {
            provider.getBars("NOPE", Date::parse("2023-01-01"), Date::parse("2023-12-31"), Timeframe::WEEKLY);
        } catch (const DataError& e) {
            not_found = e.kind() == DataErrorKind::NOT_FOUND;
        }
        assert(not_found);

        // Known symbol but nothing in range
        not_found = false;
        try {
            provider.getBars("AAPL", Date::parse("2019-01-01"), Date::parse("2019-12-31"), Timeframe::WEEKLY);
        } catch (const DataError& e) {
            not_found = e.kind() == DataErrorKind::NOT_FOUND;
        }
        assert(not_found);

        bool upstream = false;
        try {
            provider.getBars("BAD", Date::parse("2023-01-01"), Date::parse("2023-12-31"), Timeframe::WEEKLY);
        } catch (const DataError& e) {
            upstream = e.kind() == DataErrorKind::UPSTREAM;
        }
        assert(upstream);
    }

    fs::remove_all(dir);
    std::cout << "[TEST] CsvBarProvider PASSED\n";
    return 0;
}
