#include "common/Date.h"

#include <cassert>
#include <iostream>
#include <stdexcept>

using trendlab::Date;

int main() {
    const Date d = Date::parse("2024-02-29");
    assert(d.year == 2024 && d.month == 2 && d.day == 29);
    assert(d.toString() == "2024-02-29");
    assert(Date::parse("2024-02-29T16:00:00Z") == d);

    assert(Date::fromDays(d.toDays()) == d);
    assert(Date::fromDays(0) == Date::parse("1970-01-01"));
    assert(d.addDays(1) == Date::parse("2024-03-01"));
    assert(d.addDays(-60) < d);

    // Month arithmetic clamps to the last day of the month
    assert(d.addYears(-1) == Date::parse("2023-02-28"));
    assert(Date::parse("2024-03-31").addMonths(-1) == Date::parse("2024-02-29"));
    assert(Date::parse("2024-01-15").addMonths(-6) == Date::parse("2023-07-15"));
    assert(Date::parse("2023-11-30").addMonths(3) == Date::parse("2024-02-29"));

    for (const char* bad : {"2024-13-01", "2023-02-29", "2024/01/01", "20240101", "2024-01-0x"}) {
        bool threw = false;
        try {
            Date::parse(bad);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "accepted invalid date " << bad << "\n";
            return 1;
        }
    }

    std::cout << "[TEST] Date PASSED\n";
    return 0;
}
