#pragma once

#include <string>

namespace trendlab {

// Calendar date used as the bar key. Ordering is chronological.
struct Date {
    int year;
    int month;
    int day;

    Date() : year(1970), month(1), day(1) {}
    Date(int y, int m, int d) : year(y), month(m), day(d) {}

    // Days since 1970-01-01 (proleptic Gregorian)
    long long toDays() const;
    static Date fromDays(long long days);

    // Accepts "YYYY-MM-DD" and ISO timestamps ("YYYY-MM-DDTHH:MM:SSZ"); throws std::invalid_argument
    static Date parse(const std::string& text);
    static Date today();
    static bool isValid(int y, int m, int d);

    std::string toString() const;

    // Month arithmetic clamps the day to the target month's length (Mar 31 - 1M = Feb 28/29)
    Date addMonths(int months) const;
    Date addYears(int years) const { return addMonths(years * 12); }
    Date addDays(long long days) const { return fromDays(toDays() + days); }

    bool operator==(const Date& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const Date& other) const { return !(*this == other); }
    bool operator<(const Date& other) const {
        if (year != other.year) return year < other.year;
        if (month != other.month) return month < other.month;
        return day < other.day;
    }
    bool operator>(const Date& other) const { return other < *this; }
    bool operator<=(const Date& other) const { return !(other < *this); }
    bool operator>=(const Date& other) const { return !(*this < other); }
};

} // namespace trendlab
