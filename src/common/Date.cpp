#include "common/Date.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace trendlab {

namespace {
bool isLeapYear(int y) {
    return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
}

int daysInMonth(int y, int m) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && isLeapYear(y)) {
        return 29;
    }
    return kDays[m - 1];
}

int parseDigits(const std::string& text, size_t pos, size_t count) {
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        const char c = text[i];
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Invalid date: " + text);
        }
        value = value * 10 + (c - '0');
    }
    return value;
}
}

bool Date::isValid(int y, int m, int d) {
    if (m < 1 || m > 12 || d < 1) {
        return false;
    }
    return d <= daysInMonth(y, m);
}

// Howard Hinnant's days_from_civil
long long Date::toDays() const {
    const int y = (month <= 2) ? year - 1 : year;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned mp = static_cast<unsigned>((month + 9) % 12);
    const unsigned doy = (153 * mp + 2) / 5 + static_cast<unsigned>(day) - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

Date Date::fromDays(long long days) {
    days += 719468;
    const long long era = (days >= 0 ? days : days - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(days - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long y = static_cast<long long>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = (mp < 10) ? mp + 3 : mp - 9;
    return Date(static_cast<int>(m <= 2 ? y + 1 : y), static_cast<int>(m), static_cast<int>(d));
}

Date Date::parse(const std::string& text) {
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
        throw std::invalid_argument("Invalid date: " + text);
    }
    if (text.size() > 10 && text[10] != 'T' && text[10] != ' ') {
        throw std::invalid_argument("Invalid date: " + text);
    }

    const int y = parseDigits(text, 0, 4);
    const int m = parseDigits(text, 5, 2);
    const int d = parseDigits(text, 8, 2);
    if (!isValid(y, m, d)) {
        throw std::invalid_argument("Invalid date: " + text);
    }
    return Date(y, m, d);
}

Date Date::today() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    return Date(local.tm_year + 1900, local.tm_mon + 1, local.tm_mday);
}

std::string Date::toString() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return buffer;
}

Date Date::addMonths(int months) const {
    int total = year * 12 + (month - 1) + months;
    int y = total / 12;
    int m = total % 12;
    if (m < 0) {
        m += 12;
        y -= 1;
    }
    m += 1;
    const int d = std::min(day, daysInMonth(y, m));
    return Date(y, m, d);
}

} // namespace trendlab
