#include "CalendarDate.h"
#include "CommonUtils.h"
#include "FeedMixExceptions.h"

#include <cstdio>

namespace {
bool parseFixedInt(const std::string& s, size_t offset, size_t len, int& out) {
    if (offset + len > s.size()) return false;
    int value = 0;
    for (size_t i = 0; i < len; ++i) {
        unsigned char ch = static_cast<unsigned char>(s[offset + i]);
        if (ch < '0' || ch > '9') return false;
        value = value * 10 + static_cast<int>(ch - '0');
    }
    out = value;
    return true;
}

bool isLeapYear(int year) {
    if (year % 400 == 0) return true;
    if (year % 100 == 0) return false;
    return (year % 4 == 0);
}

int daysInMonth(int year, int month) {
    static const int kMonthDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2) return isLeapYear(year) ? 29 : 28;
    return kMonthDays[month - 1];
}

int64_t daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const int mp = static_cast<int>(m) + (m > 2 ? -3 : 9);
    const unsigned doy = (153 * static_cast<unsigned>(mp) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool splitDayMonth(int a, int b, CalendarDate::OrderHint hint, int& day, int& month) {
    switch (hint) {
        case CalendarDate::OrderHint::DMY:
            day = a;
            month = b;
            return true;
        case CalendarDate::OrderHint::MDY:
            month = a;
            day = b;
            return true;
        case CalendarDate::OrderHint::AUTO:
            // Ambiguous pairs resolve day-first; only an out-of-range second field forces month-first.
            if (b > 12 && a <= 12) {
                month = a;
                day = b;
            } else {
                day = a;
                month = b;
            }
            return true;
    }
    return false;
}
} // namespace

bool CalendarDate::isValid(int year, int month, int day) {
    if (month < 1 || month > 12) return false;
    return day >= 1 && day <= daysInMonth(year, month);
}

CalendarDate CalendarDate::fromYmd(int year, int month, int day) {
    if (!isValid(year, month, day)) {
        throw FeedMix::DatasetException("Invalid calendar date: " + std::to_string(year) + "-" +
                                        std::to_string(month) + "-" + std::to_string(day));
    }
    CalendarDate out;
    out.year = year;
    out.month = month;
    out.day = day;
    return out;
}

bool CalendarDate::parse(const std::string& text, OrderHint hint, CalendarDate& out) {
    std::string s = CommonUtils::trim(text);
    if (s.empty()) return false;

    const size_t sep = s.find_first_of(" T");
    const std::string datePart = (sep == std::string::npos) ? s : s.substr(0, sep);

    int year = 0;
    int month = 0;
    int day = 0;

    if (datePart.size() == 10 && (datePart[4] == '-' || datePart[4] == '/') && datePart[7] == datePart[4]) {
        if (!parseFixedInt(datePart, 0, 4, year) ||
            !parseFixedInt(datePart, 5, 2, month) ||
            !parseFixedInt(datePart, 8, 2, day)) {
            return false;
        }
    } else if (datePart.size() == 10 && (datePart[2] == '/' || datePart[2] == '-' || datePart[2] == '.') &&
               datePart[5] == datePart[2]) {
        int a = 0;
        int b = 0;
        if (!parseFixedInt(datePart, 0, 2, a) ||
            !parseFixedInt(datePart, 3, 2, b) ||
            !parseFixedInt(datePart, 6, 4, year)) {
            return false;
        }
        if (!splitDayMonth(a, b, hint, day, month)) return false;
    } else {
        return false;
    }

    if (!isValid(year, month, day)) return false;
    out.year = year;
    out.month = month;
    out.day = day;
    return true;
}

int64_t CalendarDate::daysSinceEpoch() const {
    return daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
}

std::string CalendarDate::toIsoString() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

std::string CalendarDate::toDisplayString() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d/%02d/%04d", day, month, year);
    return buf;
}
