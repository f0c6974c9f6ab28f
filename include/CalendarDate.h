#pragma once

#include <cstdint>
#include <string>

/**
 * @brief Proleptic Gregorian calendar day without time-of-day.
 * @details Ordering and equality use the day count, so a parsed timestamp always compares by its date part.
 */
struct CalendarDate {
    enum class OrderHint { AUTO, DMY, MDY };

    int year = 1970;
    int month = 1;
    int day = 1;

    static bool isValid(int year, int month, int day);

    /**
     * @brief Builds a date from its fields.
     * @throws FeedMix::DatasetException when the fields do not name a real day.
     */
    static CalendarDate fromYmd(int year, int month, int day);

    /**
     * @brief Parses ISO (YYYY-MM-DD), slash (DD/MM/YYYY or MM/DD/YYYY) and dash (DD-MM-YYYY) dates.
     * @details A trailing time part separated by ' ' or 'T' is accepted and discarded.
     * @post Returns false and leaves `out` untouched on failure.
     */
    static bool parse(const std::string& text, OrderHint hint, CalendarDate& out);

    int64_t daysSinceEpoch() const;
    std::string toIsoString() const;
    std::string toDisplayString() const; // DD/MM/YYYY

    bool operator==(const CalendarDate& other) const { return daysSinceEpoch() == other.daysSinceEpoch(); }
    bool operator!=(const CalendarDate& other) const { return !(*this == other); }
    bool operator<(const CalendarDate& other) const { return daysSinceEpoch() < other.daysSinceEpoch(); }
    bool operator<=(const CalendarDate& other) const { return daysSinceEpoch() <= other.daysSinceEpoch(); }
    bool operator>(const CalendarDate& other) const { return other < *this; }
    bool operator>=(const CalendarDate& other) const { return other <= *this; }
};
