#pragma once

#include <QString>

namespace courseplan {
namespace data {

enum class WeekPattern
{
    Every,
    Odd,
    Even,
};

// One weekly time block. Weeks and periods are 1-based and inclusive.
struct Meeting
{
    int startWeek = 1;
    int endWeek = 1;
    WeekPattern pattern = WeekPattern::Every;
    int weekday = 1; // Monday = 1 ... Sunday = 7
    int startPeriod = 1;
    int endPeriod = 1;
    QString room;
    QString raw;

    bool occursOnWeek(int week) const
    {
        if (week < startWeek || week > endWeek) {
            return false;
        }
        switch (pattern) {
        case WeekPattern::Odd:
            return week % 2 == 1;
        case WeekPattern::Even:
            return week % 2 == 0;
        case WeekPattern::Every:
        default:
            return true;
        }
    }

    bool occursOn(int week, int day, int period) const
    {
        return occursOnWeek(week) && weekday == day && startPeriod <= period && period <= endPeriod;
    }
};

inline bool operator==(const Meeting &lhs, const Meeting &rhs)
{
    return lhs.startWeek == rhs.startWeek && lhs.endWeek == rhs.endWeek && lhs.pattern == rhs.pattern
        && lhs.weekday == rhs.weekday && lhs.startPeriod == rhs.startPeriod && lhs.endPeriod == rhs.endPeriod
        && lhs.room == rhs.room && lhs.raw == rhs.raw;
}

inline bool operator!=(const Meeting &lhs, const Meeting &rhs)
{
    return !(lhs == rhs);
}

} // namespace data
} // namespace courseplan
