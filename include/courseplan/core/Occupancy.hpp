#pragma once

#include <QHash>
#include <QSet>

#include "courseplan/data/Course.hpp"

namespace courseplan {
namespace data {
struct ParseResult;
}

namespace core {

constexpr int FirstTeachingWeek = 1;
constexpr int LastTeachingWeek = 16;

struct OccupiedCell
{
    int week = 0;
    int weekday = 0;
    int period = 0;
};

inline bool operator==(const OccupiedCell &lhs, const OccupiedCell &rhs)
{
    return lhs.week == rhs.week && lhs.weekday == rhs.weekday && lhs.period == rhs.period;
}

inline bool operator!=(const OccupiedCell &lhs, const OccupiedCell &rhs)
{
    return !(lhs == rhs);
}

inline uint qHash(const OccupiedCell &cell, uint seed = 0)
{
    return ::qHash((cell.week * 8 + cell.weekday) * 16 + cell.period, seed);
}

using CellSet = QSet<OccupiedCell>;

// Every (week, weekday, period) of the term the course's meetings claim.
CellSet occupiedCells(const data::Course &course);

// Occupied cells of every uid of a load, computed once.
class OccupancyCache
{
public:
    explicit OccupancyCache(const data::ParseResult &result);

    const CellSet &cellsFor(const data::CourseUid &uid) const;

private:
    QHash<data::CourseUid, CellSet> m_cells;
    CellSet m_empty;
};

} // namespace core
} // namespace courseplan
