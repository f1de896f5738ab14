#include "courseplan/core/Occupancy.hpp"

#include "courseplan/data/ParseResult.hpp"

namespace courseplan {
namespace core {

CellSet occupiedCells(const data::Course &course)
{
    CellSet cells;
    for (int week = FirstTeachingWeek; week <= LastTeachingWeek; ++week) {
        for (const data::Meeting &meeting : course.meetings) {
            if (!meeting.occursOnWeek(week)) {
                continue;
            }
            for (int period = meeting.startPeriod; period <= meeting.endPeriod; ++period) {
                cells.insert(OccupiedCell{week, meeting.weekday, period});
            }
        }
    }
    return cells;
}

OccupancyCache::OccupancyCache(const data::ParseResult &result)
{
    m_cells.reserve(result.byUid.size());
    for (auto it = result.byUid.constBegin(); it != result.byUid.constEnd(); ++it) {
        const data::Course *course = result.findByUid(it.key());
        if (course) {
            m_cells.insert(it.key(), occupiedCells(*course));
        }
    }
}

const CellSet &OccupancyCache::cellsFor(const data::CourseUid &uid) const
{
    const auto it = m_cells.constFind(uid);
    if (it == m_cells.constEnd()) {
        return m_empty;
    }
    return it.value();
}

} // namespace core
} // namespace courseplan
