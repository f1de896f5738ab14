#pragma once

#include <QHash>
#include <QStringList>
#include <QVector>
#include <vector>

#include "courseplan/data/Course.hpp"

namespace courseplan {
namespace data {

// Owns every Course of one load, in input order. The indexes refer to
// positions in `courses`.
struct ParseResult
{
    std::vector<Course> courses;
    QHash<CourseKey, QVector<int>> byKey;
    QHash<CourseUid, int> byUid;

    QStringList globalWarnings;
    QStringList emptyRoomRows;
    QStringList meetingParseWarnings;
    QStringList keyCollisions;

    int totalRows = 0;

    const Course *findByUid(const CourseUid &uid) const;
    std::vector<const Course *> findByKey(const CourseKey &key) const;
};

} // namespace data
} // namespace courseplan
