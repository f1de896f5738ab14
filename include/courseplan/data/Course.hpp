#pragma once

#include <QHash>
#include <QPair>
#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <vector>

#include "courseplan/data/Meeting.hpp"

namespace courseplan {
namespace data {

// Placeholder room used in CourseKey when no line yields a room.
constexpr const char *UnknownRoom = "（地点未知）";

// Practical handle of an offering: (course code, class number).
struct CourseUid
{
    QString courseCode;
    QString classNo;
};

inline bool operator==(const CourseUid &lhs, const CourseUid &rhs)
{
    return lhs.courseCode == rhs.courseCode && lhs.classNo == rhs.classNo;
}

inline bool operator!=(const CourseUid &lhs, const CourseUid &rhs)
{
    return !(lhs == rhs);
}

inline bool operator<(const CourseUid &lhs, const CourseUid &rhs)
{
    if (lhs.courseCode == rhs.courseCode) {
        return lhs.classNo < rhs.classNo;
    }
    return lhs.courseCode < rhs.courseCode;
}

inline uint qHash(const CourseUid &uid, uint seed = 0)
{
    return ::qHash(qMakePair(uid.courseCode, uid.classNo), seed);
}

// Stricter identity used to spot listings that appear twice.
struct CourseKey
{
    QString courseName;
    QString courseCode;
    QString room;
    QString classNo;
};

inline bool operator==(const CourseKey &lhs, const CourseKey &rhs)
{
    return lhs.courseName == rhs.courseName && lhs.courseCode == rhs.courseCode && lhs.room == rhs.room
        && lhs.classNo == rhs.classNo;
}

inline bool operator!=(const CourseKey &lhs, const CourseKey &rhs)
{
    return !(lhs == rhs);
}

inline uint qHash(const CourseKey &key, uint seed = 0)
{
    return ::qHash(qMakePair(qMakePair(key.courseName, key.courseCode), qMakePair(key.room, key.classNo)), seed);
}

struct Course
{
    CourseUid uid;
    CourseKey key;

    QString courseName;
    QString courseCode;
    QString teacher;
    QString department;
    double credits = 0.0;
    QString classNo;
    QString category;
    QString grade;
    QString weeklyHours;
    QString passFail;
    std::vector<Meeting> meetings;

    QVariantMap raw;
    QStringList parseWarnings;

    bool hasUnknownRoom() const { return key.room == QString::fromUtf8(UnknownRoom); }
};

} // namespace data
} // namespace courseplan
