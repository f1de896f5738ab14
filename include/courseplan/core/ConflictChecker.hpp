#pragma once

#include <QSet>
#include <QString>
#include <QVector>
#include <optional>

#include "courseplan/core/Occupancy.hpp"
#include "courseplan/data/Course.hpp"

namespace courseplan {
namespace data {
struct ParseResult;
}

namespace core {

constexpr double CreditTolerance = 1e-9;

struct ConflictParty
{
    data::CourseUid uid;
    QString courseName;
    QString teacher;
    QString classNo;
};

struct TimeConflict
{
    ConflictParty existing;
    ConflictParty candidate;
    OccupiedCell cell;

    QString message() const;
};

struct CreditExcess
{
    double current = 0.0;
    double added = 0.0;
    double limit = 0.0;

    QString message() const;
};

struct AddCheck
{
    enum class Status
    {
        Accepted,
        Conflict,
        CreditExceeded,
        UnknownCourse,
    };

    Status status = Status::Accepted;
    std::optional<TimeConflict> conflict;
    std::optional<CreditExcess> credits;
    std::optional<data::CourseUid> unknownUid;
    // Candidates that would actually be added, duplicates and selected ones removed.
    QVector<data::CourseUid> admitted;

    bool accepted() const { return status == Status::Accepted; }
    QString message() const;
};

QString weekdayLabel(int weekday);

class ConflictChecker
{
public:
    ConflictChecker(const data::ParseResult &result, const OccupancyCache &occupancy);

    AddCheck checkAdd(const QSet<data::CourseUid> &selected, const QVector<data::CourseUid> &candidates,
                      double creditLimit) const;

    std::optional<TimeConflict> findConflict(const QSet<data::CourseUid> &selected,
                                             const QVector<data::CourseUid> &candidates) const;
    double totalCredits(const QSet<data::CourseUid> &uids) const;

private:
    ConflictParty party(const data::CourseUid &uid) const;

    const data::ParseResult &m_result;
    const OccupancyCache &m_occupancy;
};

} // namespace core
} // namespace courseplan
