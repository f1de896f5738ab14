#include "courseplan/core/ConflictChecker.hpp"

#include "courseplan/data/ParseResult.hpp"

#include <QHash>
#include <algorithm>

namespace courseplan {
namespace core {

namespace {
QVector<data::CourseUid> sortedUids(const QSet<data::CourseUid> &uids)
{
    QVector<data::CourseUid> sorted;
    sorted.reserve(uids.size());
    for (const auto &uid : uids) {
        sorted.push_back(uid);
    }
    std::sort(sorted.begin(), sorted.end());
    return sorted;
}

QString describeParty(const ConflictParty &party)
{
    return QStringLiteral("%1 | %2 | class %3").arg(party.courseName, party.teacher, party.classNo);
}

QString formatCredits(double value)
{
    return QString::number(value, 'g', 6);
}
} // namespace

QString weekdayLabel(int weekday)
{
    static const QString days = QStringLiteral("一二三四五六日");
    if (weekday < 1 || weekday > 7) {
        return QStringLiteral("周%1").arg(weekday);
    }
    return QStringLiteral("周") + days.at(weekday - 1);
}

QString TimeConflict::message() const
{
    return QStringLiteral("time conflict:\n - %1\n - %2\nat week %3, %4, period %5")
        .arg(describeParty(existing), describeParty(candidate), QString::number(cell.week),
             weekdayLabel(cell.weekday), QString::number(cell.period));
}

QString CreditExcess::message() const
{
    return QStringLiteral("credit limit exceeded: current %1, adding %2, limit %3")
        .arg(formatCredits(current), formatCredits(added), formatCredits(limit));
}

QString AddCheck::message() const
{
    switch (status) {
    case Status::Conflict:
        return conflict ? conflict->message() : QString();
    case Status::CreditExceeded:
        return credits ? credits->message() : QString();
    case Status::UnknownCourse:
        return unknownUid ? QStringLiteral("unknown course %1/%2").arg(unknownUid->courseCode, unknownUid->classNo)
                          : QString();
    case Status::Accepted:
    default:
        return QStringLiteral("accepted %1 course(s)").arg(admitted.size());
    }
}

ConflictChecker::ConflictChecker(const data::ParseResult &result, const OccupancyCache &occupancy)
    : m_result(result)
    , m_occupancy(occupancy)
{
}

ConflictParty ConflictChecker::party(const data::CourseUid &uid) const
{
    ConflictParty party;
    party.uid = uid;
    if (const data::Course *course = m_result.findByUid(uid)) {
        party.courseName = course->courseName;
        party.teacher = course->teacher;
        party.classNo = course->classNo;
    }
    return party;
}

double ConflictChecker::totalCredits(const QSet<data::CourseUid> &uids) const
{
    double total = 0.0;
    for (const auto &uid : sortedUids(uids)) {
        if (const data::Course *course = m_result.findByUid(uid)) {
            total += course->credits;
        }
    }
    return total;
}

std::optional<TimeConflict> ConflictChecker::findConflict(const QSet<data::CourseUid> &selected,
                                                          const QVector<data::CourseUid> &candidates) const
{
    QHash<OccupiedCell, data::CourseUid> owners;
    for (const auto &uid : sortedUids(selected)) {
        for (const OccupiedCell &cell : m_occupancy.cellsFor(uid)) {
            owners.insert(cell, uid);
        }
    }

    for (const auto &uid : candidates) {
        // Walk cells in a stable order so the reported cell is reproducible.
        QVector<OccupiedCell> cells;
        const CellSet &occupied = m_occupancy.cellsFor(uid);
        cells.reserve(occupied.size());
        for (const OccupiedCell &cell : occupied) {
            cells.push_back(cell);
        }
        std::sort(cells.begin(), cells.end(), [](const OccupiedCell &lhs, const OccupiedCell &rhs) {
            if (lhs.week != rhs.week) {
                return lhs.week < rhs.week;
            }
            if (lhs.weekday != rhs.weekday) {
                return lhs.weekday < rhs.weekday;
            }
            return lhs.period < rhs.period;
        });

        for (const OccupiedCell &cell : cells) {
            const auto owner = owners.constFind(cell);
            if (owner != owners.constEnd()) {
                TimeConflict conflict;
                conflict.existing = party(owner.value());
                conflict.candidate = party(uid);
                conflict.cell = cell;
                return conflict;
            }
        }
        for (const OccupiedCell &cell : cells) {
            owners.insert(cell, uid);
        }
    }
    return std::nullopt;
}

AddCheck ConflictChecker::checkAdd(const QSet<data::CourseUid> &selected, const QVector<data::CourseUid> &candidates,
                                   double creditLimit) const
{
    AddCheck check;

    QSet<data::CourseUid> seen;
    for (const auto &uid : candidates) {
        if (!m_result.findByUid(uid)) {
            check.status = AddCheck::Status::UnknownCourse;
            check.unknownUid = uid;
            check.admitted.clear();
            return check;
        }
        if (selected.contains(uid) || seen.contains(uid)) {
            continue;
        }
        seen.insert(uid);
        check.admitted.push_back(uid);
    }

    if (auto conflict = findConflict(selected, check.admitted)) {
        check.status = AddCheck::Status::Conflict;
        check.conflict = std::move(conflict);
        check.admitted.clear();
        return check;
    }

    CreditExcess credits;
    credits.current = totalCredits(selected);
    for (const auto &uid : check.admitted) {
        credits.added += m_result.findByUid(uid)->credits;
    }
    credits.limit = creditLimit;
    if (credits.current + credits.added > credits.limit + CreditTolerance) {
        check.status = AddCheck::Status::CreditExceeded;
        check.credits = credits;
        check.admitted.clear();
        return check;
    }

    check.status = AddCheck::Status::Accepted;
    return check;
}

} // namespace core
} // namespace courseplan
