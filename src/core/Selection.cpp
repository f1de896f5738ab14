#include "courseplan/core/Selection.hpp"

#include "courseplan/Logging.hpp"
#include "courseplan/core/Occupancy.hpp"
#include "courseplan/data/ParseResult.hpp"

#include <algorithm>
#include <cmath>
#include <tuple>

namespace courseplan {
namespace core {

Selection::Selection(const data::ParseResult &result, const OccupancyCache &occupancy)
    : m_result(result)
    , m_checker(result, occupancy)
{
}

double Selection::creditLimit() const
{
    return m_creditLimit;
}

bool Selection::setCreditLimit(double limit)
{
    if (!std::isfinite(limit) || limit <= 0.0) {
        qCWarning(lcSelection) << "Rejected credit limit" << limit;
        return false;
    }
    m_creditLimit = limit;
    return true;
}

AddCheck Selection::add(const QVector<data::CourseUid> &candidates)
{
    AddCheck check = m_checker.checkAdd(m_selected, candidates, m_creditLimit);
    if (!check.accepted()) {
        qCInfo(lcSelection).noquote() << "Rejected batch:" << check.message();
        return check;
    }
    for (const auto &uid : check.admitted) {
        m_selected.insert(uid);
    }
    qCDebug(lcSelection) << "Added" << check.admitted.size() << "courses, total credits" << totalCredits();
    return check;
}

int Selection::remove(const QVector<data::CourseUid> &uids)
{
    int removed = 0;
    for (const auto &uid : uids) {
        if (m_selected.remove(uid)) {
            ++removed;
        }
    }
    return removed;
}

void Selection::clear()
{
    m_selected.clear();
}

bool Selection::contains(const data::CourseUid &uid) const
{
    return m_selected.contains(uid);
}

int Selection::count() const
{
    return m_selected.size();
}

double Selection::totalCredits() const
{
    return m_checker.totalCredits(m_selected);
}

void Selection::sortForListing(QVector<data::CourseUid> &uids) const
{
    std::sort(uids.begin(), uids.end(), [this](const data::CourseUid &lhs, const data::CourseUid &rhs) {
        const data::Course *a = m_result.findByUid(lhs);
        const data::Course *b = m_result.findByUid(rhs);
        if (!a || !b) {
            return lhs < rhs;
        }
        return std::tie(a->department, a->courseName, a->teacher, a->classNo)
            < std::tie(b->department, b->courseName, b->teacher, b->classNo);
    });
}

QVector<data::CourseUid> Selection::selectedUids() const
{
    QVector<data::CourseUid> result;
    result.reserve(m_selected.size());
    for (const auto &uid : m_selected) {
        result.push_back(uid);
    }
    sortForListing(result);
    return result;
}

QVector<data::CourseUid> Selection::availableUids(const QString &department) const
{
    const QString filter = department.trimmed();
    QVector<data::CourseUid> result;
    for (auto it = m_result.byUid.constBegin(); it != m_result.byUid.constEnd(); ++it) {
        if (m_selected.contains(it.key())) {
            continue;
        }
        const data::Course *course = m_result.findByUid(it.key());
        if (!course) {
            continue;
        }
        if (!filter.isEmpty() && course->department != filter) {
            continue;
        }
        result.push_back(it.key());
    }
    sortForListing(result);
    return result;
}

QStringList Selection::departments() const
{
    QSet<QString> unique;
    for (auto it = m_result.byUid.constBegin(); it != m_result.byUid.constEnd(); ++it) {
        const data::Course *course = m_result.findByUid(it.key());
        if (course && !course->department.isEmpty()) {
            unique.insert(course->department);
        }
    }
    QStringList result(unique.begin(), unique.end());
    std::sort(result.begin(), result.end());
    return result;
}

QVector<GridEntry> Selection::weekGrid(int week) const
{
    QVector<GridEntry> entries;
    if (week < FirstTeachingWeek || week > LastTeachingWeek) {
        return entries;
    }
    for (const auto &uid : selectedUids()) {
        const data::Course *course = m_result.findByUid(uid);
        if (!course) {
            continue;
        }
        for (const data::Meeting &meeting : course->meetings) {
            if (!meeting.occursOnWeek(week)) {
                continue;
            }
            const QString place = !meeting.room.isEmpty() ? meeting.room : course->key.room;
            for (int period = meeting.startPeriod; period <= meeting.endPeriod; ++period) {
                entries.push_back(GridEntry{meeting.weekday, period, uid, course->courseName, course->teacher, place});
            }
        }
    }
    std::stable_sort(entries.begin(), entries.end(), [](const GridEntry &lhs, const GridEntry &rhs) {
        if (lhs.weekday != rhs.weekday) {
            return lhs.weekday < rhs.weekday;
        }
        return lhs.period < rhs.period;
    });
    return entries;
}

} // namespace core
} // namespace courseplan
