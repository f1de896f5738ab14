#pragma once

#include <QSet>
#include <QString>
#include <QStringList>
#include <QVector>

#include "courseplan/core/ConflictChecker.hpp"
#include "courseplan/data/Course.hpp"

namespace courseplan {
namespace data {
struct ParseResult;
}

namespace core {

constexpr double DefaultCreditLimit = 25.0;

struct GridEntry
{
    int weekday = 0;
    int period = 0;
    data::CourseUid uid;
    QString courseName;
    QString teacher;
    QString place;
};

// The set of selected offerings of one load. Batches are added atomically.
class Selection
{
public:
    Selection(const data::ParseResult &result, const OccupancyCache &occupancy);

    double creditLimit() const;
    bool setCreditLimit(double limit);

    AddCheck add(const QVector<data::CourseUid> &candidates);
    int remove(const QVector<data::CourseUid> &uids);
    void clear();

    bool contains(const data::CourseUid &uid) const;
    int count() const;
    double totalCredits() const;

    QVector<data::CourseUid> selectedUids() const;
    QVector<data::CourseUid> availableUids(const QString &department = QString()) const;
    QStringList departments() const;

    QVector<GridEntry> weekGrid(int week) const;

private:
    void sortForListing(QVector<data::CourseUid> &uids) const;

    const data::ParseResult &m_result;
    ConflictChecker m_checker;
    QSet<data::CourseUid> m_selected;
    double m_creditLimit = DefaultCreditLimit;
};

} // namespace core
} // namespace courseplan
