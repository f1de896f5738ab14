#include "courseplan/data/CourseBuilder.hpp"

#include "courseplan/Logging.hpp"

#include <QVariantHash>
#include <cmath>

namespace courseplan {
namespace data {

namespace {
QString field(const QVariantMap &row, const char *name)
{
    const QVariant value = row.value(QString::fromUtf8(name));
    if (!value.isValid() || value.isNull()) {
        return {};
    }
    return value.toString().trimmed();
}

bool toFieldMap(const QVariant &row, QVariantMap *out)
{
    if (row.userType() == QMetaType::QVariantMap) {
        *out = row.toMap();
        return true;
    }
    if (row.userType() == QMetaType::QVariantHash) {
        const QVariantHash hash = row.toHash();
        QVariantMap map;
        for (auto it = hash.constBegin(); it != hash.constEnd(); ++it) {
            map.insert(it.key(), it.value());
        }
        *out = map;
        return true;
    }
    return false;
}

QString describeKey(const CourseKey &key)
{
    return QStringLiteral("(%1, %2, %3, %4)").arg(key.courseName, key.courseCode, key.room, key.classNo);
}
} // namespace

CourseBuilder::CourseBuilder(ScheduleTextParser parser)
    : m_parser(std::move(parser))
{
}

double CourseBuilder::parseCredits(const QString &value)
{
    const QString trimmed = value.trimmed();
    if (trimmed.isEmpty()) {
        return 0.0;
    }
    bool ok = false;
    const double credits = trimmed.toDouble(&ok);
    if (!ok || !std::isfinite(credits) || credits < 0.0) {
        return 0.0;
    }
    return credits;
}

Course CourseBuilder::buildCourse(const QVariantMap &row) const
{
    Course course;
    course.courseCode = field(row, CourseCodeField);
    course.courseName = field(row, CourseNameField);
    course.teacher = field(row, TeacherField);
    course.department = field(row, DepartmentField);
    course.classNo = field(row, ClassNoField);
    course.category = field(row, CategoryField);
    course.grade = field(row, GradeField);
    course.weeklyHours = field(row, WeeklyHoursField);
    course.passFail = field(row, PassFailField);
    course.credits = parseCredits(field(row, CreditsField));
    course.raw = row;

    ScheduleParse schedule = m_parser.parse(field(row, ScheduleField));
    course.meetings = std::move(schedule.meetings);
    course.parseWarnings = schedule.warnings;

    const QString room = schedule.rooms.isEmpty() ? QString::fromUtf8(UnknownRoom) : schedule.rooms.first();
    course.key = CourseKey{course.courseName, course.courseCode, room, course.classNo};
    course.uid = CourseUid{course.courseCode, course.classNo};
    return course;
}

RowOutcome CourseBuilder::buildRow(const QVariant &row, int rowNumber) const
{
    RowOutcome outcome;
    QVariantMap fields;
    if (!toFieldMap(row, &fields)) {
        outcome.status = RowStatus::Rejected;
        outcome.message = QStringLiteral("row %1: not a field mapping (%2)")
                              .arg(rowNumber)
                              .arg(QString::fromLatin1(row.typeName() ? row.typeName() : "invalid"));
        return outcome;
    }
    outcome.course = buildCourse(fields);
    outcome.status = outcome.course->parseWarnings.isEmpty() ? RowStatus::Parsed : RowStatus::ParsedWithWarnings;
    return outcome;
}

ParseResult CourseBuilder::load(const QVariantList &rows) const
{
    ParseResult result;
    result.totalRows = rows.size();
    result.courses.reserve(static_cast<size_t>(rows.size()));

    for (int i = 0; i < rows.size(); ++i) {
        const int rowNumber = i + FirstDataRowNumber;
        RowOutcome outcome = buildRow(rows.at(i), rowNumber);
        if (outcome.status == RowStatus::Rejected || !outcome.course) {
            qCWarning(lcLoader) << outcome.message;
            result.globalWarnings << outcome.message;
            continue;
        }

        const int index = static_cast<int>(result.courses.size());
        result.courses.push_back(std::move(*outcome.course));
        const Course &course = result.courses.back();

        const auto previous = result.byUid.constFind(course.uid);
        if (previous != result.byUid.constEnd()) {
            const Course &old = result.courses[static_cast<size_t>(previous.value())];
            result.globalWarnings << QStringLiteral("row %1: duplicate uid (%2, %3) | previous teacher=%4 new teacher=%5")
                                         .arg(rowNumber)
                                         .arg(course.uid.courseCode, course.uid.classNo, old.teacher, course.teacher);
        }
        result.byUid.insert(course.uid, index);

        if (course.hasUnknownRoom()) {
            result.emptyRoomRows << QStringLiteral("row %1: room unknown | code=%2 name=%3 class=%4 teacher=%5 | schedule=%6")
                                        .arg(rowNumber)
                                        .arg(course.courseCode, course.courseName, course.classNo, course.teacher,
                                             field(course.raw, ScheduleField));
        }

        for (const QString &warning : course.parseWarnings) {
            result.meetingParseWarnings << QStringLiteral("row %1 %2/%3/class %4 | %5")
                                               .arg(rowNumber)
                                               .arg(course.courseCode, course.courseName, course.classNo, warning);
        }

        QVector<int> &sameKey = result.byKey[course.key];
        if (!sameKey.isEmpty()) {
            const Course &first = result.courses[static_cast<size_t>(sameKey.first())];
            result.keyCollisions << QStringLiteral("row %1: key collision %2 | existing(class=%3, teacher=%4) new(class=%5, teacher=%6)")
                                        .arg(rowNumber)
                                        .arg(describeKey(course.key), first.classNo, first.teacher, course.classNo,
                                             course.teacher);
        }
        sameKey.append(index);
    }

    qCDebug(lcLoader).nospace() << "Loaded " << result.courses.size() << " courses from " << result.totalRows
                                << " rows, " << result.byKey.size() << " unique keys, " << result.keyCollisions.size()
                                << " key collisions, " << result.emptyRoomRows.size() << " rows without room, "
                                << result.meetingParseWarnings.size() << " unparsed lines, "
                                << result.globalWarnings.size() << " row warnings";
    return result;
}

} // namespace data
} // namespace courseplan
