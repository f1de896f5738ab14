#include "courseplan/core/PlannerCommand.hpp"

#include <QTextStream>
#include <QVector>
#include <memory>

#include "courseplan/core/AppContext.hpp"
#include "courseplan/core/ConflictChecker.hpp"
#include "courseplan/core/PlannerSettings.hpp"
#include "courseplan/core/Selection.hpp"
#include "courseplan/data/ParseResult.hpp"

namespace courseplan {
namespace core {

namespace {
constexpr int ReportExamples = 10;
constexpr int ReportRoomExamples = 5;

void printExamples(QTextStream &out, const QString &title, const QStringList &lines, int limit)
{
    if (lines.isEmpty()) {
        return;
    }
    out << '\n' << title << " (first " << qMin(limit, lines.size()) << "):\n";
    for (int i = 0; i < lines.size() && i < limit; ++i) {
        out << " - " << lines.at(i) << '\n';
    }
}

void printReport(QTextStream &out, const data::ParseResult &result)
{
    out << "rows read (without header): " << result.totalRows << '\n';
    out << "courses kept: " << static_cast<int>(result.courses.size()) << '\n';
    out << "unique course keys: " << result.byKey.size() << '\n';
    out << "key collisions: " << result.keyCollisions.size() << '\n';
    out << "rows without room: " << result.emptyRoomRows.size() << '\n';
    out << "unparsed meeting lines: " << result.meetingParseWarnings.size() << '\n';
    out << "row warnings: " << result.globalWarnings.size() << '\n';

    printExamples(out, QStringLiteral("key collisions"), result.keyCollisions, ReportExamples);
    printExamples(out, QStringLiteral("rows without room"), result.emptyRoomRows, ReportRoomExamples);
    printExamples(out, QStringLiteral("unparsed meeting lines"), result.meetingParseWarnings, ReportExamples);
    printExamples(out, QStringLiteral("row warnings"), result.globalWarnings, ReportExamples);
}

void printWeek(QTextStream &out, const Selection &selection, int week)
{
    out << "\nweek " << week << ":\n";
    const auto entries = selection.weekGrid(week);
    if (entries.isEmpty()) {
        out << " (nothing scheduled)\n";
        return;
    }
    for (const auto &entry : entries) {
        out << ' ' << weekdayLabel(entry.weekday) << " period " << entry.period << ": " << entry.courseName << " / "
            << entry.teacher << " / " << entry.place << '\n';
    }
}

bool parseUid(const QString &value, data::CourseUid *uid)
{
    const int separator = value.indexOf(':');
    if (separator <= 0) {
        return false;
    }
    uid->courseCode = value.left(separator).trimmed();
    uid->classNo = value.mid(separator + 1).trimmed();
    return !uid->courseCode.isEmpty();
}
} // namespace

int runPlannerCommand(const PlannerRequest &request, QTextStream &out, QTextStream &err)
{
    std::unique_ptr<PlannerSettings> settings;
    if (!request.configPath.isEmpty()) {
        settings = std::make_unique<PlannerSettings>(request.configPath);
    } else {
        settings = std::make_unique<PlannerSettings>();
    }
    AppContext context(std::move(settings));

    QString error;
    if (!context.loadCsvFile(request.filePath, &error)) {
        err << error << '\n';
        return ExitInputError;
    }

    if (request.report) {
        printReport(out, context.courses());
    }

    Selection &selection = context.selection();
    if (!request.creditLimit.isEmpty()) {
        bool ok = false;
        const double limit = request.creditLimit.toDouble(&ok);
        if (!ok || !selection.setCreditLimit(limit)) {
            err << "Credit limit must be a number greater than 0.\n";
            return ExitInputError;
        }
    }

    int exitCode = ExitOk;
    if (!request.selections.isEmpty()) {
        QVector<data::CourseUid> candidates;
        for (const QString &value : request.selections) {
            data::CourseUid uid;
            if (!parseUid(value, &uid)) {
                err << "Invalid course handle '" << value << "', expected CODE:CLASS.\n";
                return ExitInputError;
            }
            candidates.push_back(uid);
        }
        const AddCheck check = selection.add(candidates);
        out << check.message() << '\n';
        out << "selected credits: " << selection.totalCredits() << " / limit: " << selection.creditLimit() << '\n';
        if (!check.accepted()) {
            exitCode = ExitRejected;
        }
    }

    if (!request.week.isEmpty()) {
        bool ok = false;
        const int week = request.week.toInt(&ok);
        if (!ok || week < FirstTeachingWeek || week > LastTeachingWeek) {
            err << "Week must be between " << FirstTeachingWeek << " and " << LastTeachingWeek << ".\n";
            return ExitInputError;
        }
        printWeek(out, selection, week);
    }

    return exitCode;
}

} // namespace core
} // namespace courseplan
