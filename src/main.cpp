#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QString>
#include <QStringList>
#include <QTextStream>

#include "version.h"

#include "courseplan/core/PlannerCommand.hpp"

using namespace courseplan;

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("CoursePlanner"));
    QCoreApplication::setApplicationName(QStringLiteral("course-planner"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kCoursePlannerVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Parses a course table and checks timetable selections."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("file"), QStringLiteral("Course table exported as CSV."));

    const QCommandLineOption reportOption(QStringLiteral("report"), QStringLiteral("Print the load diagnostics."));
    const QCommandLineOption selectOption(QStringLiteral("select"),
                                          QStringLiteral("Propose a course, given as CODE:CLASS. Repeatable."),
                                          QStringLiteral("uid"));
    const QCommandLineOption creditOption(QStringLiteral("credit-limit"),
                                          QStringLiteral("Credit ceiling for the selection."),
                                          QStringLiteral("credits"));
    const QCommandLineOption weekOption(QStringLiteral("week"),
                                        QStringLiteral("Print the selection's grid for this week."),
                                        QStringLiteral("week"));
    const QCommandLineOption configOption(QStringLiteral("config"), QStringLiteral("Read settings from an INI file."),
                                          QStringLiteral("file"));
    parser.addOptions({reportOption, selectOption, creditOption, weekOption, configOption});
    parser.process(app);

    QTextStream out(stdout);
    out.setCodec("UTF-8");
    QTextStream err(stderr);
    err.setCodec("UTF-8");

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        err << "Expected exactly one course table file.\n";
        err.flush();
        parser.showHelp(core::ExitInputError);
    }

    core::PlannerRequest request;
    request.filePath = positional.first();
    request.configPath = parser.value(configOption);
    request.report = parser.isSet(reportOption);
    request.selections = parser.values(selectOption);
    request.creditLimit = parser.value(creditOption);
    request.week = parser.value(weekOption);
    return core::runPlannerCommand(request, out, err);
}
