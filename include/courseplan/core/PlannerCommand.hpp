#pragma once

#include <QString>
#include <QStringList>

class QTextStream;

namespace courseplan {
namespace core {

constexpr int ExitOk = 0;
constexpr int ExitInputError = 1;
constexpr int ExitRejected = 2;

// One run of the command line tool, after option parsing.
struct PlannerRequest
{
    QString filePath;
    QString configPath; // empty: default settings location
    bool report = false;
    QStringList selections; // CODE:CLASS handles, proposed as one batch
    QString creditLimit;
    QString week;
};

// Loads the table, then prints the report, the batch verdict and the week grid
// as requested. Returns ExitOk, ExitInputError or ExitRejected.
int runPlannerCommand(const PlannerRequest &request, QTextStream &out, QTextStream &err);

} // namespace core
} // namespace courseplan
