#pragma once

#include <QString>
#include <QVariant>
#include <QVariantList>
#include <QVariantMap>
#include <optional>

#include "courseplan/data/Course.hpp"
#include "courseplan/data/ParseResult.hpp"
#include "courseplan/data/ScheduleTextParser.hpp"

namespace courseplan {
namespace data {

// Column names of the course table.
constexpr const char *CourseCodeField = "课程号";
constexpr const char *CourseNameField = "课程名";
constexpr const char *CategoryField = "课程类别";
constexpr const char *CreditsField = "学分";
constexpr const char *WeeklyHoursField = "周学时";
constexpr const char *TeacherField = "教师";
constexpr const char *ClassNoField = "班号";
constexpr const char *DepartmentField = "开课单位";
constexpr const char *GradeField = "年级";
constexpr const char *ScheduleField = "上课考试信息";
constexpr const char *PassFailField = "自选PNP";

// Spreadsheet numbering: row 1 holds the header.
constexpr int FirstDataRowNumber = 2;

enum class RowStatus
{
    Parsed,
    ParsedWithWarnings,
    Rejected,
};

struct RowOutcome
{
    RowStatus status = RowStatus::Rejected;
    std::optional<Course> course;
    QString message;
};

class CourseBuilder
{
public:
    explicit CourseBuilder(ScheduleTextParser parser = ScheduleTextParser());

    Course buildCourse(const QVariantMap &row) const;
    RowOutcome buildRow(const QVariant &row, int rowNumber) const;
    ParseResult load(const QVariantList &rows) const;

    static double parseCredits(const QString &value);

private:
    ScheduleTextParser m_parser;
};

} // namespace data
} // namespace courseplan
