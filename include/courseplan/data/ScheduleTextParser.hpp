#pragma once

#include <QPair>
#include <QString>
#include <QStringList>
#include <optional>
#include <vector>

#include "courseplan/data/Meeting.hpp"
#include "courseplan/data/RoomRules.hpp"

namespace courseplan {
namespace data {

enum class LineKind
{
    Meeting,
    Exam,
    Unparsed,
};

struct LineParse
{
    LineKind kind = LineKind::Unparsed;
    std::optional<Meeting> meeting;
    QString room;
    QString warning;
};

struct ScheduleParse
{
    std::vector<Meeting> meetings;
    QStringList rooms;    // non-empty rooms, one per line that yielded one
    QStringList warnings; // one per unparsed line
};

class ScheduleTextParser
{
public:
    explicit ScheduleTextParser(RoomRuleSet roomRules = RoomRuleSet::defaults());

    ScheduleParse parse(const QString &text) const;
    LineParse parseLine(const QString &line) const;
    QString extractRoom(const QString &line) const;

    const RoomRuleSet &roomRules() const;

    static QString normalizeText(const QString &text);
    static QStringList splitLines(const QString &text);
    static bool isExamLine(const QString &line);
    static QString stripWrappingParens(const QString &line);

    // "3~16周 每周 周三 3~4节 理教107"
    static std::optional<Meeting> parsePeriodNotation(const QString &line);
    // "第1-16周周二下午1-4点半,二教205"
    static std::optional<Meeting> parseClockNotation(const QString &line);
    static std::optional<QPair<int, int>> clockToPeriods(const QString &timeOfDay, int startMinutes, int endMinutes);
    static int weekdayFromChar(const QString &ch);

private:
    RoomRuleSet m_roomRules;
};

} // namespace data
} // namespace courseplan
