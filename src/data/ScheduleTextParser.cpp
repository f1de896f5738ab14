#include "courseplan/data/ScheduleTextParser.hpp"

#include "courseplan/Logging.hpp"

#include <QRegularExpression>
#include <QVector>
#include <cstdlib>
#include <utility>

namespace courseplan {
namespace data {

namespace {
constexpr int MINUTES_PER_HOUR = 60;
constexpr int NOON = 12 * MINUTES_PER_HOUR;
constexpr int SLOT_TOLERANCE_MINUTES = 20;
constexpr int FIRST_PERIOD = 1;
constexpr int LAST_PERIOD = 12;

const QStringList EXAM_PREFIXES = {
    QStringLiteral("考试时间"),
    QStringLiteral("考试方式"),
};

struct ClockSlot
{
    QString label;
    int startMinutes;
    int endMinutes;
    int firstPeriod;
    int lastPeriod;
};

const QVector<ClockSlot> &clockSlots()
{
    static const QVector<ClockSlot> table = {
        {QStringLiteral("下午"), 13 * MINUTES_PER_HOUR, 16 * MINUTES_PER_HOUR + 30, 5, 8},
        {QStringLiteral("晚"), 18 * MINUTES_PER_HOUR, 21 * MINUTES_PER_HOUR + 30, 9, 12},
        {QStringLiteral("晚上"), 18 * MINUTES_PER_HOUR, 21 * MINUTES_PER_HOUR + 30, 9, 12},
    };
    return table;
}

const QRegularExpression &periodPattern()
{
    static const QRegularExpression pattern(QStringLiteral(
        "^\\s*(?<ws>\\d+)\\s*~\\s*(?<we>\\d+)\\s*周"
        "\\s*(?:(?<pat>每周|单周|双周)\\s*)?"
        "周(?<wd>[一二三四五六日天])"
        "\\s*(?<ps>\\d+)\\s*~\\s*(?<pe>\\d+)\\s*节"
        "\\s*(?<room>[^（(]+?)?"
        "\\s*(?:[（(].*)?$"));
    return pattern;
}

const QRegularExpression &clockPattern()
{
    static const QRegularExpression pattern(QStringLiteral(
        "^\\s*第?\\s*(?<ws>\\d+)\\s*[-~～]\\s*(?<we>\\d+)\\s*周"
        "\\s*周(?<wd>[一二三四五六日天])"
        "\\s*(?<tod>上午|下午|晚上|晚)?\\s*"
        "(?<h1>\\d{1,2})\\s*(?:[:：](?<m1>\\d{1,2}))?\\s*点?(?<half1>半)?"
        "\\s*[-~～]\\s*"
        "(?<h2>\\d{1,2})\\s*(?:[:：](?<m2>\\d{1,2}))?\\s*点?(?<half2>半)?"
        "\\s*(?:[,，]\\s*(?<room>.+?))?"
        "\\s*$"));
    return pattern;
}

WeekPattern patternFromText(const QString &text)
{
    if (text == QStringLiteral("单周")) {
        return WeekPattern::Odd;
    }
    if (text == QStringLiteral("双周")) {
        return WeekPattern::Even;
    }
    return WeekPattern::Every;
}

int clockMinutes(const QString &hours, const QString &minutes, const QString &half)
{
    const int h = hours.toInt();
    int m = minutes.isEmpty() ? 0 : minutes.toInt();
    if (!half.isEmpty()) {
        m = 30;
    }
    return h * MINUTES_PER_HOUR + m;
}

bool isWithinBounds(const Meeting &meeting)
{
    return meeting.startWeek >= 1 && meeting.startPeriod >= FIRST_PERIOD && meeting.endPeriod <= LAST_PERIOD;
}

bool isAfternoonOrEvening(const QString &timeOfDay)
{
    return timeOfDay == QStringLiteral("下午") || timeOfDay == QStringLiteral("晚")
        || timeOfDay == QStringLiteral("晚上");
}
} // namespace

ScheduleTextParser::ScheduleTextParser(RoomRuleSet roomRules)
    : m_roomRules(std::move(roomRules))
{
}

const RoomRuleSet &ScheduleTextParser::roomRules() const
{
    return m_roomRules;
}

QString ScheduleTextParser::normalizeText(const QString &text)
{
    static const QRegularExpression horizontalSpace(QStringLiteral("[ \\t]+"));
    static const QRegularExpression blankLines(QStringLiteral("\\n{2,}"));

    QString normalized = text;
    normalized.replace(QStringLiteral("\r\n"), QStringLiteral("\n"));
    normalized.replace('\r', '\n');
    normalized.replace(QChar(0xFF1B), ';');
    normalized.replace(QChar(0xFF0C), ',');
    normalized.replace(QChar(0x3000), ' ');
    for (int i = 0; i < normalized.size(); ++i) {
        const ushort code = normalized.at(i).unicode();
        if (code >= 0xFF10 && code <= 0xFF19) {
            normalized[i] = QChar('0' + (code - 0xFF10));
        }
    }
    normalized.replace(horizontalSpace, QStringLiteral(" "));
    normalized.replace(blankLines, QStringLiteral("\n"));
    return normalized.trimmed();
}

QStringList ScheduleTextParser::splitLines(const QString &text)
{
    const QString normalized = normalizeText(text);
    QStringList lines;
    if (normalized.isEmpty()) {
        return lines;
    }
    const QStringList parts = normalized.split('\n', Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        const QString line = part.trimmed();
        if (!line.isEmpty()) {
            lines << line;
        }
    }
    return lines;
}

bool ScheduleTextParser::isExamLine(const QString &line)
{
    const QString trimmed = line.trimmed();
    for (const QString &prefix : EXAM_PREFIXES) {
        if (trimmed.startsWith(prefix)) {
            return true;
        }
    }
    return false;
}

QString ScheduleTextParser::stripWrappingParens(const QString &line)
{
    static const QRegularExpression remarkPrefix(QStringLiteral("^\\s*备注[:：]\\s*"));

    QString stripped = line.trimmed();
    int begin = 0;
    while (begin < stripped.size() && (stripped.at(begin) == '(' || stripped.at(begin) == QChar(0xFF08))) {
        ++begin;
    }
    int end = stripped.size();
    while (end > begin && (stripped.at(end - 1) == ')' || stripped.at(end - 1) == QChar(0xFF09))) {
        --end;
    }
    stripped = stripped.mid(begin, end - begin);
    stripped.remove(remarkPrefix);
    return stripped.trimmed();
}

int ScheduleTextParser::weekdayFromChar(const QString &ch)
{
    static const QString days = QStringLiteral("一二三四五六日");
    if (ch.size() != 1) {
        return 0;
    }
    if (ch.at(0) == QChar(0x5929)) { // 天
        return 7;
    }
    const int index = days.indexOf(ch.at(0));
    return index < 0 ? 0 : index + 1;
}

std::optional<Meeting> ScheduleTextParser::parsePeriodNotation(const QString &line)
{
    const QString raw = line.trimmed();
    const QRegularExpressionMatch match = periodPattern().match(normalizeText(raw));
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    const int weekday = weekdayFromChar(match.captured(QStringLiteral("wd")));
    if (weekday == 0) {
        return std::nullopt;
    }

    Meeting meeting;
    meeting.startWeek = match.captured(QStringLiteral("ws")).toInt();
    meeting.endWeek = match.captured(QStringLiteral("we")).toInt();
    if (meeting.startWeek > meeting.endWeek) {
        std::swap(meeting.startWeek, meeting.endWeek);
    }
    meeting.pattern = patternFromText(match.captured(QStringLiteral("pat")));
    meeting.weekday = weekday;
    meeting.startPeriod = match.captured(QStringLiteral("ps")).toInt();
    meeting.endPeriod = match.captured(QStringLiteral("pe")).toInt();
    if (meeting.startPeriod > meeting.endPeriod) {
        std::swap(meeting.startPeriod, meeting.endPeriod);
    }
    if (!isWithinBounds(meeting)) {
        qCDebug(lcParser) << "Week or period out of range in" << raw;
        return std::nullopt;
    }
    meeting.room = normalizeRoom(match.captured(QStringLiteral("room")));
    meeting.raw = raw;
    return meeting;
}

std::optional<Meeting> ScheduleTextParser::parseClockNotation(const QString &line)
{
    const QString raw = line.trimmed();
    const QRegularExpressionMatch match = clockPattern().match(stripWrappingParens(normalizeText(raw)));
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    const int weekday = weekdayFromChar(match.captured(QStringLiteral("wd")));
    if (weekday == 0) {
        return std::nullopt;
    }

    const QString timeOfDay = match.captured(QStringLiteral("tod")).trimmed();
    int startMinutes = clockMinutes(match.captured(QStringLiteral("h1")), match.captured(QStringLiteral("m1")),
                                    match.captured(QStringLiteral("half1")));
    int endMinutes = clockMinutes(match.captured(QStringLiteral("h2")), match.captured(QStringLiteral("m2")),
                                  match.captured(QStringLiteral("half2")));

    // "下午1-4点半" means 13:00-16:30.
    if (isAfternoonOrEvening(timeOfDay)) {
        if (startMinutes < NOON) {
            startMinutes += NOON;
        }
        if (endMinutes < NOON) {
            endMinutes += NOON;
        }
    }

    const auto periods = clockToPeriods(timeOfDay, startMinutes, endMinutes);
    if (!periods) {
        qCDebug(lcParser) << "No period slot for" << raw << startMinutes << endMinutes;
        return std::nullopt;
    }

    Meeting meeting;
    meeting.startWeek = match.captured(QStringLiteral("ws")).toInt();
    meeting.endWeek = match.captured(QStringLiteral("we")).toInt();
    if (meeting.startWeek > meeting.endWeek) {
        std::swap(meeting.startWeek, meeting.endWeek);
    }
    if (meeting.startWeek < 1) {
        return std::nullopt;
    }
    meeting.pattern = WeekPattern::Every;
    meeting.weekday = weekday;
    meeting.startPeriod = periods->first;
    meeting.endPeriod = periods->second;
    meeting.room = normalizeRoom(match.captured(QStringLiteral("room")));
    meeting.raw = raw;
    return meeting;
}

std::optional<QPair<int, int>> ScheduleTextParser::clockToPeriods(const QString &timeOfDay, int startMinutes,
                                                                  int endMinutes)
{
    const QString label = timeOfDay.trimmed();
    const auto &table = clockSlots();

    for (const ClockSlot &slot : table) {
        if (!label.isEmpty() && label != slot.label) {
            continue;
        }
        if (std::abs(startMinutes - slot.startMinutes) <= SLOT_TOLERANCE_MINUTES
            && std::abs(endMinutes - slot.endMinutes) <= SLOT_TOLERANCE_MINUTES) {
            return qMakePair(slot.firstPeriod, slot.lastPeriod);
        }
    }

    for (const ClockSlot &slot : table) {
        if (!label.isEmpty() && label != slot.label) {
            continue;
        }
        if (startMinutes >= slot.startMinutes - SLOT_TOLERANCE_MINUTES
            && endMinutes <= slot.endMinutes + SLOT_TOLERANCE_MINUTES) {
            return qMakePair(slot.firstPeriod, slot.lastPeriod);
        }
    }

    if (startMinutes >= 12 * MINUTES_PER_HOUR && startMinutes <= 15 * MINUTES_PER_HOUR
        && endMinutes >= 16 * MINUTES_PER_HOUR) {
        return qMakePair(5, 8);
    }
    if (startMinutes >= 17 * MINUTES_PER_HOUR) {
        return qMakePair(9, 12);
    }
    return std::nullopt;
}

QString ScheduleTextParser::extractRoom(const QString &line) const
{
    static const QRegularExpression annotation(QStringLiteral("[（(].*?[）)]"));

    const QString normalized = normalizeText(line);

    const QRegularExpressionMatch periodMatch = periodPattern().match(normalized);
    if (periodMatch.hasMatch()) {
        return normalizeRoom(periodMatch.captured(QStringLiteral("room")));
    }
    const QRegularExpressionMatch clockMatch = clockPattern().match(stripWrappingParens(normalized));
    if (clockMatch.hasMatch()) {
        return normalizeRoom(clockMatch.captured(QStringLiteral("room")));
    }

    QString tail = normalized;
    tail.remove(annotation);
    tail = tail.trimmed();
    tail = tail.section(',', -1).trimmed();
    return m_roomRules.match(tail);
}

LineParse ScheduleTextParser::parseLine(const QString &line) const
{
    LineParse result;
    const QString trimmed = line.trimmed();
    if (isExamLine(trimmed)) {
        result.kind = LineKind::Exam;
        return result;
    }

    std::optional<Meeting> meeting = parsePeriodNotation(trimmed);
    if (!meeting) {
        meeting = parseClockNotation(trimmed);
    }

    if (meeting) {
        result.kind = LineKind::Meeting;
        result.room = meeting->room;
        result.meeting = std::move(meeting);
        return result;
    }

    result.kind = LineKind::Unparsed;
    result.warning = QStringLiteral("unparsed meeting line: %1").arg(trimmed);
    result.room = extractRoom(trimmed);
    qCDebug(lcParser) << "Unparsed line" << trimmed << "room" << result.room;
    return result;
}

ScheduleParse ScheduleTextParser::parse(const QString &text) const
{
    ScheduleParse result;
    const QStringList lines = splitLines(text);
    for (const QString &line : lines) {
        LineParse parsed = parseLine(line);
        if (parsed.kind == LineKind::Exam) {
            continue;
        }
        if (!parsed.room.isEmpty()) {
            result.rooms << parsed.room;
        }
        if (parsed.kind == LineKind::Meeting) {
            result.meetings.push_back(std::move(*parsed.meeting));
        } else if (!parsed.warning.isEmpty()) {
            result.warnings << parsed.warning;
        }
    }
    return result;
}

} // namespace data
} // namespace courseplan
