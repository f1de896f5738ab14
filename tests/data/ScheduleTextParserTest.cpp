#include <QtTest/QtTest>

#include "courseplan/data/ScheduleTextParser.hpp"

using namespace courseplan::data;

class ScheduleTextParserTest : public QObject
{
    Q_OBJECT

private slots:
    void normalizesAndSplitsLines();
    void acceptsFullWidthDigits();
    void parsesPeriodNotation();
    void parsesOddWeeks();
    void swapsReversedRanges();
    void ignoresTrailingAnnotation();
    void rejectsOutOfRangePeriods();
    void parsesAfternoonClockNotation();
    void parsesEveningClockNotation();
    void parsesRemarkWrappedClockNotation();
    void fallsBackToContainmentRules();
    void rejectsUnmappedClockTimes();
    void skipsExamLines();
    void warnsOnUnparsedLine();
    void recoversRoomFromUnparsedLine();
    void keepsLineOrderWithoutMerging();
    void occursOnWeekMatchesPattern_data();
    void occursOnWeekMatchesPattern();
};

void ScheduleTextParserTest::normalizesAndSplitsLines()
{
    const QString text = QStringLiteral("  1~16周  每周 周一 1~2节；理教 107\r\n\r\n\r\n考试时间：2024-01-10，上午  ");
    QCOMPARE(ScheduleTextParser::normalizeText(text),
             QStringLiteral("1~16周 每周 周一 1~2节;理教 107\n考试时间：2024-01-10,上午"));

    const QStringList lines = ScheduleTextParser::splitLines(text);
    QCOMPARE(lines.size(), 2);
    QCOMPARE(lines.at(0), QStringLiteral("1~16周 每周 周一 1~2节;理教 107"));
    QVERIFY(ScheduleTextParser::splitLines(QStringLiteral(" \n \r\n")).isEmpty());
}

void ScheduleTextParserTest::acceptsFullWidthDigits()
{
    QCOMPARE(ScheduleTextParser::normalizeText(QStringLiteral("１~１６周 周三 ３~４节")),
             QStringLiteral("1~16周 周三 3~4节"));

    const ScheduleParse parsed = ScheduleTextParser().parse(QStringLiteral("１~１６周 每周 周三 ３~４节 理教１０７"));
    QVERIFY(parsed.warnings.isEmpty());
    QCOMPARE(parsed.meetings.size(), static_cast<size_t>(1));
    QCOMPARE(parsed.meetings.front().endWeek, 16);
    QCOMPARE(parsed.meetings.front().startPeriod, 3);
    QCOMPARE(parsed.meetings.front().endPeriod, 4);
    QCOMPARE(parsed.meetings.front().room, QStringLiteral("理教107"));
}

void ScheduleTextParserTest::parsesPeriodNotation()
{
    const auto meeting = ScheduleTextParser::parsePeriodNotation(QStringLiteral("3~16周 每周 周三 3~4节 理教107"));
    QVERIFY(meeting.has_value());
    QCOMPARE(meeting->startWeek, 3);
    QCOMPARE(meeting->endWeek, 16);
    QVERIFY(meeting->pattern == WeekPattern::Every);
    QCOMPARE(meeting->weekday, 3);
    QCOMPARE(meeting->startPeriod, 3);
    QCOMPARE(meeting->endPeriod, 4);
    QCOMPARE(meeting->room, QStringLiteral("理教107"));
    QCOMPARE(meeting->raw, QStringLiteral("3~16周 每周 周三 3~4节 理教107"));
}

void ScheduleTextParserTest::parsesOddWeeks()
{
    const auto meeting = ScheduleTextParser::parsePeriodNotation(QStringLiteral("1~16周 单周 周五 5~6节"));
    QVERIFY(meeting.has_value());
    QVERIFY(meeting->pattern == WeekPattern::Odd);
    QCOMPARE(meeting->weekday, 5);
    QVERIFY(meeting->room.isEmpty());
    QVERIFY(!meeting->occursOnWeek(2));
    QVERIFY(meeting->occursOnWeek(3));

    const auto even = ScheduleTextParser::parsePeriodNotation(QStringLiteral("2~16周 双周 周日 10~11节 二教 203"));
    QVERIFY(even.has_value());
    QVERIFY(even->pattern == WeekPattern::Even);
    QCOMPARE(even->weekday, 7);
    QCOMPARE(even->room, QStringLiteral("二教203"));
}

void ScheduleTextParserTest::swapsReversedRanges()
{
    const auto meeting = ScheduleTextParser::parsePeriodNotation(QStringLiteral("16~1周 周天 4~3节"));
    QVERIFY(meeting.has_value());
    QCOMPARE(meeting->startWeek, 1);
    QCOMPARE(meeting->endWeek, 16);
    QCOMPARE(meeting->weekday, 7);
    QCOMPARE(meeting->startPeriod, 3);
    QCOMPARE(meeting->endPeriod, 4);
}

void ScheduleTextParserTest::ignoresTrailingAnnotation()
{
    const auto meeting =
        ScheduleTextParser::parsePeriodNotation(QStringLiteral("1~15周 每周 周二 7~8节 三教 301机房(备注：上机)"));
    QVERIFY(meeting.has_value());
    QCOMPARE(meeting->room, QStringLiteral("三教301"));

    const auto fullWidth = ScheduleTextParser::parsePeriodNotation(QStringLiteral("1~15周 周四 1~2节（实验）"));
    QVERIFY(fullWidth.has_value());
    QVERIFY(fullWidth->room.isEmpty());
}

void ScheduleTextParserTest::rejectsOutOfRangePeriods()
{
    QVERIFY(!ScheduleTextParser::parsePeriodNotation(QStringLiteral("1~16周 周一 11~13节")).has_value());
    QVERIFY(!ScheduleTextParser::parsePeriodNotation(QStringLiteral("0~16周 周一 1~2节")).has_value());
    QVERIFY(!ScheduleTextParser::parsePeriodNotation(QStringLiteral("1~16周 周八 1~2节")).has_value());
}

void ScheduleTextParserTest::parsesAfternoonClockNotation()
{
    const auto meeting = ScheduleTextParser::parseClockNotation(QStringLiteral("1-16周周二下午1-4点半,二教205"));
    QVERIFY(meeting.has_value());
    QCOMPARE(meeting->startWeek, 1);
    QCOMPARE(meeting->endWeek, 16);
    QVERIFY(meeting->pattern == WeekPattern::Every);
    QCOMPARE(meeting->weekday, 2);
    QCOMPARE(meeting->startPeriod, 5);
    QCOMPARE(meeting->endPeriod, 8);
    QCOMPARE(meeting->room, QStringLiteral("二教205"));

    ScheduleTextParser parser;
    const LineParse line = parser.parseLine(QStringLiteral("1-16周周二下午1-4点半,二教205"));
    QVERIFY(line.kind == LineKind::Meeting);
    QVERIFY(line.warning.isEmpty());
}

void ScheduleTextParserTest::parsesEveningClockNotation()
{
    const auto meeting = ScheduleTextParser::parseClockNotation(QStringLiteral("第1～8周周四晚上6:40-9:30，理教 208"));
    QVERIFY(meeting.has_value());
    QCOMPARE(meeting->endWeek, 8);
    QCOMPARE(meeting->weekday, 4);
    QCOMPARE(meeting->startPeriod, 9);
    QCOMPARE(meeting->endPeriod, 12);
    QCOMPARE(meeting->room, QStringLiteral("理教208"));

    const auto periods = ScheduleTextParser::clockToPeriods(QStringLiteral("晚"), 18 * 60 + 10, 21 * 60 + 20);
    QVERIFY(periods.has_value());
    QCOMPARE(periods->first, 9);
    QCOMPARE(periods->second, 12);
}

void ScheduleTextParserTest::parsesRemarkWrappedClockNotation()
{
    const auto meeting =
        ScheduleTextParser::parseClockNotation(QStringLiteral("(备注：第3-10周周六下午1:00-4:30, 地学楼 203)"));
    QVERIFY(meeting.has_value());
    QCOMPARE(meeting->startWeek, 3);
    QCOMPARE(meeting->endWeek, 10);
    QCOMPARE(meeting->weekday, 6);
    QCOMPARE(meeting->startPeriod, 5);
    QCOMPARE(meeting->room, QStringLiteral("地学楼203"));
}

void ScheduleTextParserTest::fallsBackToContainmentRules()
{
    const auto afternoon = ScheduleTextParser::parseClockNotation(QStringLiteral("1-16周周三14:00-17:00"));
    QVERIFY(afternoon.has_value());
    QCOMPARE(afternoon->startPeriod, 5);
    QCOMPARE(afternoon->endPeriod, 8);

    const auto evening = ScheduleTextParser::clockToPeriods(QString(), 17 * 60 + 30, 19 * 60);
    QVERIFY(evening.has_value());
    QCOMPARE(evening->first, 9);
    QCOMPARE(evening->second, 12);
}

void ScheduleTextParserTest::rejectsUnmappedClockTimes()
{
    QVERIFY(!ScheduleTextParser::parseClockNotation(QStringLiteral("1-16周周一上午8-10点")).has_value());
    QVERIFY(!ScheduleTextParser::clockToPeriods(QString(), 8 * 60, 10 * 60).has_value());
}

void ScheduleTextParserTest::skipsExamLines()
{
    ScheduleTextParser parser;
    QVERIFY(ScheduleTextParser::isExamLine(QStringLiteral("考试方式:开卷")));
    QVERIFY(ScheduleTextParser::isExamLine(QStringLiteral("考试时间20240110")));

    const ScheduleParse result = parser.parse(QStringLiteral("考试时间：2024-01-10 14:00"));
    QVERIFY(result.meetings.empty());
    QVERIFY(result.warnings.isEmpty());
    QVERIFY(result.rooms.isEmpty());
}

void ScheduleTextParserTest::warnsOnUnparsedLine()
{
    ScheduleTextParser parser;
    const ScheduleParse result = parser.parse(QStringLiteral("待定"));
    QVERIFY(result.meetings.empty());
    QCOMPARE(result.warnings.size(), 1);
    QVERIFY(result.warnings.first().contains(QStringLiteral("待定")));
    QCOMPARE(result.warnings.first(), QStringLiteral("unparsed meeting line: 待定"));
}

void ScheduleTextParserTest::recoversRoomFromUnparsedLine()
{
    ScheduleTextParser parser;
    const LineParse line = parser.parseLine(QStringLiteral("时间另行通知(见课程网),理教 107"));
    QVERIFY(line.kind == LineKind::Unparsed);
    QVERIFY(!line.meeting.has_value());
    QCOMPARE(line.room, QStringLiteral("理教107"));

    const ScheduleParse result = parser.parse(QStringLiteral("时间另行通知，理科5号楼 301"));
    QCOMPARE(result.warnings.size(), 1);
    QCOMPARE(result.rooms, QStringList{QStringLiteral("理科5号楼301")});
}

void ScheduleTextParserTest::keepsLineOrderWithoutMerging()
{
    ScheduleTextParser parser;
    const QString text = QStringLiteral("1~16周 每周 周一 1~2节 理教107\n"
                                        "1~16周 每周 周一 1~2节 理教107\n"
                                        "待定\n"
                                        "1-16周周二下午1-4点半,二教205\n"
                                        "考试时间：2024-01-10");
    const ScheduleParse result = parser.parse(text);
    QCOMPARE(result.meetings.size(), static_cast<size_t>(3));
    QVERIFY(result.meetings.at(0) == result.meetings.at(1));
    QCOMPARE(result.meetings.at(2).weekday, 2);
    QCOMPARE(result.warnings.size(), 1);
    QCOMPARE(result.rooms.size(), 3);
    QCOMPARE(result.rooms.last(), QStringLiteral("二教205"));
}

void ScheduleTextParserTest::occursOnWeekMatchesPattern_data()
{
    QTest::addColumn<int>("pattern");
    QTest::newRow("every") << static_cast<int>(WeekPattern::Every);
    QTest::newRow("odd") << static_cast<int>(WeekPattern::Odd);
    QTest::newRow("even") << static_cast<int>(WeekPattern::Even);
}

void ScheduleTextParserTest::occursOnWeekMatchesPattern()
{
    QFETCH(int, pattern);
    Meeting meeting;
    meeting.startWeek = 3;
    meeting.endWeek = 12;
    meeting.pattern = static_cast<WeekPattern>(pattern);

    for (int week = 1; week <= 16; ++week) {
        bool expected = week >= 3 && week <= 12;
        if (meeting.pattern == WeekPattern::Odd) {
            expected = expected && week % 2 == 1;
        } else if (meeting.pattern == WeekPattern::Even) {
            expected = expected && week % 2 == 0;
        }
        QCOMPARE(meeting.occursOnWeek(week), expected);
    }
}

QTEST_GUILESS_MAIN(ScheduleTextParserTest)
#include "ScheduleTextParserTest.moc"
