#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include "courseplan/data/CourseBuilder.hpp"
#include "courseplan/data/CsvRowReader.hpp"

using namespace courseplan::data;

class CsvRowReaderTest : public QObject
{
    Q_OBJECT

private slots:
    void splitsQuotedRecords();
    void keepsQuoteInsideUnquotedField();
    void mapsRowsByHeader();
    void readsFileWithByteOrderMark();
    void reportsMissingFile();
};

void CsvRowReaderTest::splitsQuotedRecords()
{
    CsvRowReader reader;
    const auto records = reader.records(QStringLiteral("a,b,c\n\"x, y\",\"say \"\"hi\"\"\",\"line1\nline2\"\n,,\n"));
    QCOMPARE(records.size(), 3);
    QCOMPARE(records.at(1).size(), 3);
    QCOMPARE(records.at(1).at(0), QStringLiteral("x, y"));
    QCOMPARE(records.at(1).at(1), QStringLiteral("say \"hi\""));
    QCOMPARE(records.at(1).at(2), QStringLiteral("line1\nline2"));
    QCOMPARE(records.at(2), (QStringList{QString(), QString(), QString()}));
}

void CsvRowReaderTest::keepsQuoteInsideUnquotedField()
{
    CsvRowReader reader;
    const QVariantList rows = reader.parse(QStringLiteral("课程号,课程名,上课考试信息,学分\n"
                                                          "001,微积分,1~16周 每周 周三 3~4节 \"理教\"107,4\n"
                                                          "002,线性代数,1~16周 每周 周一 1~2节 一教 101,3\n"
                                                          "003,a\"b\"c,\"quoted, field\",2\n"));
    QCOMPARE(rows.size(), 3);

    const QVariantMap first = rows.at(0).toMap();
    QCOMPARE(first.value(QStringLiteral("上课考试信息")).toString(),
             QStringLiteral("1~16周 每周 周三 3~4节 \"理教\"107"));
    QCOMPARE(first.value(QStringLiteral("学分")).toString(), QStringLiteral("4"));

    QCOMPARE(rows.at(1).toMap().value(QStringLiteral("课程号")).toString(), QStringLiteral("002"));

    const QVariantMap third = rows.at(2).toMap();
    QCOMPARE(third.value(QStringLiteral("课程名")).toString(), QStringLiteral("a\"b\"c"));
    QCOMPARE(third.value(QStringLiteral("上课考试信息")).toString(), QStringLiteral("quoted, field"));
    QCOMPARE(third.value(QStringLiteral("学分")).toString(), QStringLiteral("2"));
}

void CsvRowReaderTest::mapsRowsByHeader()
{
    CsvRowReader reader;
    const QVariantList rows = reader.parse(QStringLiteral(" 课程号 ,课程名,,学分\r\n"
                                                          "001,微积分,ignored,4\r\n"
                                                          "\r\n"
                                                          " , , ,\r\n"
                                                          "002,线性代数\r\n"));
    QCOMPARE(rows.size(), 2);

    const QVariantMap first = rows.at(0).toMap();
    QCOMPARE(first.size(), 3);
    QCOMPARE(first.value(QStringLiteral("课程号")).toString(), QStringLiteral("001"));
    QCOMPARE(first.value(QStringLiteral("学分")).toString(), QStringLiteral("4"));
    QVERIFY(!first.contains(QString()));

    const QVariantMap second = rows.at(1).toMap();
    QCOMPARE(second.value(QStringLiteral("课程名")).toString(), QStringLiteral("线性代数"));
    QVERIFY(second.value(QStringLiteral("学分")).toString().isEmpty());
}

void CsvRowReaderTest::readsFileWithByteOrderMark()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("courses.csv"));

    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    QByteArray content("\xEF\xBB\xBF");
    content += QStringLiteral("课程号,课程名,班号,教师,学分,上课考试信息\n"
                              "04830050,数据结构,1,李四,3,\"1~16周 每周 周二 3~4节 理教 107\n考试时间：2024-01-12\"\n")
                   .toUtf8();
    file.write(content);
    file.close();

    CsvRowReader reader;
    QString error;
    const auto rows = reader.read(path, &error);
    QVERIFY(rows.has_value());
    QVERIFY(error.isEmpty());
    QCOMPARE(rows->size(), 1);
    QVERIFY(rows->first().toMap().contains(QStringLiteral("课程号")));

    const ParseResult result = CourseBuilder().load(*rows);
    QCOMPARE(result.courses.size(), static_cast<size_t>(1));
    QCOMPARE(result.courses.front().meetings.size(), static_cast<size_t>(1));
    QCOMPARE(result.courses.front().key.room, QStringLiteral("理教107"));
}

void CsvRowReaderTest::reportsMissingFile()
{
    CsvRowReader reader;
    QString error;
    const auto rows = reader.read(QStringLiteral("/nonexistent/courses.csv"), &error);
    QVERIFY(!rows.has_value());
    QVERIFY(error.contains(QStringLiteral("/nonexistent/courses.csv")));
}

QTEST_GUILESS_MAIN(CsvRowReaderTest)
#include "CsvRowReaderTest.moc"
