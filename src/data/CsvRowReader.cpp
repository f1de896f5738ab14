#include "courseplan/data/CsvRowReader.hpp"

#include "courseplan/Logging.hpp"

#include <QFile>
#include <QTextStream>
#include <QVariantMap>

namespace courseplan {
namespace data {

namespace {
bool isBlankRecord(const QStringList &record)
{
    for (const QString &cell : record) {
        if (!cell.trimmed().isEmpty()) {
            return false;
        }
    }
    return true;
}
} // namespace

CsvRowReader::CsvRowReader(QChar delimiter)
    : m_delimiter(delimiter)
{
}

std::optional<QVariantList> CsvRowReader::read(const QString &filePath, QString *errorMessage) const
{
    QFile file(filePath);
    if (!file.exists()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("file does not exist: %1").arg(filePath);
        }
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("cannot open %1: %2").arg(filePath, file.errorString());
        }
        return std::nullopt;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    stream.setAutoDetectUnicode(true);
    const QString content = stream.readAll();

    QVariantList rows = parse(content);
    qCInfo(lcCsv) << "Read" << rows.size() << "rows from" << filePath;
    return rows;
}

QVector<QStringList> CsvRowReader::records(const QString &content) const
{
    QVector<QStringList> result;
    QStringList record;
    QString cell;
    bool inQuotes = false;
    bool fieldStarted = false;
    bool pending = false;

    int i = 0;
    if (!content.isEmpty() && content.at(0) == QChar(0xFEFF)) {
        i = 1;
    }

    auto finishCell = [&]() {
        record << cell;
        cell.clear();
        fieldStarted = false;
    };
    auto finishRecord = [&]() {
        finishCell();
        result.push_back(record);
        record.clear();
        pending = false;
    };

    for (; i < content.size(); ++i) {
        const QChar ch = content.at(i);
        if (inQuotes) {
            if (ch == '"') {
                if (i + 1 < content.size() && content.at(i + 1) == '"') {
                    cell += '"';
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                cell += ch;
            }
            continue;
        }

        // Quotes only open a field at its first character; elsewhere they are literal.
        if (ch == '"' && !fieldStarted) {
            inQuotes = true;
            fieldStarted = true;
            pending = true;
        } else if (ch == m_delimiter) {
            finishCell();
            pending = true;
        } else if (ch == '\r') {
            if (i + 1 < content.size() && content.at(i + 1) == '\n') {
                ++i;
            }
            finishRecord();
        } else if (ch == '\n') {
            finishRecord();
        } else {
            cell += ch;
            fieldStarted = true;
            pending = true;
        }
    }

    if (inQuotes) {
        qCWarning(lcCsv) << "Unterminated quoted field at end of input";
    }
    if (pending || !cell.isEmpty() || !record.isEmpty()) {
        finishRecord();
    }
    return result;
}

QVariantList CsvRowReader::parse(const QString &content) const
{
    QVariantList rows;
    const QVector<QStringList> all = records(content);
    if (all.isEmpty()) {
        return rows;
    }

    QStringList header;
    for (const QString &name : all.first()) {
        header << name.trimmed();
    }

    for (int r = 1; r < all.size(); ++r) {
        const QStringList &record = all.at(r);
        if (isBlankRecord(record)) {
            continue;
        }
        QVariantMap row;
        for (int c = 0; c < header.size(); ++c) {
            if (header.at(c).isEmpty()) {
                continue;
            }
            row.insert(header.at(c), c < record.size() ? record.at(c) : QString());
        }
        if (record.size() > header.size()) {
            qCDebug(lcCsv) << "Record" << r + 1 << "has" << record.size() << "cells, header has" << header.size();
        }
        rows << row;
    }
    return rows;
}

} // namespace data
} // namespace courseplan
