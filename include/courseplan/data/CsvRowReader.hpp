#pragma once

#include <QString>
#include <QStringList>
#include <QVariantList>
#include <QVector>
#include <optional>

namespace courseplan {
namespace data {

// Reads a UTF-8 CSV export of the course table. The first record is the
// header; every further record becomes a QVariantMap keyed by header name.
class CsvRowReader
{
public:
    explicit CsvRowReader(QChar delimiter = ',');

    std::optional<QVariantList> read(const QString &filePath, QString *errorMessage = nullptr) const;
    QVariantList parse(const QString &content) const;

    QVector<QStringList> records(const QString &content) const;

private:
    QChar m_delimiter;
};

} // namespace data
} // namespace courseplan
