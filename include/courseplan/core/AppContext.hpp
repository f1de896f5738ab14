#pragma once

#include <QString>
#include <QVariantList>
#include <memory>

namespace courseplan {
namespace data {
struct ParseResult;
}

namespace core {

class OccupancyCache;
class PlannerSettings;
class Selection;

class AppContext
{
public:
    AppContext();
    explicit AppContext(std::unique_ptr<PlannerSettings> settings);
    ~AppContext();

    // Replaces the loaded courses; the selection starts empty.
    void loadRows(const QVariantList &rows);
    bool loadCsvFile(const QString &filePath, QString *errorMessage = nullptr);

    PlannerSettings &settings();
    const data::ParseResult &courses() const;
    const OccupancyCache &occupancy() const;
    Selection &selection();

private:
    std::unique_ptr<PlannerSettings> m_settings;
    std::unique_ptr<data::ParseResult> m_result;
    std::unique_ptr<OccupancyCache> m_occupancy;
    std::unique_ptr<Selection> m_selection;
};

} // namespace core
} // namespace courseplan
