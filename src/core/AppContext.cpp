#include "courseplan/core/AppContext.hpp"

#include "courseplan/core/Occupancy.hpp"
#include "courseplan/core/PlannerSettings.hpp"
#include "courseplan/core/Selection.hpp"
#include "courseplan/data/CourseBuilder.hpp"
#include "courseplan/data/CsvRowReader.hpp"
#include "courseplan/data/ParseResult.hpp"

namespace courseplan {
namespace core {

AppContext::AppContext()
    : AppContext(std::make_unique<PlannerSettings>())
{
}

AppContext::AppContext(std::unique_ptr<PlannerSettings> settings)
    : m_settings(std::move(settings))
{
    if (!m_settings) {
        m_settings = std::make_unique<PlannerSettings>();
    }
    loadRows({});
}

AppContext::~AppContext() = default;

void AppContext::loadRows(const QVariantList &rows)
{
    // Selection and cache point into the result, so drop them first.
    m_selection.reset();
    m_occupancy.reset();

    const data::CourseBuilder builder{data::ScheduleTextParser(m_settings->roomRules())};
    m_result = std::make_unique<data::ParseResult>(builder.load(rows));
    m_occupancy = std::make_unique<OccupancyCache>(*m_result);
    m_selection = std::make_unique<Selection>(*m_result, *m_occupancy);
    m_selection->setCreditLimit(m_settings->creditLimit());
}

bool AppContext::loadCsvFile(const QString &filePath, QString *errorMessage)
{
    const data::CsvRowReader reader;
    const auto rows = reader.read(filePath, errorMessage);
    if (!rows) {
        return false;
    }
    loadRows(*rows);
    return true;
}

PlannerSettings &AppContext::settings()
{
    return *m_settings;
}

const data::ParseResult &AppContext::courses() const
{
    return *m_result;
}

const OccupancyCache &AppContext::occupancy() const
{
    return *m_occupancy;
}

Selection &AppContext::selection()
{
    return *m_selection;
}

} // namespace core
} // namespace courseplan
