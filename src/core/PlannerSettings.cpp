#include "courseplan/core/PlannerSettings.hpp"

#include "courseplan/Logging.hpp"
#include "courseplan/core/Selection.hpp"

#include <QSettings>
#include <cmath>

namespace courseplan {
namespace core {

namespace {
const QString CREDIT_LIMIT_KEY = QStringLiteral("selection/creditLimit");
const QString ROOM_RULES_ARRAY = QStringLiteral("rooms/rules");
const QString PATTERN_KEY = QStringLiteral("pattern");
} // namespace

PlannerSettings::PlannerSettings()
    : m_settings(std::make_unique<QSettings>())
{
}

PlannerSettings::PlannerSettings(const QString &iniFilePath)
    : m_settings(std::make_unique<QSettings>(iniFilePath, QSettings::IniFormat))
{
}

PlannerSettings::~PlannerSettings() = default;

double PlannerSettings::creditLimit() const
{
    bool ok = false;
    const double stored = m_settings->value(CREDIT_LIMIT_KEY, DefaultCreditLimit).toDouble(&ok);
    if (!ok || !std::isfinite(stored) || stored <= 0.0) {
        qCWarning(lcSettings) << "Ignoring invalid" << CREDIT_LIMIT_KEY << m_settings->value(CREDIT_LIMIT_KEY);
        return DefaultCreditLimit;
    }
    return stored;
}

void PlannerSettings::setCreditLimit(double limit)
{
    if (!std::isfinite(limit) || limit <= 0.0) {
        return;
    }
    m_settings->setValue(CREDIT_LIMIT_KEY, limit);
}

QStringList PlannerSettings::extraRoomPatterns() const
{
    QStringList patterns;
    const int size = m_settings->beginReadArray(ROOM_RULES_ARRAY);
    for (int i = 0; i < size; ++i) {
        m_settings->setArrayIndex(i);
        const QString pattern = m_settings->value(PATTERN_KEY).toString().trimmed();
        if (!pattern.isEmpty()) {
            patterns << pattern;
        }
    }
    m_settings->endArray();
    return patterns;
}

void PlannerSettings::setExtraRoomPatterns(const QStringList &patterns)
{
    m_settings->remove(ROOM_RULES_ARRAY);
    m_settings->beginWriteArray(ROOM_RULES_ARRAY, patterns.size());
    for (int i = 0; i < patterns.size(); ++i) {
        m_settings->setArrayIndex(i);
        m_settings->setValue(PATTERN_KEY, patterns.at(i));
    }
    m_settings->endArray();
}

data::RoomRuleSet PlannerSettings::roomRules() const
{
    data::RoomRuleSet rules = data::RoomRuleSet::defaults();
    for (const QString &pattern : extraRoomPatterns()) {
        if (!rules.addRule(pattern)) {
            qCWarning(lcSettings) << "Skipping room rule" << pattern;
        }
    }
    return rules;
}

void PlannerSettings::sync()
{
    m_settings->sync();
}

} // namespace core
} // namespace courseplan
