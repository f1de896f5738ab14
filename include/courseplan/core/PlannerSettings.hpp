#pragma once

#include <QString>
#include <QStringList>
#include <memory>

#include "courseplan/data/RoomRules.hpp"

class QSettings;

namespace courseplan {
namespace core {

// Persistent configuration. Uses the application's default QSettings
// location unless an INI file is given.
class PlannerSettings
{
public:
    PlannerSettings();
    explicit PlannerSettings(const QString &iniFilePath);
    ~PlannerSettings();

    double creditLimit() const;
    void setCreditLimit(double limit);

    QStringList extraRoomPatterns() const;
    void setExtraRoomPatterns(const QStringList &patterns);

    // Default rules followed by the configured ones.
    data::RoomRuleSet roomRules() const;

    void sync();

private:
    std::unique_ptr<QSettings> m_settings;
};

} // namespace core
} // namespace courseplan
