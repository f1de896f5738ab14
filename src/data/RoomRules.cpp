#include "courseplan/data/RoomRules.hpp"

#include "courseplan/Logging.hpp"

namespace courseplan {
namespace data {

namespace {
const QString TEACHING_BUILDING_RULE = QStringLiteral("(理教|一教|二教|三教|四教)\\s*([0-9]{3,4})\\s*$");
const QString SCIENCE_BUILDING_RULE = QStringLiteral("(理科\\s*[一二三四五六七八九十0-9]+号楼)\\s*([0-9]{3,4})");
} // namespace

QString RoomRule::apply(const QString &text) const
{
    const QRegularExpressionMatch match = pattern.match(text);
    if (!match.hasMatch()) {
        return {};
    }
    const int groups = pattern.captureCount();
    if (groups == 0) {
        return normalizeRoom(match.captured(0));
    }
    QString room;
    for (int i = 1; i <= groups; ++i) {
        room += match.captured(i);
    }
    return normalizeRoom(room);
}

RoomRuleSet RoomRuleSet::defaults()
{
    RoomRuleSet set;
    set.addRule(TEACHING_BUILDING_RULE);
    set.addRule(SCIENCE_BUILDING_RULE);
    return set;
}

bool RoomRuleSet::addRule(const QString &pattern)
{
    if (pattern.trimmed().isEmpty()) {
        return false;
    }
    QRegularExpression regex(pattern);
    if (!regex.isValid()) {
        qCWarning(lcParser) << "Ignoring invalid room rule" << pattern << ':' << regex.errorString();
        return false;
    }
    regex.optimize();
    m_rules.append(RoomRule{regex});
    return true;
}

const QVector<RoomRule> &RoomRuleSet::rules() const
{
    return m_rules;
}

QString RoomRuleSet::match(const QString &text) const
{
    for (const RoomRule &rule : m_rules) {
        const QString room = rule.apply(text);
        if (!room.isEmpty()) {
            return room;
        }
    }
    return {};
}

QString normalizeRoom(const QString &room)
{
    static const QRegularExpression trailingQualifier(QStringLiteral("(机房|内)$"));
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));

    QString normalized = room.trimmed();
    if (normalized.isEmpty()) {
        return {};
    }
    normalized.remove(trailingQualifier);
    normalized = normalized.trimmed();
    normalized.remove(whitespace);
    return normalized;
}

} // namespace data
} // namespace courseplan
