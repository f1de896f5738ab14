#pragma once

#include <QRegularExpression>
#include <QString>
#include <QVector>

namespace courseplan {
namespace data {

// A fallback rule recovering a room from free text. The room is the
// concatenation of all capture groups, or the whole match without groups.
struct RoomRule
{
    QRegularExpression pattern;

    QString apply(const QString &text) const;
};

class RoomRuleSet
{
public:
    RoomRuleSet() = default;

    static RoomRuleSet defaults();

    bool addRule(const QString &pattern);
    const QVector<RoomRule> &rules() const;

    // First non-empty room produced by a rule, or an empty string.
    QString match(const QString &text) const;

private:
    QVector<RoomRule> m_rules;
};

// Trims, drops a trailing "机房"/"内" and removes all whitespace.
QString normalizeRoom(const QString &room);

} // namespace data
} // namespace courseplan
