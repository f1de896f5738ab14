#include "courseplan/data/ParseResult.hpp"

namespace courseplan {
namespace data {

const Course *ParseResult::findByUid(const CourseUid &uid) const
{
    const auto it = byUid.constFind(uid);
    if (it == byUid.constEnd()) {
        return nullptr;
    }
    const int index = it.value();
    if (index < 0 || index >= static_cast<int>(courses.size())) {
        return nullptr;
    }
    return &courses[static_cast<size_t>(index)];
}

std::vector<const Course *> ParseResult::findByKey(const CourseKey &key) const
{
    std::vector<const Course *> result;
    const QVector<int> indexes = byKey.value(key);
    result.reserve(static_cast<size_t>(indexes.size()));
    for (int index : indexes) {
        if (index >= 0 && index < static_cast<int>(courses.size())) {
            result.push_back(&courses[static_cast<size_t>(index)]);
        }
    }
    return result;
}

} // namespace data
} // namespace courseplan
