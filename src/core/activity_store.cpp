#include "core/activity_store.hpp"

#include "common/string_utils.hpp"

namespace worklog {

std::vector<Activity> filterActivitiesByNameOrAlias(const std::vector<Activity> &activities,
                                                    const std::string &search)
{
    std::vector<Activity> matches;
    for (const auto &activity : activities) {
        if (containsCaseInsensitive(activity.name, search)
            || (activity.alias && containsCaseInsensitive(*activity.alias, search))) {
            matches.push_back(activity);
        }
    }
    return matches;
}

std::vector<Activity> filterActivitiesByAlias(const std::vector<Activity> &activities,
                                              const std::string &search)
{
    std::vector<Activity> matches;
    for (const auto &activity : activities) {
        if (activity.alias && containsCaseInsensitive(*activity.alias, search)) {
            matches.push_back(activity);
        }
    }
    return matches;
}

} // namespace worklog
