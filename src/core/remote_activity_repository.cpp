#include "core/remote_activity_repository.hpp"

namespace worklog {

RemoteActivityRepository::RemoteActivityRepository(const RemoteProjectStore &projects)
    : m_projects(projects)
{
}

std::vector<Activity> RemoteActivityRepository::all(bool activeOnly) const
{
    std::vector<Activity> activities;
    for (const auto &project : m_projects.all(activeOnly ? activeStatuses() : ProjectStatuses())) {
        activities.insert(activities.end(), project.activities.begin(), project.activities.end());
    }
    return activities;
}

std::optional<Activity> RemoteActivityRepository::get(const EntityKey &key) const
{
    if (!key.isRemote()) {
        return std::nullopt;
    }
    const auto project = m_projects.getByActivityId(key);
    if (!project) {
        return std::nullopt;
    }
    for (const auto &activity : project->activities) {
        if (activity.key == key) {
            return activity;
        }
    }
    return std::nullopt;
}

std::optional<Activity> RemoteActivityRepository::getByAlias(const std::string &alias, bool activeOnly) const
{
    for (const auto &activity : all(activeOnly)) {
        if (activity.alias == alias) {
            return activity;
        }
    }
    return std::nullopt;
}

std::vector<Activity> RemoteActivityRepository::searchByNameOrAlias(const std::string &search,
                                                                    bool activeOnly) const
{
    return filterActivitiesByNameOrAlias(all(activeOnly), search);
}

std::vector<Activity> RemoteActivityRepository::searchByAlias(const std::string &search) const
{
    return filterActivitiesByAlias(all(true), search);
}

} // namespace worklog
