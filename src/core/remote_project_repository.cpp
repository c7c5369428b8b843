#include "core/remote_project_repository.hpp"

#include <algorithm>

#include "common/logging.hpp"

namespace worklog {

Project toProject(const RemoteProjectData &data)
{
    const EntityKey projectKey = EntityKey::remote(data.id);
    Project project{projectKey, data.name, data.description, data.status, {}};
    for (const auto &activity : data.activities) {
        project.activities.push_back(Activity{EntityKey::remote(activity.id),
                                              activity.name,
                                              activity.description,
                                              projectKey,
                                              activity.alias});
    }
    return project;
}

RemoteProjectRepository::RemoteProjectRepository(RemoteApi &api, RemoteCache &cache)
    : m_api(api)
    , m_cache(cache)
{
}

void RemoteProjectRepository::replace(const std::vector<RemoteProjectData> &data) const
{
    std::vector<Project> projects;
    projects.reserve(data.size());
    for (const auto &item : data) {
        projects.push_back(toProject(item));
    }
    m_projects = std::move(projects);
}

const std::vector<Project> &RemoteProjectRepository::projects() const
{
    if (m_projects) {
        return *m_projects;
    }

    std::vector<RemoteProjectData> data = m_cache.projects();
    if (data.empty()) {
        WLOG_INFO(QStringLiteral("RemoteProjectRepository"),
                  QStringLiteral("projects"),
                  QStringLiteral("project_cache_empty"),
                  QStringLiteral("first_use"),
                  QStringLiteral("fetch_from_api"),
                  logging::defaultWho(),
                  logging::currentCorrelationId(),
                  nlohmann::json::object());
        data = m_api.fetchProjectsAll();
        m_cache.replaceProjects(data);
    }
    replace(data);
    return *m_projects;
}

void RemoteProjectRepository::refresh()
{
    const std::vector<RemoteProjectData> data = m_api.fetchProjectsAll();
    m_cache.replaceProjects(data);
    replace(data);

    WLOG_INFO(QStringLiteral("RemoteProjectRepository"),
              QStringLiteral("refresh"),
              QStringLiteral("projects_refreshed"),
              QStringLiteral("user_command"),
              QStringLiteral("fetch_from_api"),
              logging::defaultWho(),
              logging::currentCorrelationId(),
              (nlohmann::json{{"count", data.size()}}));
}

std::vector<Project> RemoteProjectRepository::all(const ProjectStatuses &statuses) const
{
    std::vector<Project> result;
    for (const auto &project : projects()) {
        if (hasProjectStatus(project, statuses)) {
            result.push_back(project);
        }
    }
    return result;
}

std::optional<Project> RemoteProjectRepository::get(const EntityKey &key) const
{
    if (!key.isRemote()) {
        return std::nullopt;
    }
    for (const auto &project : projects()) {
        if (project.key == key) {
            return project;
        }
    }
    return std::nullopt;
}

std::vector<Project> RemoteProjectRepository::getByNameLike(const std::string &name) const
{
    return matchProjectsByName(all(), name, true);
}

std::optional<Project> RemoteProjectRepository::getByActivityId(const EntityKey &activityKey) const
{
    if (!activityKey.isRemote()) {
        return std::nullopt;
    }
    // Any status: timesheets and frames may point at inactive projects.
    for (const auto &project : projects()) {
        const bool found = std::any_of(project.activities.begin(), project.activities.end(),
                                       [&](const Activity &a) { return a.key == activityKey; });
        if (found) {
            return project;
        }
    }
    return std::nullopt;
}

std::optional<Project> RemoteProjectRepository::getByActivityAlias(const std::string &alias) const
{
    for (const auto &project : all()) {
        const bool found = std::any_of(project.activities.begin(), project.activities.end(),
                                       [&](const Activity &a) { return a.alias == alias; });
        if (found) {
            return project;
        }
    }
    return std::nullopt;
}

std::vector<std::string> RemoteProjectRepository::allAliases() const
{
    std::vector<std::string> aliases;
    for (const auto &project : all()) {
        for (const auto &activity : project.activities) {
            if (activity.alias) {
                aliases.push_back(*activity.alias);
            }
        }
    }
    return aliases;
}

} // namespace worklog
