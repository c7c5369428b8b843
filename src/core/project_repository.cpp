#include "core/project_repository.hpp"

namespace worklog {

ProjectRepository::ProjectRepository(LocalProjectStore &local, RemoteProjectStore &remote)
    : m_local(local)
    , m_remote(remote)
{
}

std::vector<Project> ProjectRepository::all(const ProjectStatuses &statuses) const
{
    std::vector<Project> result = m_local.all(statuses);
    std::vector<Project> remote = m_remote.all(statuses);
    result.insert(result.end(), remote.begin(), remote.end());
    return result;
}

std::optional<Project> ProjectRepository::get(const EntityKey &key) const
{
    switch (key.source()) {
    case EntitySource::Local:
        return m_local.get(key);
    case EntitySource::Remote:
        return m_remote.get(key);
    }
    return std::nullopt;
}

std::vector<Project> ProjectRepository::getByNameLike(const std::string &name) const
{
    std::vector<Project> candidates = m_local.getByNameLike(name);
    std::vector<Project> remote = m_remote.getByNameLike(name);
    candidates.insert(candidates.end(), remote.begin(), remote.end());
    return matchProjectsByName(candidates, name, true);
}

std::optional<Project> ProjectRepository::getByActivityId(const EntityKey &activityKey) const
{
    switch (activityKey.source()) {
    case EntitySource::Local:
        return m_local.getByActivityId(activityKey);
    case EntitySource::Remote:
        return m_remote.getByActivityId(activityKey);
    }
    return std::nullopt;
}

std::optional<Project> ProjectRepository::getByActivityAlias(const std::string &alias) const
{
    if (auto project = m_local.getByActivityAlias(alias)) {
        return project;
    }
    return m_remote.getByActivityAlias(alias);
}

std::vector<std::string> ProjectRepository::allAliases() const
{
    std::vector<std::string> aliases = m_local.allAliases();
    std::vector<std::string> remote = m_remote.allAliases();
    aliases.insert(aliases.end(), remote.begin(), remote.end());
    return aliases;
}

Project ProjectRepository::create(const std::string &name, const std::string &description, int status)
{
    return m_local.create(name, description, status);
}

Project ProjectRepository::update(const EntityKey &key,
                                  std::optional<std::string> name,
                                  std::optional<std::string> description,
                                  std::optional<int> status)
{
    return m_local.update(key, std::move(name), std::move(description), status);
}

void ProjectRepository::remove(const EntityKey &key, bool force)
{
    m_local.remove(key, force);
}

bool ProjectRepository::hasActivities(const EntityKey &key) const
{
    return m_local.hasActivities(key);
}

std::vector<Activity> ProjectRepository::activities(const EntityKey &key) const
{
    switch (key.source()) {
    case EntitySource::Local:
        return m_local.activities(key);
    case EntitySource::Remote: {
        const auto project = m_remote.get(key);
        return project ? project->activities : std::vector<Activity>();
    }
    }
    return {};
}

void ProjectRepository::forceDelete(const EntityKey &key,
                                    const ActivityCallback &deleteActivity,
                                    const ActivityCallback &deleteFrames)
{
    m_local.forceDelete(key, deleteActivity, deleteFrames);
}

void ProjectRepository::refresh()
{
    m_remote.refresh();
}

} // namespace worklog
