#pragma once

#include "core/project_store.hpp"

namespace worklog {

// ProjectRepository routes each keyed call to exactly one store by the
// key's source. Listings are Local results followed by Remote results;
// creates and mutations only ever reach the local store.
class ProjectRepository : public ProjectSource {
public:
    ProjectRepository(LocalProjectStore &local, RemoteProjectStore &remote);

    std::vector<Project> all(const ProjectStatuses &statuses = activeStatuses()) const override;
    std::optional<Project> get(const EntityKey &key) const override;
    std::vector<Project> getByNameLike(const std::string &name) const override;
    std::optional<Project> getByActivityId(const EntityKey &activityKey) const override;
    // Local first.
    std::optional<Project> getByActivityAlias(const std::string &alias) const override;
    std::vector<std::string> allAliases() const override;

    Project create(const std::string &name,
                   const std::string &description,
                   int status = static_cast<int>(ProjectStatus::Active));
    Project update(const EntityKey &key,
                   std::optional<std::string> name,
                   std::optional<std::string> description,
                   std::optional<int> status);
    void remove(const EntityKey &key, bool force = false);
    bool hasActivities(const EntityKey &key) const;
    std::vector<Activity> activities(const EntityKey &key) const;
    void forceDelete(const EntityKey &key,
                     const ActivityCallback &deleteActivity,
                     const ActivityCallback &deleteFrames);

    void refresh();

private:
    LocalProjectStore &m_local;
    RemoteProjectStore &m_remote;
};

} // namespace worklog
