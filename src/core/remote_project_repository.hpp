#pragma once

#include <optional>
#include <vector>

#include "core/project_store.hpp"
#include "remote/remote_api.hpp"
#include "remote/remote_cache.hpp"

namespace worklog {

// RemoteProjectRepository serves remote projects from the SQLite cache,
// filling it from the API the first time it is found empty. Reads are kept
// in memory for the lifetime of the repository.
class RemoteProjectRepository : public RemoteProjectStore {
public:
    RemoteProjectRepository(RemoteApi &api, RemoteCache &cache);

    std::vector<Project> all(const ProjectStatuses &statuses = activeStatuses()) const override;
    std::optional<Project> get(const EntityKey &key) const override;
    std::vector<Project> getByNameLike(const std::string &name) const override;
    std::optional<Project> getByActivityId(const EntityKey &activityKey) const override;
    std::optional<Project> getByActivityAlias(const std::string &alias) const override;
    std::vector<std::string> allAliases() const override;

    void refresh() override;

private:
    RemoteApi &m_api;
    RemoteCache &m_cache;
    mutable std::optional<std::vector<Project>> m_projects;

    const std::vector<Project> &projects() const;
    void replace(const std::vector<RemoteProjectData> &data) const;
};

Project toProject(const RemoteProjectData &data);

} // namespace worklog
