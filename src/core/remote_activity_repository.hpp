#pragma once

#include "core/activity_store.hpp"
#include "core/project_store.hpp"

namespace worklog {

// RemoteActivityRepository is a read-only view over the activities of the
// cached remote projects.
class RemoteActivityRepository : public ActivitySource {
public:
    explicit RemoteActivityRepository(const RemoteProjectStore &projects);

    std::vector<Activity> all(bool activeOnly = true) const override;
    std::optional<Activity> get(const EntityKey &key) const override;
    std::optional<Activity> getByAlias(const std::string &alias, bool activeOnly = true) const override;
    std::vector<Activity> searchByNameOrAlias(const std::string &search,
                                              bool activeOnly = true) const override;
    std::vector<Activity> searchByAlias(const std::string &search) const override;

private:
    const RemoteProjectStore &m_projects;
};

} // namespace worklog
