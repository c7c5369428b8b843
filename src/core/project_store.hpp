#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "common/entity_key.hpp"
#include "common/enums.hpp"
#include "common/models.hpp"

namespace worklog {

// Status filter for project listings; empty means every status.
using ProjectStatuses = std::vector<ProjectStatus>;

inline ProjectStatuses activeStatuses()
{
    return {ProjectStatus::Active};
}

// Read side shared by the local store, the remote store and the facade.
class ProjectSource {
public:
    virtual ~ProjectSource() = default;

    virtual std::vector<Project> all(const ProjectStatuses &statuses = activeStatuses()) const = 0;
    virtual std::optional<Project> get(const EntityKey &key) const = 0;
    virtual std::vector<Project> getByNameLike(const std::string &name) const = 0;
    virtual std::optional<Project> getByActivityId(const EntityKey &activityKey) const = 0;
    virtual std::optional<Project> getByActivityAlias(const std::string &alias) const = 0;
    virtual std::vector<std::string> allAliases() const = 0;
};

using ActivityCallback = std::function<void(const Activity &)>;

// Projects created by the user. Every mutation takes a Local key; a Remote
// key is an InvalidOperation and an unknown key is NotFound.
class LocalProjectStore : public ProjectSource {
public:
    virtual Project create(const std::string &name,
                           const std::string &description,
                           int status = static_cast<int>(ProjectStatus::Active)) = 0;
    virtual Project update(const EntityKey &key,
                           std::optional<std::string> name,
                           std::optional<std::string> description,
                           std::optional<int> status) = 0;
    // Refuses a project that still has activities unless force is set.
    virtual void remove(const EntityKey &key, bool force = false) = 0;
    virtual bool hasActivities(const EntityKey &key) const = 0;
    virtual std::vector<Activity> activities(const EntityKey &key) const = 0;
    // For each activity: deleteFrames, then deleteActivity; then the project.
    virtual void forceDelete(const EntityKey &key,
                             const ActivityCallback &deleteActivity,
                             const ActivityCallback &deleteFrames) = 0;
    virtual Project updateActivities(const EntityKey &key, std::vector<Activity> activities) = 0;
};

// Projects owned by the remote system, served from the reference cache.
class RemoteProjectStore : public ProjectSource {
public:
    // Re-fetches every project and replaces the cache.
    virtual void refresh() = 0;
};

// Shared name matching: "starts with" matches first, each group sorted by
// name case-insensitively. With containsFallbackOnly, "contains" matches are
// returned only when nothing starts with the text.
std::vector<Project> matchProjectsByName(const std::vector<Project> &projects,
                                         const std::string &name,
                                         bool containsFallbackOnly);

bool hasProjectStatus(const Project &project, const ProjectStatuses &statuses);

} // namespace worklog
