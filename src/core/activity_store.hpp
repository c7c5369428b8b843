#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "common/entity_key.hpp"
#include "common/models.hpp"
#include "core/frame.hpp"

namespace worklog {

// Read side shared by both activity stores and the facade. activeOnly limits
// results to activities of active projects.
class ActivitySource {
public:
    virtual ~ActivitySource() = default;

    virtual std::vector<Activity> all(bool activeOnly = true) const = 0;
    virtual std::optional<Activity> get(const EntityKey &key) const = 0;
    virtual std::optional<Activity> getByAlias(const std::string &alias, bool activeOnly = true) const = 0;
    // Case-insensitive substring match on name or alias.
    virtual std::vector<Activity> searchByNameOrAlias(const std::string &search,
                                                      bool activeOnly = true) const = 0;
    virtual std::vector<Activity> searchByAlias(const std::string &search) const = 0;
};

using FrameCallback = std::function<void(const Frame &)>;

// Activities of local projects. Mutations require Local keys.
class LocalActivityStore : public ActivitySource {
public:
    virtual Activity create(const std::string &name,
                            const std::string &description,
                            const EntityKey &projectKey,
                            std::optional<std::string> alias = std::nullopt) = 0;
    virtual Activity update(const EntityKey &key,
                            std::optional<std::string> name,
                            std::optional<std::string> description,
                            std::optional<std::string> alias) = 0;
    // Refuses an activity that frames still reference unless force is set.
    virtual void remove(const EntityKey &key, bool force = false) = 0;
    virtual bool hasFrames(const EntityKey &key) const = 0;
    // Closed frames plus the current frame when it references the activity.
    virtual std::vector<Frame> frames(const EntityKey &key) const = 0;
    virtual void forceDelete(const EntityKey &key, const FrameCallback &deleteFrame) = 0;
};

std::vector<Activity> filterActivitiesByNameOrAlias(const std::vector<Activity> &activities,
                                                    const std::string &search);
std::vector<Activity> filterActivitiesByAlias(const std::vector<Activity> &activities,
                                              const std::string &search);

} // namespace worklog
