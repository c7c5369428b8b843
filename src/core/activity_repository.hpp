#pragma once

#include "core/activity_store.hpp"

namespace worklog {

// ActivityRepository routes by key source: Local keys go to the local store,
// Remote keys to the remote view. Listings return local activities first and
// alias lookups prefer a local match. Mutations are local only.
class ActivityRepository : public LocalActivityStore {
public:
    ActivityRepository(LocalActivityStore &local, const ActivitySource &remote);

    std::vector<Activity> all(bool activeOnly = true) const override;
    std::optional<Activity> get(const EntityKey &key) const override;
    std::optional<Activity> getByAlias(const std::string &alias, bool activeOnly = true) const override;
    std::vector<Activity> searchByNameOrAlias(const std::string &search,
                                              bool activeOnly = true) const override;
    std::vector<Activity> searchByAlias(const std::string &search) const override;

    Activity create(const std::string &name,
                    const std::string &description,
                    const EntityKey &projectKey,
                    std::optional<std::string> alias = std::nullopt) override;
    Activity update(const EntityKey &key,
                    std::optional<std::string> name,
                    std::optional<std::string> description,
                    std::optional<std::string> alias) override;
    void remove(const EntityKey &key, bool force = false) override;
    bool hasFrames(const EntityKey &key) const override;
    std::vector<Frame> frames(const EntityKey &key) const override;
    void forceDelete(const EntityKey &key, const FrameCallback &deleteFrame) override;

private:
    LocalActivityStore &m_local;
    const ActivitySource &m_remote;
};

} // namespace worklog
