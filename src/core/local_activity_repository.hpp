#pragma once

#include "core/activity_store.hpp"
#include "core/frame_repository.hpp"
#include "core/project_store.hpp"

namespace worklog {

// LocalActivityRepository stores activities inside their local project.
// Without a frame repository, frame checks report no frames.
class LocalActivityRepository : public LocalActivityStore {
public:
    explicit LocalActivityRepository(LocalProjectStore &projects, const FrameRepository *frames = nullptr);

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
    LocalProjectStore &m_projects;
    const FrameRepository *m_frames = nullptr;

    Activity requireActivity(const EntityKey &key, const char *operation) const;
};

} // namespace worklog
