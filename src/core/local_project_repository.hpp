#pragma once

#include <QString>

#include <nlohmann/json.hpp>

#include "core/project_store.hpp"

namespace worklog {

// LocalProjectRepository keeps user-created projects and their activities in
// local-projects.json, keyed by project uuid.
class LocalProjectRepository : public LocalProjectStore {
public:
    LocalProjectRepository();
    explicit LocalProjectRepository(const QString &path);

    std::vector<Project> all(const ProjectStatuses &statuses = activeStatuses()) const override;
    std::optional<Project> get(const EntityKey &key) const override;
    std::vector<Project> getByNameLike(const std::string &name) const override;
    std::optional<Project> getByActivityId(const EntityKey &activityKey) const override;
    std::optional<Project> getByActivityAlias(const std::string &alias) const override;
    std::vector<std::string> allAliases() const override;

    Project create(const std::string &name,
                   const std::string &description,
                   int status = static_cast<int>(ProjectStatus::Active)) override;
    Project update(const EntityKey &key,
                   std::optional<std::string> name,
                   std::optional<std::string> description,
                   std::optional<int> status) override;
    void remove(const EntityKey &key, bool force = false) override;
    bool hasActivities(const EntityKey &key) const override;
    std::vector<Activity> activities(const EntityKey &key) const override;
    void forceDelete(const EntityKey &key,
                     const ActivityCallback &deleteActivity,
                     const ActivityCallback &deleteFrames) override;
    Project updateActivities(const EntityKey &key, std::vector<Activity> activities) override;

    QString path() const;

private:
    QString m_path;

    std::vector<Project> load() const;
    void store(const std::vector<Project> &projects) const;
    void saveProject(const Project &project);
    Project requireProject(const EntityKey &key, const char *operation) const;
};

} // namespace worklog
