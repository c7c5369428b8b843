#include "core/local_project_repository.hpp"

#include <algorithm>

#include "common/errors.hpp"
#include "common/json_file.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/paths.hpp"
#include "common/uuid.hpp"

namespace worklog {

namespace {

Project projectFromJson(const std::string &uuid, const nlohmann::json &j)
{
    const EntityKey projectKey = EntityKey::local(j.value("id", uuid));

    Project project{projectKey, j.value("name", ""), j.value("description", ""),
                    j.value("status", static_cast<int>(ProjectStatus::Active)), {}};
    if (j.contains("activities") && j.at("activities").is_array()) {
        for (const auto &entry : j.at("activities")) {
            project.activities.push_back(Activity{EntityKey::local(entry.at("id").get<std::string>()),
                                                  entry.value("name", ""),
                                                  entry.value("description", ""),
                                                  projectKey,
                                                  optionalFromJson<std::string>(entry, "alias")});
        }
    }
    return project;
}

nlohmann::json projectToJson(const Project &project)
{
    nlohmann::json activities = nlohmann::json::array();
    for (const auto &activity : project.activities) {
        activities.push_back(nlohmann::json{
            {"id", activity.key.uuid()},
            {"name", activity.name},
            {"description", activity.description},
            {"alias", optionalToJson(activity.alias)}
        });
    }
    return nlohmann::json{
        {"id", project.key.uuid()},
        {"name", project.name},
        {"description", project.description},
        {"status", project.status},
        {"activities", activities}
    };
}

void requireLocal(const EntityKey &key, const char *operation)
{
    if (!key.isLocal()) {
        throw InvalidOperation(std::string("cannot ") + operation + " project " + key.toString()
                               + ": only local entities may be edited or deleted");
    }
}

bool hasLocalActivity(const Project &project, const std::function<bool(const Activity &)> &match)
{
    return std::any_of(project.activities.begin(), project.activities.end(), [&](const Activity &a) {
        return a.key.isLocal() && match(a);
    });
}

void logMutation(const QString &where, const QString &what, const Project &project)
{
    WLOG_INFO(QStringLiteral("LocalProjectRepository"),
              where,
              what,
              QStringLiteral("user_command"),
              QStringLiteral("atomic_json_write"),
              logging::defaultWho(),
              logging::currentCorrelationId(),
              (nlohmann::json{{"project", project.key.toString()}, {"name", project.name}}));
}

} // namespace

LocalProjectRepository::LocalProjectRepository()
    : LocalProjectRepository(paths::dataFile(QStringLiteral("local-projects.json")))
{
}

LocalProjectRepository::LocalProjectRepository(const QString &path)
    : m_path(path)
{
}

QString LocalProjectRepository::path() const
{
    return m_path;
}

std::vector<Project> LocalProjectRepository::load() const
{
    const nlohmann::json document = readJsonFile(m_path);
    if (!document.is_object()) {
        throw InvalidOperation("local project store root must be an object: " + m_path.toStdString());
    }

    std::vector<Project> projects;
    for (const auto &item : document.items()) {
        try {
            projects.push_back(projectFromJson(item.key(), item.value()));
        } catch (const nlohmann::json::exception &ex) {
            throw InvalidOperation("invalid local project " + item.key() + ": " + ex.what());
        } catch (const std::invalid_argument &ex) {
            throw InvalidOperation("invalid local project " + item.key() + ": " + ex.what());
        }
    }
    return projects;
}

void LocalProjectRepository::store(const std::vector<Project> &projects) const
{
    nlohmann::json document = nlohmann::json::object();
    for (const auto &project : projects) {
        document[project.key.uuid()] = projectToJson(project);
    }
    writeJsonFileAtomic(m_path, document);
}

void LocalProjectRepository::saveProject(const Project &project)
{
    std::vector<Project> projects = load();
    auto it = std::find_if(projects.begin(), projects.end(), [&](const Project &p) {
        return p.key == project.key;
    });
    if (it == projects.end()) {
        projects.push_back(project);
    } else {
        *it = project;
    }
    store(projects);
}

Project LocalProjectRepository::requireProject(const EntityKey &key, const char *operation) const
{
    requireLocal(key, operation);
    auto project = get(key);
    if (!project) {
        throw NotFound("cannot " + std::string(operation) + " project " + key.toString()
                       + ": project not found");
    }
    return *project;
}

std::vector<Project> LocalProjectRepository::all(const ProjectStatuses &statuses) const
{
    std::vector<Project> result;
    for (auto &project : load()) {
        if (hasProjectStatus(project, statuses)) {
            result.push_back(std::move(project));
        }
    }
    return result;
}

std::optional<Project> LocalProjectRepository::get(const EntityKey &key) const
{
    if (!key.isLocal()) {
        return std::nullopt;
    }
    for (auto &project : load()) {
        if (project.key == key) {
            return project;
        }
    }
    return std::nullopt;
}

std::vector<Project> LocalProjectRepository::getByNameLike(const std::string &name) const
{
    return matchProjectsByName(all(), name, false);
}

std::optional<Project> LocalProjectRepository::getByActivityId(const EntityKey &activityKey) const
{
    if (!activityKey.isLocal()) {
        return std::nullopt;
    }
    // Any status: frames may reference activities of inactive projects.
    for (auto &project : all(ProjectStatuses())) {
        if (hasLocalActivity(project, [&](const Activity &a) { return a.key == activityKey; })) {
            return project;
        }
    }
    return std::nullopt;
}

std::optional<Project> LocalProjectRepository::getByActivityAlias(const std::string &alias) const
{
    for (auto &project : all()) {
        if (hasLocalActivity(project, [&](const Activity &a) { return a.alias == alias; })) {
            return project;
        }
    }
    return std::nullopt;
}

std::vector<std::string> LocalProjectRepository::allAliases() const
{
    std::vector<std::string> aliases;
    for (const auto &project : all()) {
        for (const auto &activity : project.activities) {
            if (activity.alias && activity.key.isLocal()) {
                aliases.push_back(*activity.alias);
            }
        }
    }
    return aliases;
}

Project LocalProjectRepository::create(const std::string &name, const std::string &description, int status)
{
    const Project project{EntityKey::local(generateUuid()), name, description, status, {}};
    saveProject(project);
    logMutation(QStringLiteral("create"), QStringLiteral("project_created"), project);
    return project;
}

Project LocalProjectRepository::update(const EntityKey &key,
                                       std::optional<std::string> name,
                                       std::optional<std::string> description,
                                       std::optional<int> status)
{
    Project project = requireProject(key, "update");
    if (name) {
        project.name = *name;
    }
    if (description) {
        project.description = *description;
    }
    if (status) {
        project.status = *status;
    }
    saveProject(project);
    logMutation(QStringLiteral("update"), QStringLiteral("project_updated"), project);
    return project;
}

void LocalProjectRepository::remove(const EntityKey &key, bool force)
{
    const Project project = requireProject(key, "delete");
    if (!force && !project.activities.empty()) {
        throw InvalidOperation("cannot delete project " + key.toString()
                               + ": project has activities; use force delete to cascade");
    }

    std::vector<Project> projects = load();
    projects.erase(std::remove_if(projects.begin(), projects.end(),
                                  [&](const Project &p) { return p.key == key; }),
                   projects.end());
    store(projects);
    logMutation(QStringLiteral("remove"), QStringLiteral("project_deleted"), project);
}

bool LocalProjectRepository::hasActivities(const EntityKey &key) const
{
    const auto project = get(key);
    return project && !project->activities.empty();
}

std::vector<Activity> LocalProjectRepository::activities(const EntityKey &key) const
{
    const auto project = get(key);
    return project ? project->activities : std::vector<Activity>();
}

void LocalProjectRepository::forceDelete(const EntityKey &key,
                                         const ActivityCallback &deleteActivity,
                                         const ActivityCallback &deleteFrames)
{
    const Project project = requireProject(key, "delete");
    for (const auto &activity : project.activities) {
        if (deleteFrames) {
            deleteFrames(activity);
        }
        if (deleteActivity) {
            deleteActivity(activity);
        }
    }
    remove(key, true);
}

Project LocalProjectRepository::updateActivities(const EntityKey &key, std::vector<Activity> activities)
{
    Project project = requireProject(key, "update");
    project.activities = std::move(activities);
    saveProject(project);
    return project;
}

} // namespace worklog
