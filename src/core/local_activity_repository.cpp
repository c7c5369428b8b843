#include "core/local_activity_repository.hpp"

#include <algorithm>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/uuid.hpp"

namespace worklog {

namespace {

void requireLocal(const EntityKey &key, const std::string &what)
{
    if (!key.isLocal()) {
        throw InvalidOperation("cannot " + what + " " + key.toString()
                               + ": only local entities may be edited or deleted");
    }
}

void logMutation(const QString &where, const QString &what, const Activity &activity)
{
    WLOG_INFO(QStringLiteral("LocalActivityRepository"),
              where,
              what,
              QStringLiteral("user_command"),
              QStringLiteral("update_project_activities"),
              logging::defaultWho(),
              logging::currentCorrelationId(),
              (nlohmann::json{{"activity", activity.key.toString()},
                              {"project", activity.projectKey.toString()},
                              {"name", activity.name}}));
}

} // namespace

LocalActivityRepository::LocalActivityRepository(LocalProjectStore &projects, const FrameRepository *frames)
    : m_projects(projects)
    , m_frames(frames)
{
}

std::vector<Activity> LocalActivityRepository::all(bool activeOnly) const
{
    std::vector<Activity> activities;
    for (const auto &project : m_projects.all(activeOnly ? activeStatuses() : ProjectStatuses())) {
        for (const auto &activity : project.activities) {
            if (activity.key.isLocal()) {
                activities.push_back(activity);
            }
        }
    }
    return activities;
}

std::optional<Activity> LocalActivityRepository::get(const EntityKey &key) const
{
    if (!key.isLocal()) {
        return std::nullopt;
    }
    const auto project = m_projects.getByActivityId(key);
    if (!project) {
        return std::nullopt;
    }
    for (const auto &activity : project->activities) {
        if (activity.key == key) {
            return activity;
        }
    }
    return std::nullopt;
}

std::optional<Activity> LocalActivityRepository::getByAlias(const std::string &alias, bool activeOnly) const
{
    for (const auto &activity : all(activeOnly)) {
        if (activity.alias == alias) {
            return activity;
        }
    }
    return std::nullopt;
}

std::vector<Activity> LocalActivityRepository::searchByNameOrAlias(const std::string &search, bool activeOnly) const
{
    return filterActivitiesByNameOrAlias(all(activeOnly), search);
}

std::vector<Activity> LocalActivityRepository::searchByAlias(const std::string &search) const
{
    return filterActivitiesByAlias(all(true), search);
}

Activity LocalActivityRepository::requireActivity(const EntityKey &key, const char *operation) const
{
    requireLocal(key, std::string(operation) + " activity");
    auto activity = get(key);
    if (!activity) {
        throw NotFound("cannot " + std::string(operation) + " activity " + key.toString()
                       + ": activity not found");
    }
    return *activity;
}

Activity LocalActivityRepository::create(const std::string &name,
                                         const std::string &description,
                                         const EntityKey &projectKey,
                                         std::optional<std::string> alias)
{
    requireLocal(projectKey, "add an activity to project");
    const auto project = m_projects.get(projectKey);
    if (!project) {
        throw NotFound("project " + projectKey.toString() + " not found");
    }

    const Activity activity{EntityKey::local(generateUuid()), name, description, projectKey, std::move(alias)};
    std::vector<Activity> activities = project->activities;
    activities.push_back(activity);
    m_projects.updateActivities(projectKey, std::move(activities));

    logMutation(QStringLiteral("create"), QStringLiteral("activity_created"), activity);
    return activity;
}

Activity LocalActivityRepository::update(const EntityKey &key,
                                         std::optional<std::string> name,
                                         std::optional<std::string> description,
                                         std::optional<std::string> alias)
{
    Activity activity = requireActivity(key, "update");
    const auto project = m_projects.get(activity.projectKey);
    if (!project) {
        throw NotFound("parent project " + activity.projectKey.toString() + " not found");
    }

    if (name) {
        activity.name = *name;
    }
    if (description) {
        activity.description = *description;
    }
    if (alias) {
        activity.alias = *alias;
    }

    std::vector<Activity> activities = project->activities;
    for (auto &existing : activities) {
        if (existing.key == key) {
            existing = activity;
        }
    }
    m_projects.updateActivities(activity.projectKey, std::move(activities));

    logMutation(QStringLiteral("update"), QStringLiteral("activity_updated"), activity);
    return activity;
}

void LocalActivityRepository::remove(const EntityKey &key, bool force)
{
    const Activity activity = requireActivity(key, "delete");
    if (!force && hasFrames(key)) {
        throw InvalidOperation("cannot delete activity " + key.toString()
                               + ": frames reference it; use force delete to cascade");
    }

    const auto project = m_projects.get(activity.projectKey);
    if (!project) {
        throw NotFound("parent project " + activity.projectKey.toString() + " not found");
    }

    std::vector<Activity> activities = project->activities;
    activities.erase(std::remove_if(activities.begin(), activities.end(),
                                    [&](const Activity &a) { return a.key == key; }),
                     activities.end());
    m_projects.updateActivities(activity.projectKey, std::move(activities));

    logMutation(QStringLiteral("remove"), QStringLiteral("activity_deleted"), activity);
}

bool LocalActivityRepository::hasFrames(const EntityKey &key) const
{
    return !frames(key).empty();
}

std::vector<Frame> LocalActivityRepository::frames(const EntityKey &key) const
{
    std::vector<Frame> result;
    if (!m_frames || !key.isLocal()) {
        return result;
    }

    for (auto &frame : m_frames->all()) {
        if (frame.activity.key == key) {
            result.push_back(std::move(frame));
        }
    }
    if (auto current = m_frames->getCurrent()) {
        if (current->activity.key == key) {
            result.push_back(std::move(*current));
        }
    }
    return result;
}

void LocalActivityRepository::forceDelete(const EntityKey &key, const FrameCallback &deleteFrame)
{
    requireActivity(key, "delete");
    if (deleteFrame) {
        for (const auto &frame : frames(key)) {
            deleteFrame(frame);
        }
    }
    remove(key, true);
}

} // namespace worklog
