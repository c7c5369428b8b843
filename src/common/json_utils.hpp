#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include <QDate>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/models.hpp"
#include "common/time_utils.hpp"
#include "core/frame.hpp"
#include "timesheet/timesheet.hpp"

namespace worklog {

// Types holding an EntityKey have no default constructor, so they are read
// with the *FromJson functions below instead of j.get<T>().

template <typename T>
nlohmann::json optionalToJson(const std::optional<T> &value)
{
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

template <typename T>
std::optional<T> optionalFromJson(const nlohmann::json &j, const char *key)
{
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return j.at(key).get<T>();
}

inline void requireKey(const nlohmann::json &j, const char *key, const char *what)
{
    if (!j.is_object() || !j.contains(key)) {
        throw InvalidOperation(std::string("invalid ") + what + " JSON: '" + key + "' is required");
    }
}

inline nlohmann::json entityKeyToJson(const EntityKey &key)
{
    return nlohmann::json{
        {"source", toSourceString(key.source())},
        {"id", key.toString()}
    };
}

inline EntityKey entityKeyFromJson(const nlohmann::json &j)
{
    requireKey(j, "source", "entity key");
    requireKey(j, "id", "entity key");
    try {
        const EntitySource source = parseSourceString(j.at("source").get<std::string>());
        const nlohmann::json &id = j.at("id");
        switch (source) {
        case EntitySource::Local:
            return EntityKey::local(id.get<std::string>());
        case EntitySource::Remote:
            return id.is_number_integer() ? EntityKey::remote(id.get<int>())
                                          : EntityKey::remote(std::stoi(id.get<std::string>()));
        }
    } catch (const std::invalid_argument &ex) {
        throw InvalidOperation(std::string("invalid entity key JSON: ") + ex.what());
    } catch (const nlohmann::json::exception &ex) {
        throw InvalidOperation(std::string("invalid entity key JSON: ") + ex.what());
    }
    throw InvalidOperation("invalid entity key JSON");
}

inline void to_json(nlohmann::json &j, const Role &role)
{
    j = nlohmann::json{
        {"id", role.id},
        {"parentId", optionalToJson(role.parentId)},
        {"name", role.name},
        {"fullName", role.fullName},
        {"type", role.type},
        {"status", role.status}
    };
}

inline void from_json(const nlohmann::json &j, Role &role)
{
    role.id = j.value("id", 0);
    role.parentId = optionalFromJson<int>(j, "parentId");
    role.name = j.value("name", "");
    role.fullName = j.value("fullName", "");
    role.type = j.value("type", "");
    role.status = j.value("status", "");
}

inline nlohmann::json roleAssignmentToJson(const RoleAssignment &assignment)
{
    const Role *role = assignment.role();
    return role ? nlohmann::json(*role) : nlohmann::json(nullptr);
}

// A missing role means individual.
inline RoleAssignment roleAssignmentFromJson(const nlohmann::json &j, const char *roleKey)
{
    if (!j.contains(roleKey) || j.at(roleKey).is_null()) {
        return RoleAssignment::individual();
    }
    return RoleAssignment::of(j.at(roleKey).get<Role>());
}

inline nlohmann::json activityToJson(const Activity &activity)
{
    return nlohmann::json{
        {"key", entityKeyToJson(activity.key)},
        {"name", activity.name},
        {"desc", activity.description},
        {"project", entityKeyToJson(activity.projectKey)},
        {"alias", optionalToJson(activity.alias)}
    };
}

inline Activity activityFromJson(const nlohmann::json &j)
{
    requireKey(j, "key", "activity");
    requireKey(j, "project", "activity");
    return Activity{entityKeyFromJson(j.at("key")),
                    j.value("name", ""),
                    j.value("desc", ""),
                    entityKeyFromJson(j.at("project")),
                    optionalFromJson<std::string>(j, "alias")};
}

inline nlohmann::json frameToJson(const Frame &frame)
{
    return nlohmann::json{
        {"uuid", frame.uuid},
        {"start", toEpochSeconds(frame.start)},
        {"stop", frame.stop ? nlohmann::json(toEpochSeconds(*frame.stop)) : nlohmann::json(nullptr)},
        {"activity", activityToJson(frame.activity)},
        {"isIndividual", frame.isIndividual()},
        {"role", roleAssignmentToJson(frame.role)},
        {"issues", frame.issueKeys},
        {"desc", frame.description},
        {"updatedAt", toEpochSeconds(frame.updatedAt)}
    };
}

inline Frame frameFromJson(const nlohmann::json &j)
{
    requireKey(j, "uuid", "frame");
    requireKey(j, "start", "frame");
    requireKey(j, "activity", "frame");

    const bool isIndividual = j.value("isIndividual", false);
    RoleAssignment role = roleAssignmentFromJson(j, "role");
    if (isIndividual) {
        role = RoleAssignment::individual();
    } else if (role.isIndividual()) {
        throw InvalidOperation("frame " + j.at("uuid").get<std::string>()
                               + " is not individual but has no role");
    }

    std::optional<Timestamp> stop;
    if (j.contains("stop") && !j.at("stop").is_null()) {
        stop = fromEpochSeconds(j.at("stop").get<int64_t>());
    }
    const Timestamp start = fromEpochSeconds(j.at("start").get<int64_t>());

    return makeFrame(j.at("uuid").get<std::string>(),
                     start,
                     stop,
                     activityFromJson(j.at("activity")),
                     j.value("desc", ""),
                     std::move(role),
                     fromEpochSeconds(j.value("updatedAt", toEpochSeconds(stop.value_or(start)))));
}

inline nlohmann::json timesheetToJson(const Timesheet &timesheet)
{
    return nlohmann::json{
        {"uuid", timesheet.uuid},
        {"projectId", timesheet.projectId()},
        {"activity", activityToJson(timesheet.activity)},
        {"description", timesheet.description},
        {"clientDescription", optionalToJson(timesheet.clientDescription)},
        {"time", timesheet.time},
        {"date", timesheet.date.toString(Qt::ISODate).toStdString()},
        {"role", roleAssignmentToJson(timesheet.role)},
        {"individualAction", timesheet.isIndividual()},
        {"frameUuids", timesheet.frameUuids},
        {"remoteId", optionalToJson(timesheet.remoteId)},
        {"updatedAt", toEpochSeconds(timesheet.updatedAt)},
        {"doNotSync", timesheet.doNotSync}
    };
}

inline Timesheet timesheetFromJson(const nlohmann::json &j)
{
    for (const char *key : {"uuid", "activity", "description", "time", "date", "frameUuids"}) {
        requireKey(j, key, "timesheet");
    }
    if (!j.at("frameUuids").is_array()) {
        throw InvalidOperation("invalid timesheet JSON: 'frameUuids' must be an array");
    }

    const auto date = parseIsoDate(QString::fromStdString(j.at("date").get<std::string>()));
    if (!date) {
        throw InvalidOperation("invalid timesheet JSON: bad date '"
                               + j.at("date").get<std::string>() + "'");
    }

    RoleAssignment role = roleAssignmentFromJson(j, "role");
    if (j.value("individualAction", false)) {
        role = RoleAssignment::individual();
    } else if (role.isIndividual()) {
        throw InvalidOperation("timesheet " + j.at("uuid").get<std::string>()
                               + " needs a role or individualAction");
    }

    return makeTimesheet(activityFromJson(j.at("activity")),
                         j.at("description").get<std::string>(),
                         optionalFromJson<std::string>(j, "clientDescription"),
                         j.at("time").get<double>(),
                         *date,
                         std::move(role),
                         j.at("frameUuids").get<std::vector<std::string>>(),
                         optionalFromJson<int>(j, "remoteId"),
                         fromEpochSeconds(j.value("updatedAt", int64_t{0})),
                         j.at("uuid").get<std::string>(),
                         j.value("doNotSync", false));
}

} // namespace worklog
