#include "remote/remote_json.hpp"

#include <QDateTime>
#include <QString>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace worklog::remote_json {

namespace {

const char *kRemoteDateTimeFormat = "yyyy-MM-dd HH:mm:ss";

std::optional<int> optionalInt(const nlohmann::json &item, const char *key)
{
    if (!item.contains(key) || item.at(key).is_null()) {
        return std::nullopt;
    }
    const nlohmann::json &value = item.at(key);
    if (value.is_number_integer()) {
        return value.get<int>();
    }
    if (value.is_string()) {
        bool ok = false;
        const int parsed = QString::fromStdString(value.get<std::string>()).toInt(&ok);
        if (ok) {
            return parsed;
        }
    }
    return std::nullopt;
}

int requiredInt(const nlohmann::json &item, const char *key, const char *what)
{
    const auto value = optionalInt(item, key);
    if (!value) {
        throw RemoteUnavailable(std::string("invalid ") + what + " in API response: '" + key
                                + "' must be an integer");
    }
    return *value;
}

std::string stringOr(const nlohmann::json &item, const char *key, const std::string &fallback = {})
{
    if (!item.contains(key) || !item.at(key).is_string()) {
        return fallback;
    }
    return item.at(key).get<std::string>();
}

std::optional<std::string> optionalString(const nlohmann::json &item, const char *key)
{
    if (!item.contains(key) || item.at(key).is_null()) {
        return std::nullopt;
    }
    const nlohmann::json &value = item.at(key);
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

double requiredHours(const nlohmann::json &item)
{
    if (!item.contains("time")) {
        throw RemoteUnavailable("invalid timesheet in API response: 'time' is required");
    }
    const nlohmann::json &value = item.at("time");
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        bool ok = false;
        const double parsed = QString::fromStdString(value.get<std::string>()).toDouble(&ok);
        if (ok) {
            return parsed;
        }
    }
    throw RemoteUnavailable("invalid timesheet in API response: 'time' must be numeric");
}

const nlohmann::json &dataOf(const nlohmann::json &body)
{
    if (!body.is_object() || !body.contains("data") || body.at("data").is_null()) {
        throw RemoteUnavailable("API response has no 'data'");
    }
    return body.at("data");
}

Role parseRole(const nlohmann::json &item)
{
    Role role;
    role.id = requiredInt(item, "id", "role");
    role.parentId = optionalInt(item, "parent_id");
    role.name = stringOr(item, "name");
    role.fullName = stringOr(item, "full_name");
    role.type = stringOr(item, "type");
    role.status = stringOr(item, "status");
    return role;
}

nlohmann::json roleToJson(const Role &role)
{
    return nlohmann::json{
        {"id", role.id},
        {"parent_id", optionalToJson(role.parentId)},
        {"name", role.name},
        {"full_name", role.fullName},
        {"type", role.type},
        {"status", role.status}
    };
}

} // namespace

void requireSuccess(const nlohmann::json &body)
{
    if (!body.is_object() || !body.contains("success") || body.at("success") != true) {
        throw RemoteUnavailable("API request was not successful");
    }
}

RemoteProjectData parseProject(const nlohmann::json &item)
{
    if (!item.is_object()) {
        throw RemoteUnavailable("invalid project in API response");
    }

    RemoteProjectData project;
    project.id = requiredInt(item, "id", "project");
    project.name = stringOr(item, "name");
    project.description = stringOr(item, "description");
    project.status = optionalInt(item, "status").value_or(0);

    if (item.contains("activities") && item.at("activities").is_array()) {
        for (const auto &entry : item.at("activities")) {
            RemoteActivityData activity;
            activity.id = requiredInt(entry, "id", "activity");
            activity.name = stringOr(entry, "name");
            activity.description = stringOr(entry, "description");
            activity.alias = optionalString(entry, "alias");
            project.activities.push_back(std::move(activity));
        }
    }
    return project;
}

std::vector<RemoteProjectData> parseProjectList(const nlohmann::json &body)
{
    requireSuccess(body);
    const nlohmann::json &data = dataOf(body);

    std::vector<RemoteProjectData> projects;
    if (!data.contains("list") || !data.at("list").is_array()) {
        return projects;
    }
    for (const auto &item : data.at("list")) {
        projects.push_back(parseProject(item));
    }
    return projects;
}

User parseUser(const nlohmann::json &body)
{
    const bool isEnvelope = body.is_object() && body.contains("success");
    if (isEnvelope) {
        requireSuccess(body);
    }
    const nlohmann::json &data = isEnvelope ? dataOf(body) : body;
    if (!data.contains("user") || !data.at("user").is_object()) {
        throw RemoteUnavailable("user data not found in API response");
    }

    const nlohmann::json &item = data.at("user");
    User user;
    user.id = requiredInt(item, "id", "user");
    user.username = stringOr(item, "username");
    user.firstname = stringOr(item, "firstname");
    user.lastname = stringOr(item, "lastname");
    user.name = stringOr(item, "name");
    user.email = stringOr(item, "email");
    user.alternativeEmail = optionalString(item, "alternative_email");
    user.employeeType = stringOr(item, "employee_type");
    user.employeeStatus = optionalString(item, "employee_status");

    if (data.contains("roles") && data.at("roles").is_array()) {
        for (const auto &entry : data.at("roles")) {
            user.roles.push_back(parseRole(entry));
        }
    }
    return user;
}

RemoteTimesheetData parseTimesheet(const nlohmann::json &item, const QTimeZone &zone)
{
    if (!item.is_object()) {
        throw RemoteUnavailable("invalid timesheet in API response");
    }

    RemoteTimesheetData timesheet;
    timesheet.id = requiredInt(item, "id", "timesheet");

    // GET responses say occupation_id, POST responses occupid.
    auto activityId = optionalInt(item, "occupation_id");
    if (!activityId) {
        activityId = optionalInt(item, "occupid");
    }
    if (!activityId) {
        throw RemoteUnavailable("invalid timesheet " + std::to_string(timesheet.id)
                                + " in API response: 'occupation_id' is required");
    }
    timesheet.activityId = *activityId;
    timesheet.projectId = optionalInt(item, "project_id");

    const QString dateText = QString::fromStdString(stringOr(item, "date")).left(10);
    const auto date = parseIsoDate(dateText);
    if (!date) {
        throw RemoteUnavailable("invalid timesheet " + std::to_string(timesheet.id)
                                + " in API response: bad date '" + dateText.toStdString() + "'");
    }
    timesheet.date = *date;

    timesheet.time = requiredHours(item);
    if (!item.contains("description") || !item.at("description").is_string()) {
        throw RemoteUnavailable("invalid timesheet " + std::to_string(timesheet.id)
                                + " in API response: 'description' is required");
    }
    timesheet.description = item.at("description").get<std::string>();
    timesheet.clientDescription = optionalString(item, "client_description");
    timesheet.individualAction = item.contains("individual_action")
        && item.at("individual_action") == true;
    timesheet.roleId = optionalInt(item, "role_id");

    for (const char *key : {"lu_date", "modified"}) {
        if (item.contains(key) && item.at(key).is_string()) {
            timesheet.updatedAt = parseZonedDateTime(
                QString::fromStdString(item.at(key).get<std::string>()), zone);
            break;
        }
    }
    return timesheet;
}

std::vector<RemoteTimesheetData> parseTimesheetList(const nlohmann::json &body, const QTimeZone &zone)
{
    requireSuccess(body);
    const nlohmann::json &data = dataOf(body);

    std::vector<RemoteTimesheetData> timesheets;
    if (!data.contains("list") || !data.at("list").is_array()) {
        return timesheets;
    }

    for (const auto &item : data.at("list")) {
        try {
            timesheets.push_back(parseTimesheet(item, zone));
        } catch (const RemoteUnavailable &ex) {
            WLOG_WARN(QStringLiteral("RemoteJson"),
                      QStringLiteral("parseTimesheetList"),
                      QStringLiteral("remote_timesheet_skipped"),
                      QStringLiteral("unreadable_entry"),
                      QStringLiteral("skip_and_continue"),
                      logging::defaultWho(),
                      logging::currentCorrelationId(),
                      logging::errorContext(ex));
        }
    }
    return timesheets;
}

std::optional<int> parseCreatedId(const nlohmann::json &body)
{
    requireSuccess(body);
    if (!body.contains("data") || !body.at("data").is_object()) {
        return std::nullopt;
    }
    const nlohmann::json &data = body.at("data");
    if (data.contains("timesheet") && data.at("timesheet").is_object()) {
        if (auto id = optionalInt(data.at("timesheet"), "id")) {
            return id;
        }
    }
    return optionalInt(data, "id");
}

nlohmann::json projectToJson(const RemoteProjectData &project)
{
    nlohmann::json activities = nlohmann::json::array();
    for (const auto &activity : project.activities) {
        activities.push_back(nlohmann::json{
            {"id", activity.id},
            {"name", activity.name},
            {"description", activity.description},
            {"alias", optionalToJson(activity.alias)}
        });
    }
    return nlohmann::json{
        {"id", project.id},
        {"name", project.name},
        {"description", project.description},
        {"status", project.status},
        {"activities", activities}
    };
}

nlohmann::json userToJson(const User &user)
{
    nlohmann::json roles = nlohmann::json::array();
    for (const auto &role : user.roles) {
        roles.push_back(roleToJson(role));
    }
    return nlohmann::json{
        {"user", {
            {"id", user.id},
            {"username", user.username},
            {"firstname", user.firstname},
            {"lastname", user.lastname},
            {"name", user.name},
            {"email", user.email},
            {"alternative_email", optionalToJson(user.alternativeEmail)},
            {"employee_type", user.employeeType},
            {"employee_status", optionalToJson(user.employeeStatus)}
        }},
        {"roles", roles}
    };
}

nlohmann::json timesheetToJson(const RemoteTimesheetData &timesheet, const QTimeZone &zone)
{
    nlohmann::json item{
        {"id", timesheet.id},
        {"occupation_id", timesheet.activityId},
        {"project_id", optionalToJson(timesheet.projectId)},
        {"date", timesheet.date.toString(Qt::ISODate).toStdString()},
        {"time", timesheet.time},
        {"description", timesheet.description},
        {"client_description", optionalToJson(timesheet.clientDescription)},
        {"individual_action", timesheet.individualAction},
        {"role_id", optionalToJson(timesheet.roleId)}
    };
    if (timesheet.updatedAt) {
        const QDateTime local = QDateTime::fromSecsSinceEpoch(toEpochSeconds(*timesheet.updatedAt), zone);
        item["lu_date"] = local.toString(QString::fromLatin1(kRemoteDateTimeFormat)).toStdString();
    }
    return item;
}

} // namespace worklog::remote_json
