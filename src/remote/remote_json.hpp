#pragma once

#include <optional>
#include <vector>

#include <QTimeZone>

#include <nlohmann/json.hpp>

#include "common/models.hpp"
#include "remote/remote_api.hpp"

namespace worklog::remote_json {

// Response envelopes are {"success": true, "data": ...}; anything else is
// RemoteUnavailable.
void requireSuccess(const nlohmann::json &body);

RemoteProjectData parseProject(const nlohmann::json &item);
std::vector<RemoteProjectData> parseProjectList(const nlohmann::json &body);

// Accepts either the response body or its "data" object ({user, roles}).
User parseUser(const nlohmann::json &body);

// Remote timestamps ("yyyy-MM-dd HH:mm:ss") are wall-clock times in zone.
RemoteTimesheetData parseTimesheet(const nlohmann::json &item, const QTimeZone &zone);
// Entries that cannot be read are skipped with a warning.
std::vector<RemoteTimesheetData> parseTimesheetList(const nlohmann::json &body, const QTimeZone &zone);

// data.timesheet.id, else data.id.
std::optional<int> parseCreatedId(const nlohmann::json &body);

// Inverse shapes, used by the reference cache and by test servers.
nlohmann::json projectToJson(const RemoteProjectData &project);
nlohmann::json userToJson(const User &user);
nlohmann::json timesheetToJson(const RemoteTimesheetData &timesheet, const QTimeZone &zone);

} // namespace worklog::remote_json
