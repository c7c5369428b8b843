#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <QDate>

#include "common/models.hpp"
#include "common/time_utils.hpp"
#include "core/activity_store.hpp"
#include "remote/remote_api.hpp"
#include "timesheet/timesheet.hpp"

namespace worklog {

// Asked before an operation overwrites or deletes data; false declines.
using ConfirmCallback = std::function<bool(const std::string &message)>;

// Roles of the current user, used to expand remote role ids.
using RoleLookup = std::function<std::vector<Role>()>;

// RemoteTimesheetRepository converts between remote timesheet records and
// local Timesheet values. Remote records have no uuid or frame provenance;
// each conversion mints a fresh uuid that callers replace when merging into
// a local record.
class RemoteTimesheetRepository {
public:
    RemoteTimesheetRepository(RemoteApi &api,
                              const ActivitySource &activities,
                              RoleLookup roles,
                              Clock clock = systemClock());

    // nullopt on 404 or when the record cannot be converted.
    std::optional<Timesheet> getByRemoteId(int remoteId) const;
    // Raw record; NotFound on 404.
    RemoteTimesheetData fetch(int remoteId) const;
    // Inclusive; an open end means the single day from.
    std::vector<Timesheet> getByDateRange(const QDate &from, std::optional<QDate> to = std::nullopt) const;

    // Returns the record as the remote system now holds it.
    Timesheet create(const Timesheet &timesheet);
    // nullopt when confirm declines. InvalidOperation without a remote id.
    std::optional<Timesheet> update(const Timesheet &timesheet, const ConfirmCallback &confirm);
    // false when confirm declines.
    bool remove(int remoteId, const ConfirmCallback &confirm);

    // Unresolvable activity or invalid time yields nullopt plus a warning.
    std::optional<Timesheet> toTimesheet(const RemoteTimesheetData &data) const;

private:
    RemoteApi &m_api;
    const ActivitySource &m_activities;
    RoleLookup m_roles;
    Clock m_clock;

    RoleAssignment resolveRole(const RemoteTimesheetData &data) const;
};

// InvalidOperation unless the activity and its project are remote.
TimesheetPayload toPayload(const Timesheet &timesheet);

} // namespace worklog
