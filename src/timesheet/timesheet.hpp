#pragma once

#include <optional>
#include <string>
#include <vector>

#include <QDate>

#include "common/models.hpp"
#include "common/time_utils.hpp"

namespace worklog {

// Billable time for one remote activity on one calendar day, derived from
// frames and optionally synchronized with the remote system.
struct Timesheet {
    std::string uuid;
    Activity activity;
    std::string description;
    std::optional<std::string> clientDescription;
    double time = 0.0;
    // Calendar day in the timesheet timezone (Europe/Zurich by default).
    QDate date;
    RoleAssignment role = RoleAssignment::individual();
    std::vector<std::string> frameUuids;
    // Set once the record exists remotely.
    std::optional<int> remoteId;
    Timestamp updatedAt;
    bool doNotSync = false;

    int projectId() const;

    bool isIndividual() const
    {
        return role.isIndividual();
    }

    bool isSynced() const
    {
        return remoteId.has_value();
    }

    // Throws InvalidOperation when the activity or its project is not remote,
    // when time is not a positive multiple of 0.25, or the date is invalid.
    void validate() const;

    bool operator==(const Timesheet &other) const;
    bool operator!=(const Timesheet &other) const { return !(*this == other); }
};

bool isQuarterHourMultiple(double hours);

Timesheet makeTimesheet(Activity activity,
                        const std::string &description,
                        std::optional<std::string> clientDescription,
                        double time,
                        const QDate &date,
                        RoleAssignment role,
                        std::vector<std::string> frameUuids,
                        std::optional<int> remoteId,
                        Timestamp updatedAt,
                        const std::string &uuid = std::string(),
                        bool doNotSync = false);

// Changes to an existing timesheet. Unset members keep their value; a blank
// client description clears it.
struct TimesheetEdit {
    std::optional<Activity> activity;
    std::optional<std::string> description;
    std::optional<std::string> clientDescription;
    std::optional<double> time;
    std::optional<QDate> date;
    std::optional<bool> individual;
    std::optional<Role> role;
    std::optional<bool> doNotSync;
};

// Applies edit and stamps updatedAt with now. Uuid, frames and remote id are
// kept. A role cannot be set on an individual timesheet, and a timesheet that
// stops being individual needs one.
Timesheet applyEdit(const Timesheet &timesheet, const TimesheetEdit &edit, Timestamp now);

} // namespace worklog
