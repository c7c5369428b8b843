#pragma once

#include <optional>
#include <string>
#include <vector>

#include <QDate>

#include "common/models.hpp"
#include "common/time_utils.hpp"

namespace worklog {

struct RemoteActivityData {
    int id = 0;
    std::string name;
    std::string description;
    std::optional<std::string> alias;
};

struct RemoteProjectData {
    int id = 0;
    std::string name;
    std::string description;
    int status = 0;
    std::vector<RemoteActivityData> activities;
};

// One timesheet as the remote system reports it. Activity and role are
// bare ids; resolving them is up to the caller.
struct RemoteTimesheetData {
    int id = 0;
    int activityId = 0;
    std::optional<int> projectId;
    QDate date;
    double time = 0.0;
    std::string description;
    std::optional<std::string> clientDescription;
    bool individualAction = false;
    std::optional<int> roleId;
    std::optional<Timestamp> updatedAt;
};

// Body of a create or update request.
struct TimesheetPayload {
    int projectId = 0;
    int activityId = 0;
    std::string description;
    std::optional<std::string> clientDescription;
    double time = 0.0;
    QDate date;
    std::optional<int> roleId;
};

// RemoteApi is the boundary to the remote time-keeping system. Every call
// may throw RemoteUnavailable; fetchTimesheetById throws NotFound for an
// unknown id.
class RemoteApi {
public:
    virtual ~RemoteApi() = default;

    virtual std::vector<RemoteProjectData> fetchProjectsAll() = 0;
    virtual User fetchUserById(int id) = 0;
    virtual RemoteTimesheetData fetchTimesheetById(int remoteId) = 0;
    virtual std::vector<RemoteTimesheetData> fetchTimesheetsByDateRange(const QDate &from,
                                                                        const QDate &to) = 0;
    // Returns the id the remote system assigned.
    virtual int createTimesheet(const TimesheetPayload &payload) = 0;
    virtual void updateTimesheet(int remoteId, const TimesheetPayload &payload) = 0;
    virtual void deleteTimesheet(int remoteId) = 0;
};

} // namespace worklog
