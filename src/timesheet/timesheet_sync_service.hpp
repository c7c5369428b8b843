#pragma once

#include <optional>
#include <string>
#include <vector>

#include <QDate>

#include "timesheet/local_timesheet_repository.hpp"
#include "timesheet/remote_timesheet_repository.hpp"

namespace worklog {

struct PushFailure {
    std::string uuid;
    std::string kind;
    std::string message;
};

struct PushReport {
    std::vector<Timesheet> pushed;
    // Declined, excluded from sync, or nothing to do.
    std::vector<std::string> skipped;
    std::vector<PushFailure> failures;
};

struct MergeOutcome {
    Timesheet merged;
    // Remote ids of inputs that were already synced. Their remote records
    // are left untouched and no longer have a local counterpart.
    std::vector<int> syncedRemoteIds;
};

struct DeleteOutcome {
    bool remoteAttempted = false;
    bool remoteDeleted = false;
    // Why the remote record survived, when it did.
    std::string warning;
};

// TimesheetSyncService reconciles the local timesheet file with the remote
// system. Remote "newer" means a strictly greater updatedAt.
class TimesheetSyncService {
public:
    TimesheetSyncService(LocalTimesheetRepository &local,
                         RemoteTimesheetRepository &remote);

    // Creates or updates the remote record and stores what the remote side
    // returned under the local uuid. nullopt when the record is excluded
    // from sync or confirm declines overwriting a newer remote record.
    std::optional<Timesheet> push(const Timesheet &timesheet, const ConfirmCallback &confirm);
    PushReport pushUnsynced(const ConfirmCallback &confirm);
    PushReport pushRange(const QDate &from, std::optional<QDate> to, const ConfirmCallback &confirm);

    // Writes remote records of [from, to] locally. A local record newer than
    // its remote counterpart is kept unless force is set or confirm accepts.
    std::vector<Timesheet> pull(const QDate &from,
                                std::optional<QDate> to,
                                bool force,
                                const ConfirmCallback &confirm);

    // Deletes the local record; the remote one too when confirm accepts.
    // Remote failures degrade to a warning.
    DeleteOutcome remove(const std::string &uuid, const ConfirmCallback &confirm);

    // Combines at least two local records of one activity and role into the
    // first one. The result always needs a new push.
    MergeOutcome merge(const std::vector<std::string> &uuids);

private:
    LocalTimesheetRepository &m_local;
    RemoteTimesheetRepository &m_remote;

    PushReport pushAll(const std::vector<Timesheet> &timesheets, const ConfirmCallback &confirm);
};

} // namespace worklog
