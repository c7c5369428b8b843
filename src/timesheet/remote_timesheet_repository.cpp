#include "timesheet/remote_timesheet_repository.hpp"

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace worklog {

namespace {

void warnSkipped(const RemoteTimesheetData &data, const std::string &reason)
{
    WLOG_WARN(QStringLiteral("RemoteTimesheetRepository"),
              QStringLiteral("toTimesheet"),
              QStringLiteral("remote_timesheet_skipped"),
              QString::fromStdString(reason),
              QStringLiteral("skip_record"),
              logging::defaultWho(),
              logging::currentCorrelationId(),
              (nlohmann::json{{"remote_id", data.id},
                              {"activity_id", data.activityId},
                              {"date", data.date.toString(Qt::ISODate).toStdString()}}));
}

// Keeps the local identity of a record the remote system accepted when the
// re-fetch yields nothing usable.
Timesheet withRemoteId(const Timesheet &timesheet, int remoteId)
{
    Timesheet copy = timesheet;
    copy.remoteId = remoteId;
    return copy;
}

} // namespace

TimesheetPayload toPayload(const Timesheet &timesheet)
{
    if (!timesheet.activity.key.isRemote() || !timesheet.activity.projectKey.isRemote()) {
        throw InvalidOperation("timesheet " + timesheet.uuid
                               + " cannot be sent: its activity is not a remote activity");
    }
    return TimesheetPayload{timesheet.projectId(),
                            timesheet.activity.key.remoteId(),
                            timesheet.description,
                            timesheet.clientDescription,
                            timesheet.time,
                            timesheet.date,
                            timesheet.role.roleId()};
}

RemoteTimesheetRepository::RemoteTimesheetRepository(RemoteApi &api,
                                                     const ActivitySource &activities,
                                                     RoleLookup roles,
                                                     Clock clock)
    : m_api(api)
    , m_activities(activities)
    , m_roles(std::move(roles))
    , m_clock(std::move(clock))
{
}

RoleAssignment RemoteTimesheetRepository::resolveRole(const RemoteTimesheetData &data) const
{
    if (data.individualAction || !data.roleId) {
        return RoleAssignment::individual();
    }

    if (m_roles) {
        try {
            for (const auto &role : m_roles()) {
                if (role.id == *data.roleId) {
                    return RoleAssignment::of(role);
                }
            }
        } catch (const WorklogError &ex) {
            WLOG_WARN(QStringLiteral("RemoteTimesheetRepository"),
                      QStringLiteral("resolveRole"),
                      QStringLiteral("role_lookup_failed"),
                      QStringLiteral("current_user_unavailable"),
                      QStringLiteral("use_bare_role_id"),
                      logging::defaultWho(),
                      logging::currentCorrelationId(),
                      logging::errorContext(ex, nlohmann::json{{"role_id", *data.roleId}}));
        }
    }

    Role bare;
    bare.id = *data.roleId;
    return RoleAssignment::of(bare);
}

std::optional<Timesheet> RemoteTimesheetRepository::toTimesheet(const RemoteTimesheetData &data) const
{
    const auto activity = m_activities.get(EntityKey::remote(data.activityId));
    if (!activity) {
        warnSkipped(data, "activity " + std::to_string(data.activityId) + " is unknown");
        return std::nullopt;
    }

    try {
        return makeTimesheet(*activity,
                             data.description,
                             data.clientDescription,
                             data.time,
                             data.date,
                             resolveRole(data),
                             {},
                             data.id,
                             data.updatedAt.value_or(m_clock()));
    } catch (const InvalidOperation &ex) {
        warnSkipped(data, ex.what());
        return std::nullopt;
    }
}

RemoteTimesheetData RemoteTimesheetRepository::fetch(int remoteId) const
{
    return m_api.fetchTimesheetById(remoteId);
}

std::optional<Timesheet> RemoteTimesheetRepository::getByRemoteId(int remoteId) const
{
    try {
        return toTimesheet(m_api.fetchTimesheetById(remoteId));
    } catch (const NotFound &) {
        return std::nullopt;
    }
}

std::vector<Timesheet> RemoteTimesheetRepository::getByDateRange(const QDate &from, std::optional<QDate> to) const
{
    std::vector<Timesheet> timesheets;
    for (const auto &data : m_api.fetchTimesheetsByDateRange(from, to.value_or(from))) {
        if (auto timesheet = toTimesheet(data)) {
            timesheets.push_back(std::move(*timesheet));
        }
    }
    return timesheets;
}

Timesheet RemoteTimesheetRepository::create(const Timesheet &timesheet)
{
    const int remoteId = m_api.createTimesheet(toPayload(timesheet));

    WLOG_INFO(QStringLiteral("RemoteTimesheetRepository"),
              QStringLiteral("create"),
              QStringLiteral("remote_timesheet_created"),
              QStringLiteral("push_new_record"),
              QStringLiteral("post_timesheet"),
              logging::defaultWho(),
              logging::currentCorrelationId(),
              (nlohmann::json{{"uuid", timesheet.uuid}, {"remote_id", remoteId}}));

    if (auto created = getByRemoteId(remoteId)) {
        return *created;
    }
    return withRemoteId(timesheet, remoteId);
}

std::optional<Timesheet> RemoteTimesheetRepository::update(const Timesheet &timesheet, const ConfirmCallback &confirm)
{
    if (!timesheet.remoteId) {
        throw InvalidOperation("timesheet " + timesheet.uuid + " has no remote id to update");
    }
    const int remoteId = *timesheet.remoteId;
    if (!confirm || !confirm("Update remote timesheet " + std::to_string(remoteId) + "?")) {
        return std::nullopt;
    }

    m_api.updateTimesheet(remoteId, toPayload(timesheet));

    WLOG_INFO(QStringLiteral("RemoteTimesheetRepository"),
              QStringLiteral("update"),
              QStringLiteral("remote_timesheet_updated"),
              QStringLiteral("push_changed_record"),
              QStringLiteral("put_timesheet"),
              logging::defaultWho(),
              logging::currentCorrelationId(),
              (nlohmann::json{{"uuid", timesheet.uuid}, {"remote_id", remoteId}}));

    if (auto updated = getByRemoteId(remoteId)) {
        return updated;
    }
    return withRemoteId(timesheet, remoteId);
}

bool RemoteTimesheetRepository::remove(int remoteId, const ConfirmCallback &confirm)
{
    if (!confirm || !confirm("Delete remote timesheet " + std::to_string(remoteId) + "?")) {
        return false;
    }

    m_api.deleteTimesheet(remoteId);

    WLOG_INFO(QStringLiteral("RemoteTimesheetRepository"),
              QStringLiteral("remove"),
              QStringLiteral("remote_timesheet_deleted"),
              QStringLiteral("user_command"),
              QStringLiteral("delete_timesheet"),
              logging::defaultWho(),
              logging::currentCorrelationId(),
              (nlohmann::json{{"remote_id", remoteId}}));
    return true;
}

} // namespace worklog
