#include "timesheet/timesheet_sync_service.hpp"

#include <algorithm>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/string_utils.hpp"

namespace worklog {

namespace {

const char *const kSeparator = " | ";

ConfirmCallback alwaysConfirm()
{
    return [](const std::string &) { return true; };
}

// Remote content under the local identity.
Timesheet adoptRemote(const Timesheet &remote, const Timesheet &local)
{
    Timesheet adopted = remote;
    adopted.uuid = local.uuid;
    adopted.frameUuids = local.frameUuids;
    adopted.doNotSync = local.doNotSync;
    return adopted;
}

void logDecision(const QString &where, const QString &what, const QString &why, const Timesheet &timesheet)
{
    WLOG_INFO(QStringLiteral("TimesheetSyncService"),
              where,
              what,
              why,
              QStringLiteral("compare_updated_at"),
              logging::defaultWho(),
              logging::currentCorrelationId(),
              (nlohmann::json{{"uuid", timesheet.uuid},
                              {"remote_id", timesheet.remoteId ? nlohmann::json(*timesheet.remoteId)
                                                               : nlohmann::json(nullptr)},
                              {"updated_at", toIso8601Utc(timesheet.updatedAt)}}));
}

} // namespace

TimesheetSyncService::TimesheetSyncService(LocalTimesheetRepository &local,
                                           RemoteTimesheetRepository &remote)
    : m_local(local)
    , m_remote(remote)
{
}

std::optional<Timesheet> TimesheetSyncService::push(const Timesheet &timesheet, const ConfirmCallback &confirm)
{
    if (timesheet.doNotSync) {
        logDecision(QStringLiteral("push"), QStringLiteral("push_skipped"),
                    QStringLiteral("do_not_sync"), timesheet);
        return std::nullopt;
    }
    timesheet.validate();

    Timesheet result = timesheet;
    if (!timesheet.remoteId) {
        result = adoptRemote(m_remote.create(timesheet), timesheet);
        logDecision(QStringLiteral("push"), QStringLiteral("push_created"),
                    QStringLiteral("no_remote_id"), result);
    } else {
        const RemoteTimesheetData current = m_remote.fetch(*timesheet.remoteId);
        const bool remoteNewer = current.updatedAt && *current.updatedAt > timesheet.updatedAt;

        ConfirmCallback decide = alwaysConfirm();
        if (remoteNewer) {
            logDecision(QStringLiteral("push"), QStringLiteral("push_remote_newer"),
                        QStringLiteral("remote_updated_later"), timesheet);
            const std::string question = "Remote timesheet " + std::to_string(*timesheet.remoteId)
                + " was changed at " + toIso8601Utc(*current.updatedAt)
                + ", after the local copy. Overwrite it?";
            if (!confirm || !confirm(question)) {
                logDecision(QStringLiteral("push"), QStringLiteral("push_declined"),
                            QStringLiteral("remote_updated_later"), timesheet);
                return std::nullopt;
            }
        }

        const auto updated = m_remote.update(timesheet, decide);
        if (!updated) {
            return std::nullopt;
        }
        result = adoptRemote(*updated, timesheet);
        logDecision(QStringLiteral("push"), QStringLiteral("push_updated"),
                    remoteNewer ? QStringLiteral("confirmed_overwrite") : QStringLiteral("local_not_older"),
                    result);
    }

    m_local.save(result);
    return result;
}

PushReport TimesheetSyncService::pushAll(const std::vector<Timesheet> &timesheets, const ConfirmCallback &confirm)
{
    PushReport report;
    for (const auto &timesheet : timesheets) {
        try {
            if (auto pushed = push(timesheet, confirm)) {
                report.pushed.push_back(std::move(*pushed));
            } else {
                report.skipped.push_back(timesheet.uuid);
            }
        } catch (const WorklogError &ex) {
            WLOG_WARN(QStringLiteral("TimesheetSyncService"),
                      QStringLiteral("pushAll"),
                      QStringLiteral("push_failed"),
                      QString::fromUtf8(ex.kind()),
                      QStringLiteral("continue_with_next"),
                      logging::defaultWho(),
                      logging::currentCorrelationId(),
                      logging::errorContext(ex, nlohmann::json{{"uuid", timesheet.uuid}}));
            report.failures.push_back(PushFailure{timesheet.uuid, ex.kind(), ex.what()});
        }
    }
    return report;
}

PushReport TimesheetSyncService::pushUnsynced(const ConfirmCallback &confirm)
{
    return pushAll(m_local.getUnsynced(), confirm);
}

PushReport TimesheetSyncService::pushRange(const QDate &from, std::optional<QDate> to, const ConfirmCallback &confirm)
{
    return pushAll(m_local.getByDateRange(from, to.value_or(from)), confirm);
}

std::vector<Timesheet> TimesheetSyncService::pull(const QDate &from,
                                                  std::optional<QDate> to,
                                                  bool force,
                                                  const ConfirmCallback &confirm)
{
    std::vector<Timesheet> written;
    for (const auto &remote : m_remote.getByDateRange(from, to.value_or(from))) {
        const auto local = m_local.getByRemoteId(*remote.remoteId);
        if (!local) {
            m_local.save(remote);
            logDecision(QStringLiteral("pull"), QStringLiteral("pull_created"),
                        QStringLiteral("missing_locally"), remote);
            written.push_back(remote);
            continue;
        }

        if (local->updatedAt > remote.updatedAt && !force) {
            const std::string question = "Local timesheet " + local->uuid + " was changed at "
                + toIso8601Utc(local->updatedAt) + ", after remote timesheet "
                + std::to_string(*remote.remoteId) + ". Overwrite the local changes?";
            if (!confirm || !confirm(question)) {
                logDecision(QStringLiteral("pull"), QStringLiteral("pull_skipped"),
                            QStringLiteral("local_updated_later"), *local);
                continue;
            }
        }

        const Timesheet adopted = adoptRemote(remote, *local);
        m_local.save(adopted);
        logDecision(QStringLiteral("pull"), QStringLiteral("pull_overwritten"),
                    QStringLiteral("remote_authoritative"), adopted);
        written.push_back(adopted);
    }
    return written;
}

DeleteOutcome TimesheetSyncService::remove(const std::string &uuid, const ConfirmCallback &confirm)
{
    const auto timesheet = m_local.get(uuid);
    if (!timesheet) {
        throw NotFound("timesheet " + uuid + " not found");
    }

    DeleteOutcome outcome;
    if (timesheet->remoteId) {
        outcome.remoteAttempted = true;
        try {
            outcome.remoteDeleted = m_remote.remove(*timesheet->remoteId, confirm);
            if (!outcome.remoteDeleted) {
                outcome.warning = "remote timesheet " + std::to_string(*timesheet->remoteId)
                    + " was kept; it returns on the next pull";
            }
        } catch (const WorklogError &ex) {
            outcome.warning = std::string("remote delete failed (") + ex.kind() + "): " + ex.what();
            WLOG_WARN(QStringLiteral("TimesheetSyncService"),
                      QStringLiteral("remove"),
                      QStringLiteral("remote_delete_failed"),
                      QString::fromUtf8(ex.kind()),
                      QStringLiteral("delete_locally_anyway"),
                      logging::defaultWho(),
                      logging::currentCorrelationId(),
                      logging::errorContext(ex, nlohmann::json{{"uuid", uuid},
                                                               {"remote_id", *timesheet->remoteId}}));
        }
    }

    m_local.remove(uuid);
    logDecision(QStringLiteral("remove"), QStringLiteral("timesheet_deleted"),
                outcome.remoteDeleted ? QStringLiteral("local_and_remote") : QStringLiteral("local_only"),
                *timesheet);
    return outcome;
}

MergeOutcome TimesheetSyncService::merge(const std::vector<std::string> &uuids)
{
    if (uuids.size() < 2) {
        throw InvalidOperation("merging needs at least two timesheets");
    }

    std::vector<Timesheet> inputs;
    std::vector<std::string> missing;
    for (auto it = uuids.begin(); it != uuids.end(); ++it) {
        if (std::find(uuids.begin(), it, *it) != it) {
            throw InvalidOperation("timesheet " + *it + " is listed more than once");
        }
    }
    for (const auto &uuid : uuids) {
        if (auto timesheet = m_local.get(uuid)) {
            inputs.push_back(std::move(*timesheet));
        } else {
            missing.push_back(uuid);
        }
    }
    if (!missing.empty()) {
        throw NotFound("timesheets not found: " + join(missing, ", "));
    }

    const Timesheet &first = inputs.front();
    double total = 0.0;
    Timestamp earliest = first.updatedAt;
    std::vector<int> syncedRemoteIds;
    std::vector<std::string> descriptions;
    std::vector<std::string> clientDescriptions;
    std::vector<std::string> frameUuids;

    for (const auto &timesheet : inputs) {
        if (timesheet.activity.key != first.activity.key) {
            throw InvalidOperation("timesheet " + timesheet.uuid + " has activity '" + timesheet.activity.name
                                   + "', expected '" + first.activity.name + "'");
        }
        if (timesheet.role.roleId() != first.role.roleId()) {
            throw InvalidOperation("timesheet " + timesheet.uuid + " has a different role than " + first.uuid);
        }

        total += timesheet.time;
        earliest = std::min(earliest, timesheet.updatedAt);
        if (timesheet.remoteId) {
            syncedRemoteIds.push_back(*timesheet.remoteId);
        }
        descriptions.push_back(timesheet.description);
        if (timesheet.clientDescription && !trim(*timesheet.clientDescription).empty()) {
            clientDescriptions.push_back(*timesheet.clientDescription);
        }
        for (const auto &frameUuid : timesheet.frameUuids) {
            if (std::find(frameUuids.begin(), frameUuids.end(), frameUuid) == frameUuids.end()) {
                frameUuids.push_back(frameUuid);
            }
        }
    }

    if (!(total > 0.0) || !isQuarterHourMultiple(total)) {
        throw InvalidOperation("merged time " + std::to_string(total)
                               + " is not a positive multiple of 0.25 hours");
    }

    const Timesheet merged = makeTimesheet(first.activity,
                                           join(descriptions, kSeparator),
                                           clientDescriptions.empty()
                                               ? std::nullopt
                                               : std::optional<std::string>(join(clientDescriptions, kSeparator)),
                                           total,
                                           first.date,
                                           first.role,
                                           frameUuids,
                                           std::nullopt,
                                           earliest,
                                           first.uuid,
                                           false);

    m_local.save(merged);
    for (std::size_t i = 1; i < inputs.size(); ++i) {
        m_local.remove(inputs[i].uuid);
    }

    WLOG_INFO(QStringLiteral("TimesheetSyncService"),
              QStringLiteral("merge"),
              QStringLiteral("timesheets_merged"),
              QStringLiteral("user_command"),
              QStringLiteral("sum_and_union"),
              logging::defaultWho(),
              logging::currentCorrelationId(),
              (nlohmann::json{{"uuid", merged.uuid},
                              {"inputs", uuids},
                              {"time", merged.time},
                              {"synced_remote_ids", syncedRemoteIds}}));
    if (!syncedRemoteIds.empty()) {
        WLOG_WARN(QStringLiteral("TimesheetSyncService"),
                  QStringLiteral("merge"),
                  QStringLiteral("merge_dropped_sync_status"),
                  QStringLiteral("synced_inputs"),
                  QStringLiteral("remote_records_kept"),
                  logging::defaultWho(),
                  logging::currentCorrelationId(),
                  (nlohmann::json{{"uuid", merged.uuid}, {"remote_ids", syncedRemoteIds}}));
    }
    return MergeOutcome{merged, syncedRemoteIds};
}

} // namespace worklog
