#include "timesheet/local_timesheet_repository.hpp"

#include <algorithm>

#include "common/errors.hpp"
#include "common/json_file.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/paths.hpp"

namespace worklog {

namespace {

Timesheet parseTimesheet(const nlohmann::json &j)
{
    try {
        return timesheetFromJson(j);
    } catch (const nlohmann::json::exception &ex) {
        throw InvalidOperation(std::string("invalid timesheet JSON: ") + ex.what());
    }
}

bool sharesFrame(const Timesheet &timesheet, const std::vector<std::string> &frameUuids)
{
    return std::any_of(timesheet.frameUuids.begin(), timesheet.frameUuids.end(),
                       [&](const std::string &uuid) {
                           return std::find(frameUuids.begin(), frameUuids.end(), uuid)
                               != frameUuids.end();
                       });
}

void logMutation(const QString &where, const QString &what, const Timesheet &timesheet)
{
    WLOG_DEBUG(QStringLiteral("LocalTimesheetRepository"),
               where,
               what,
               QStringLiteral("timesheet_changed"),
               QStringLiteral("atomic_rewrite"),
               logging::defaultWho(),
               logging::currentCorrelationId(),
               (nlohmann::json{{"uuid", timesheet.uuid},
                               {"remote_id", optionalToJson(timesheet.remoteId)},
                               {"date", timesheet.date.toString(Qt::ISODate).toStdString()},
                               {"time", timesheet.time}}));
}

} // namespace

LocalTimesheetRepository::LocalTimesheetRepository()
    : LocalTimesheetRepository(paths::dataFile(QStringLiteral("timesheets.json")))
{
}

LocalTimesheetRepository::LocalTimesheetRepository(const QString &path)
    : m_path(path)
{
}

nlohmann::json LocalTimesheetRepository::load() const
{
    nlohmann::json document = readJsonFile(m_path, nlohmann::json::object());
    if (!document.is_object()) {
        throw InvalidOperation("timesheet file " + m_path.toStdString() + " is not a JSON object");
    }
    return document;
}

void LocalTimesheetRepository::persist(const nlohmann::json &document) const
{
    writeJsonFileAtomic(m_path, document);
}

void LocalTimesheetRepository::save(const Timesheet &timesheet)
{
    timesheet.validate();
    nlohmann::json document = load();

    if (timesheet.remoteId) {
        for (const auto &item : document.items()) {
            if (item.key() == timesheet.uuid) {
                continue;
            }
            const auto other = optionalFromJson<int>(item.value(), "remoteId");
            if (other && *other == *timesheet.remoteId) {
                throw InvalidOperation("remote id " + std::to_string(*timesheet.remoteId)
                                       + " already belongs to timesheet " + item.key());
            }
        }
    }

    const bool replaced = document.contains(timesheet.uuid);
    document[timesheet.uuid] = timesheetToJson(timesheet);
    persist(document);
    logMutation(QStringLiteral("save"),
                replaced ? QStringLiteral("timesheet_replaced") : QStringLiteral("timesheet_created"),
                timesheet);
}

void LocalTimesheetRepository::update(const Timesheet &timesheet)
{
    if (!get(timesheet.uuid)) {
        throw NotFound("timesheet " + timesheet.uuid + " not found");
    }
    save(timesheet);
}

void LocalTimesheetRepository::remove(const std::string &uuid)
{
    nlohmann::json document = load();
    if (!document.contains(uuid)) {
        throw NotFound("timesheet " + uuid + " not found");
    }
    const Timesheet removed = parseTimesheet(document.at(uuid));
    document.erase(uuid);
    persist(document);
    logMutation(QStringLiteral("remove"), QStringLiteral("timesheet_removed"), removed);
}

std::vector<Timesheet> LocalTimesheetRepository::all() const
{
    const nlohmann::json document = load();
    std::vector<Timesheet> timesheets;
    timesheets.reserve(document.size());
    for (const auto &item : document.items()) {
        timesheets.push_back(parseTimesheet(item.value()));
    }
    std::sort(timesheets.begin(), timesheets.end(), [](const Timesheet &a, const Timesheet &b) {
        if (a.date != b.date) {
            return a.date < b.date;
        }
        return a.uuid < b.uuid;
    });
    return timesheets;
}

std::vector<Timesheet> LocalTimesheetRepository::select(
    const std::function<bool(const Timesheet &)> &predicate) const
{
    std::vector<Timesheet> result;
    for (auto &timesheet : all()) {
        if (predicate(timesheet)) {
            result.push_back(std::move(timesheet));
        }
    }
    return result;
}

std::optional<Timesheet> LocalTimesheetRepository::get(const std::string &uuid) const
{
    const nlohmann::json document = load();
    if (!document.contains(uuid)) {
        return std::nullopt;
    }
    return parseTimesheet(document.at(uuid));
}

std::optional<Timesheet> LocalTimesheetRepository::getByRemoteId(int remoteId) const
{
    const auto matches = select([&](const Timesheet &t) { return t.remoteId == remoteId; });
    if (matches.empty()) {
        return std::nullopt;
    }
    return matches.front();
}

std::vector<Timesheet> LocalTimesheetRepository::getByDateRange(const QDate &from, std::optional<QDate> to) const
{
    return select([&](const Timesheet &t) { return t.date >= from && (!to || t.date <= *to); });
}

std::vector<Timesheet> LocalTimesheetRepository::getByDate(const QDate &date) const
{
    return getByDateRange(date, date);
}

std::vector<Timesheet> LocalTimesheetRepository::getByFrameUuids(const std::vector<std::string> &frameUuids) const
{
    return select([&](const Timesheet &t) { return sharesFrame(t, frameUuids); });
}

std::vector<Timesheet> LocalTimesheetRepository::getUnsynced() const
{
    return select([](const Timesheet &t) { return !t.remoteId && !t.doNotSync; });
}

QString LocalTimesheetRepository::path() const
{
    return m_path;
}

} // namespace worklog
