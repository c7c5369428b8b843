#include "timesheet/timesheet.hpp"

#include <cmath>
#include <sstream>

#include "common/errors.hpp"
#include "common/string_utils.hpp"
#include "common/uuid.hpp"

namespace worklog {

namespace {

constexpr double kQuarterEpsilon = 0.0001;

std::string formatHours(double hours)
{
    std::ostringstream out;
    out << hours;
    return out.str();
}

} // namespace

int Timesheet::projectId() const
{
    return activity.projectKey.remoteId();
}

bool isQuarterHourMultiple(double hours)
{
    return std::fabs(std::fmod(hours * 100.0, 25.0)) <= kQuarterEpsilon;
}

void Timesheet::validate() const
{
    if (!isUuid(uuid)) {
        throw InvalidOperation("timesheet uuid is invalid: '" + uuid + "'");
    }
    if (!activity.key.isRemote()) {
        throw InvalidOperation("timesheets only accept remote activities, got local activity "
                               + activity.key.toString());
    }
    if (!activity.projectKey.isRemote()) {
        throw InvalidOperation("timesheet activity " + activity.key.toString()
                               + " must belong to a remote project");
    }
    if (!(time > 0.0)) {
        throw InvalidOperation("timesheet time must be positive, got " + formatHours(time));
    }
    if (!isQuarterHourMultiple(time)) {
        throw InvalidOperation("timesheet time must be a multiple of 0.25, got " + formatHours(time));
    }
    if (!date.isValid()) {
        throw InvalidOperation("timesheet " + uuid + " has no valid date");
    }
}

bool Timesheet::operator==(const Timesheet &other) const
{
    return uuid == other.uuid && activity == other.activity
        && description == other.description && clientDescription == other.clientDescription
        && time == other.time && date == other.date && role == other.role
        && frameUuids == other.frameUuids && remoteId == other.remoteId
        && updatedAt == other.updatedAt && doNotSync == other.doNotSync;
}

Timesheet makeTimesheet(Activity activity,
                        const std::string &description,
                        std::optional<std::string> clientDescription,
                        double time,
                        const QDate &date,
                        RoleAssignment role,
                        std::vector<std::string> frameUuids,
                        std::optional<int> remoteId,
                        Timestamp updatedAt,
                        const std::string &uuid,
                        bool doNotSync)
{
    Timesheet timesheet{uuid.empty() ? generateUuid() : uuid,
                        std::move(activity),
                        description,
                        std::move(clientDescription),
                        time,
                        date,
                        std::move(role),
                        std::move(frameUuids),
                        remoteId,
                        truncateToSeconds(updatedAt),
                        doNotSync};
    timesheet.validate();
    return timesheet;
}

Timesheet applyEdit(const Timesheet &timesheet, const TimesheetEdit &edit, Timestamp now)
{
    const bool individual = edit.individual.value_or(timesheet.isIndividual());
    if (individual && edit.role) {
        throw InvalidOperation("cannot set a role on individual timesheet " + timesheet.uuid);
    }

    RoleAssignment role = RoleAssignment::individual();
    if (!individual) {
        if (edit.role) {
            role = RoleAssignment::of(*edit.role);
        } else if (!timesheet.isIndividual()) {
            role = timesheet.role;
        } else {
            throw InvalidOperation("timesheet " + timesheet.uuid + " needs a role when it is not individual");
        }
    }

    const std::string description = edit.description.value_or(timesheet.description);
    if (trim(description).empty()) {
        throw InvalidOperation("timesheet description cannot be empty");
    }

    std::optional<std::string> clientDescription = timesheet.clientDescription;
    if (edit.clientDescription) {
        clientDescription = trim(*edit.clientDescription).empty() ? std::nullopt : edit.clientDescription;
    }

    return makeTimesheet(edit.activity.value_or(timesheet.activity),
                         description,
                         clientDescription,
                         edit.time.value_or(timesheet.time),
                         edit.date.value_or(timesheet.date),
                         role,
                         timesheet.frameUuids,
                         timesheet.remoteId,
                         now,
                         timesheet.uuid,
                         edit.doNotSync.value_or(timesheet.doNotSync));
}

} // namespace worklog
