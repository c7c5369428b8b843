#include "timesheet/timesheet_factory.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <tuple>

#include "common/logging.hpp"
#include "common/string_utils.hpp"

namespace worklog {

namespace {

constexpr double kQuarter = 0.25;
const char *const kDefaultDescription = "Time entry";

struct Group {
    QDate date;
    std::vector<const Frame *> frames;
};

using GroupKey = std::tuple<QDate, std::string, std::vector<std::string>>;

std::string describe(const std::vector<const Frame *> &frames)
{
    std::vector<std::string> descriptions;
    for (const Frame *frame : frames) {
        const std::string text = trim(frame->description);
        if (text.empty()) {
            continue;
        }
        if (std::find(descriptions.begin(), descriptions.end(), text) == descriptions.end()) {
            descriptions.push_back(text);
        }
    }
    const std::string joined = join(descriptions, " ");
    return joined.empty() ? std::string(kDefaultDescription) : joined;
}

// Individual when any frame is; otherwise the most frequent role, ties going
// to the role seen first.
RoleAssignment pickRole(const std::vector<const Frame *> &frames)
{
    std::vector<std::pair<Role, int>> counts;
    for (const Frame *frame : frames) {
        const Role *role = frame->role.role();
        if (!role) {
            return RoleAssignment::individual();
        }
        auto it = std::find_if(counts.begin(), counts.end(),
                               [&](const std::pair<Role, int> &entry) { return entry.first.id == role->id; });
        if (it == counts.end()) {
            counts.emplace_back(*role, 1);
        } else {
            ++it->second;
        }
    }
    if (counts.empty()) {
        return RoleAssignment::individual();
    }

    auto best = counts.begin();
    for (auto it = counts.begin(); it != counts.end(); ++it) {
        if (it->second > best->second) {
            best = it;
        }
    }
    return RoleAssignment::of(best->first);
}

const Timesheet *findCovering(const std::vector<Timesheet> &existing,
                              const QDate &date,
                              const std::vector<std::string> &frameUuids)
{
    for (const auto &timesheet : existing) {
        if (timesheet.date != date) {
            continue;
        }
        const bool overlaps = std::any_of(frameUuids.begin(), frameUuids.end(), [&](const std::string &uuid) {
            return std::find(timesheet.frameUuids.begin(), timesheet.frameUuids.end(), uuid)
                != timesheet.frameUuids.end();
        });
        if (overlaps) {
            return &timesheet;
        }
    }
    return nullptr;
}

} // namespace

double roundBillableHours(double rawHours, const std::optional<std::string> &alias)
{
    if (rawHours <= kQuarter) {
        return kQuarter;
    }
    if (alias && !alias->empty() && alias->front() == '_') {
        return std::floor(rawHours / kQuarter) * kQuarter;
    }
    return std::round(rawHours * 4.0) / 4.0;
}

TimesheetFactory::TimesheetFactory(QTimeZone zone, Clock clock)
    : m_zone(std::move(zone))
    , m_clock(std::move(clock))
{
}

FromFramesResult TimesheetFactory::fromFrames(const std::vector<Frame> &frames,
                                              const std::vector<Timesheet> &existing) const
{
    std::vector<const Frame *> eligible;
    for (const auto &frame : frames) {
        if (!frame.isActive() && frame.activity.key.isRemote() && frame.activity.projectKey.isRemote()) {
            eligible.push_back(&frame);
        }
    }
    std::stable_sort(eligible.begin(), eligible.end(),
                     [](const Frame *a, const Frame *b) { return a->start < b->start; });

    std::map<GroupKey, Group> groups;
    std::vector<GroupKey> order;
    for (const Frame *frame : eligible) {
        std::vector<std::string> issueKeys = frame->issueKeys;
        std::sort(issueKeys.begin(), issueKeys.end());
        const QDate date = dateInZone(frame->start, m_zone);
        GroupKey key{date, frame->activity.key.toString(), issueKeys};

        auto it = groups.find(key);
        if (it == groups.end()) {
            order.push_back(key);
            it = groups.emplace(key, Group{date, {}}).first;
        }
        it->second.frames.push_back(frame);
    }

    FromFramesResult result;
    std::vector<Timesheet> known = existing;
    const Timestamp now = m_clock();

    for (const auto &key : order) {
        const Group &group = groups.at(key);
        const Activity &activity = group.frames.front()->activity;

        std::chrono::seconds total{0};
        std::vector<std::string> frameUuids;
        for (const Frame *frame : group.frames) {
            total += frame->duration(now);
            frameUuids.push_back(frame->uuid);
        }

        if (const Timesheet *covering = findCovering(known, group.date, frameUuids)) {
            Timesheet merged = *covering;
            bool added = false;
            for (const auto &uuid : frameUuids) {
                if (std::find(merged.frameUuids.begin(), merged.frameUuids.end(), uuid) == merged.frameUuids.end()) {
                    merged.frameUuids.push_back(uuid);
                    added = true;
                }
            }
            if (added) {
                for (auto &timesheet : known) {
                    if (timesheet.uuid == merged.uuid) {
                        timesheet = merged;
                    }
                }
                result.updated.push_back(std::move(merged));
            } else {
                result.skipped.push_back(*covering);
            }
            continue;
        }

        const double hours = roundBillableHours(static_cast<double>(total.count()) / 3600.0, activity.alias);
        Timesheet timesheet = makeTimesheet(activity,
                                            describe(group.frames),
                                            std::nullopt,
                                            hours,
                                            group.date,
                                            pickRole(group.frames),
                                            frameUuids,
                                            std::nullopt,
                                            now);
        known.push_back(timesheet);
        result.created.push_back(std::move(timesheet));
    }

    WLOG_DEBUG(QStringLiteral("TimesheetFactory"),
               QStringLiteral("fromFrames"),
               QStringLiteral("frames_grouped"),
               QStringLiteral("timesheet_from_frames"),
               QStringLiteral("group_by_day_activity_issues"),
               logging::defaultWho(),
               logging::currentCorrelationId(),
               (nlohmann::json{{"frames", frames.size()},
                               {"eligible", eligible.size()},
                               {"created", result.created.size()},
                               {"updated", result.updated.size()},
                               {"skipped", result.skipped.size()}}));
    return result;
}

} // namespace worklog
