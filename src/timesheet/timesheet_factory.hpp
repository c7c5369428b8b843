#pragma once

#include <optional>
#include <string>
#include <vector>

#include <QTimeZone>

#include "common/time_utils.hpp"
#include "core/frame.hpp"
#include "timesheet/timesheet.hpp"

namespace worklog {

// Outcome of turning frames into timesheets. Nothing is persisted here.
struct FromFramesResult {
    std::vector<Timesheet> created;
    // Existing timesheets that gained frame uuids.
    std::vector<Timesheet> updated;
    // Groups whose frames were all covered by an existing timesheet.
    std::vector<Timesheet> skipped;
};

// Billable hours for a raw duration: at least 0.25, rounded down for
// activities whose alias starts with '_', otherwise to the nearest quarter.
double roundBillableHours(double rawHours, const std::optional<std::string> &alias);

// TimesheetFactory groups closed frames of remote activities by calendar day
// (in the timesheet zone), activity and sorted issue keys.
class TimesheetFactory {
public:
    explicit TimesheetFactory(QTimeZone zone, Clock clock = systemClock());

    FromFramesResult fromFrames(const std::vector<Frame> &frames,
                                const std::vector<Timesheet> &existing) const;

private:
    QTimeZone m_zone;
    Clock m_clock;
};

} // namespace worklog
