#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <QDate>
#include <QString>

#include <nlohmann/json.hpp>

#include "timesheet/timesheet.hpp"

namespace worklog {

// LocalTimesheetRepository keeps timesheets in one JSON object keyed by uuid.
// A remote id belongs to at most one local record.
class LocalTimesheetRepository {
public:
    LocalTimesheetRepository();
    explicit LocalTimesheetRepository(const QString &path);

    // Create or replace by uuid. InvalidOperation when another record
    // already carries the same remote id.
    void save(const Timesheet &timesheet);
    // NotFound when the uuid is unknown.
    void update(const Timesheet &timesheet);
    void remove(const std::string &uuid);

    // Ordered by date, then uuid.
    std::vector<Timesheet> all() const;
    std::optional<Timesheet> get(const std::string &uuid) const;
    std::optional<Timesheet> getByRemoteId(int remoteId) const;
    // Inclusive; an open end means every later date.
    std::vector<Timesheet> getByDateRange(const QDate &from, std::optional<QDate> to = std::nullopt) const;
    std::vector<Timesheet> getByDate(const QDate &date) const;
    // Records sharing at least one frame uuid with the given set.
    std::vector<Timesheet> getByFrameUuids(const std::vector<std::string> &frameUuids) const;
    // Never pushed and not excluded from sync.
    std::vector<Timesheet> getUnsynced() const;

    QString path() const;

private:
    QString m_path;

    nlohmann::json load() const;
    void persist(const nlohmann::json &document) const;
    std::vector<Timesheet> select(const std::function<bool(const Timesheet &)> &predicate) const;
};

} // namespace worklog
