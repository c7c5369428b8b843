#pragma once

#include <optional>
#include <string>
#include <vector>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/models.hpp"
#include "common/time_utils.hpp"
#include "core/frame.hpp"

namespace worklog {

struct FrameFilter {
    // Project filters only ever match frames of remote projects.
    std::vector<int> projectIds;
    std::vector<std::string> issueKeys;
    std::vector<int> excludeProjectIds;
    std::vector<std::string> excludeIssueKeys;
    std::optional<Timestamp> from;
    std::optional<Timestamp> to;
    // true: any overlap with [from, to]; false: full containment.
    bool includePartial = false;
    // Also consider the open frame, measured up to now.
    bool includeCurrent = false;
};

// FrameRepository persists closed frames and the single open "current" frame
// in one JSON document ({"frames": {uuid: frame}, "current": frame|null}).
// Every mutation rewrites the document atomically, so the current slot and
// the collection can never disagree on disk.
class FrameRepository {
public:
    explicit FrameRepository(Clock clock = systemClock());
    FrameRepository(const QString &path, Clock clock);

    // Closed frames only; create-or-replace by uuid.
    void save(const Frame &frame);
    // Replace an existing frame (closed or current). Reopening moves the frame
    // into the current slot; closing the current frame vacates it.
    void update(const Frame &frame);
    void remove(const std::string &uuid);

    // Closed frames ordered by start time.
    std::vector<Frame> all() const;
    // Looks in the collection and the current slot.
    std::optional<Frame> get(const std::string &uuid) const;
    // Closed frames whose start lies in [from, to].
    std::vector<Frame> getByDateRange(Timestamp from, std::optional<Timestamp> to) const;
    std::vector<Frame> filter(const FrameFilter &filter) const;

    void saveCurrent(const Frame &frame);
    std::optional<Frame> getCurrent() const;
    bool hasCurrent() const;
    // Closes the current frame at stop (default now) and moves it to the collection.
    Frame completeCurrent(std::optional<Timestamp> stop = std::nullopt);
    void clearCurrent();

    std::optional<Role> getLastUsedRoleForActivity(const EntityKey &activityKey) const;
    std::optional<Activity> getLastActivityForIssueKeys(std::vector<std::string> issueKeys) const;

    Timestamp now() const;
    QString path() const;

private:
    QString m_path;
    Clock m_clock;

    nlohmann::json load() const;
    void persist(const nlohmann::json &document) const;
    void checkCurrentCandidate(const Frame &frame, const nlohmann::json &document) const;
};

} // namespace worklog
