#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "common/time_utils.hpp"

namespace worklog {

// One tracked interval. A frame is never edited in place: changes build a
// replacement with the same uuid (see makeFrame/withStopTime).
struct Frame {
    std::string uuid;
    Timestamp start;
    std::optional<Timestamp> stop;
    Activity activity;
    std::string description;
    RoleAssignment role;
    // Derived from description by makeFrame.
    std::vector<std::string> issueKeys;
    Timestamp updatedAt;

    bool isActive() const
    {
        return !stop.has_value();
    }

    bool isIndividual() const
    {
        return role.isIndividual();
    }

    // Open frames are measured up to now.
    std::chrono::seconds duration(Timestamp now) const;

    bool operator==(const Frame &other) const;
    bool operator!=(const Frame &other) const { return !(*this == other); }
};

// Issue keys such as "ABC-123", deduplicated in order of appearance.
std::vector<std::string> extractIssueKeys(const std::string &description);

// Builds a frame, deriving issue keys and checking stop >= start (InvalidTime).
Frame makeFrame(const std::string &uuid,
                Timestamp start,
                std::optional<Timestamp> stop,
                Activity activity,
                const std::string &description,
                RoleAssignment role,
                Timestamp updatedAt);

Frame withStopTime(const Frame &frame, Timestamp stop, Timestamp now);
Frame withDescription(const Frame &frame, const std::string &description, Timestamp now);

} // namespace worklog
