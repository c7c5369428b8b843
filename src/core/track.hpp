#pragma once

#include <functional>
#include <optional>
#include <string>

#include "common/models.hpp"
#include "common/time_utils.hpp"
#include "core/frame.hpp"
#include "core/frame_repository.hpp"

namespace worklog {

// Supplies the role for non-individual frames started without one.
using DefaultRoleResolver = std::function<std::optional<Role>()>;

// Track is the Idle/Active state machine over the repository's current slot.
// All times are validated against the injected clock, never the wall clock.
class Track {
public:
    Track(FrameRepository &frames, DefaultRoleResolver defaultRole, Clock clock = systemClock());

    // gap=false starts where the last closed frame stopped.
    Frame start(const Activity &activity,
                const std::string &description = std::string(),
                std::optional<Timestamp> at = std::nullopt,
                bool gap = true,
                bool isIndividual = false,
                std::optional<Role> role = std::nullopt);

    Frame stop(std::optional<Timestamp> at = std::nullopt);
    Frame cancel();

    // Records a closed frame without touching the current slot.
    Frame add(const Activity &activity,
              Timestamp from,
              Timestamp to,
              const std::string &description = std::string(),
              bool isIndividual = false,
              std::optional<Role> role = std::nullopt);

    // Starts a new frame with the activity, description and role of source.
    Frame restart(const Frame &source,
                  std::optional<Timestamp> at = std::nullopt,
                  bool gap = true);

    bool isStarted() const;
    std::optional<Frame> getCurrent() const;

    // Most recent closed frame that does not end in the future.
    std::optional<Frame> lastFrame() const;

private:
    FrameRepository &m_frames;
    DefaultRoleResolver m_defaultRole;
    Clock m_clock;

    RoleAssignment resolveRole(bool isIndividual, std::optional<Role> role) const;
};

} // namespace worklog
