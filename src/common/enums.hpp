#pragma once

namespace worklog {

// Where a project, activity or key originates. Closed set: every routing
// switch over it must handle both.
enum class EntitySource {
    Local,
    Remote
};

// Matches the remote system's integer status codes.
enum class ProjectStatus {
    Inactive = 0,
    Active = 1,
    Other = 2
};

} // namespace worklog
