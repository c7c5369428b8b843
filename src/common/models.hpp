#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/entity_key.hpp"
#include "common/enums.hpp"

namespace worklog {

// Reference data owned by a remote user; read-only on this side.
struct Role {
    int id = 0;
    std::optional<int> parentId;
    std::string name;
    std::string fullName;
    std::string type;
    std::string status;

    bool operator==(const Role &other) const
    {
        return id == other.id && parentId == other.parentId && name == other.name
            && fullName == other.fullName && type == other.type && status == other.status;
    }
    bool operator!=(const Role &other) const { return !(*this == other); }
};

// Either a role or an individual action, never both and never neither.
class RoleAssignment {
public:
    static RoleAssignment individual()
    {
        return RoleAssignment(std::nullopt);
    }

    static RoleAssignment of(Role role)
    {
        return RoleAssignment(std::move(role));
    }

    bool isIndividual() const
    {
        return !m_role.has_value();
    }

    // nullptr for individual actions.
    const Role *role() const
    {
        return m_role ? &*m_role : nullptr;
    }

    std::optional<int> roleId() const
    {
        return m_role ? std::optional<int>(m_role->id) : std::nullopt;
    }

    bool operator==(const RoleAssignment &other) const { return m_role == other.m_role; }
    bool operator!=(const RoleAssignment &other) const { return !(*this == other); }

private:
    explicit RoleAssignment(std::optional<Role> role)
        : m_role(std::move(role))
    {
    }

    std::optional<Role> m_role;
};

struct Activity {
    EntityKey key;
    std::string name;
    std::string description;
    // Back-reference for display and cascade checks, not ownership.
    EntityKey projectKey;
    std::optional<std::string> alias;

    bool operator==(const Activity &other) const
    {
        return key == other.key && name == other.name && description == other.description
            && projectKey == other.projectKey && alias == other.alias;
    }
    bool operator!=(const Activity &other) const { return !(*this == other); }
};

struct Project {
    EntityKey key;
    std::string name;
    std::string description;
    int status = static_cast<int>(ProjectStatus::Active);
    std::vector<Activity> activities;

    bool hasStatus(ProjectStatus value) const
    {
        return status == static_cast<int>(value);
    }
};

struct User {
    int id = 0;
    std::string username;
    std::string firstname;
    std::string lastname;
    std::string name;
    std::string email;
    std::optional<std::string> alternativeEmail;
    std::string employeeType;
    std::optional<std::string> employeeStatus;
    std::vector<Role> roles;

    const Role *findRole(int roleId) const;
    // Case-insensitive substring match on the role name.
    const Role *findRoleByName(const std::string &text) const;
};

} // namespace worklog
