#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/models.hpp"
#include "remote/remote_api.hpp"
#include "remote/remote_cache.hpp"

namespace worklog {

// UserRepository resolves remote users and their roles, reading through the
// SQLite cache. The current user is the one named by the user.id setting.
class UserRepository {
public:
    UserRepository(RemoteApi &api, RemoteCache &cache, const Config &config);

    // Cache first, then the API (the result is cached).
    User getById(int id);
    // InvalidOperation when user.id is not configured.
    User currentUser();
    std::vector<Role> currentUserRoles();
    // The role named by user.defaultRole.id, if it is one of the user's roles.
    std::optional<Role> defaultRole();
    std::optional<Role> findRoleByName(const std::string &text);
    std::optional<Role> findRoleById(int roleId);

    // Drops cached users and re-fetches the current one when configured.
    void refresh();

private:
    RemoteApi &m_api;
    RemoteCache &m_cache;
    const Config &m_config;
};

} // namespace worklog
