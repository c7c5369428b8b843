#include "core/user_repository.hpp"

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace worklog {

UserRepository::UserRepository(RemoteApi &api, RemoteCache &cache, const Config &config)
    : m_api(api)
    , m_cache(cache)
    , m_config(config)
{
}

User UserRepository::getById(int id)
{
    if (auto cached = m_cache.user(id)) {
        return *cached;
    }

    User user = m_api.fetchUserById(id);
    m_cache.upsertUser(user);
    WLOG_INFO(QStringLiteral("UserRepository"),
              QStringLiteral("getById"),
              QStringLiteral("user_cached"),
              QStringLiteral("cache_miss"),
              QStringLiteral("fetch_from_api"),
              logging::defaultWho(),
              logging::currentCorrelationId(),
              (nlohmann::json{{"user_id", id}, {"roles", user.roles.size()}}));
    return user;
}

User UserRepository::currentUser()
{
    const auto id = m_config.userId();
    if (!id) {
        throw InvalidOperation("no current user configured; set user.id first");
    }
    return getById(*id);
}

std::vector<Role> UserRepository::currentUserRoles()
{
    return currentUser().roles;
}

std::optional<Role> UserRepository::defaultRole()
{
    const auto roleId = m_config.defaultRoleId();
    if (!roleId || !m_config.userId()) {
        return std::nullopt;
    }
    return findRoleById(*roleId);
}

std::optional<Role> UserRepository::findRoleByName(const std::string &text)
{
    const User user = currentUser();
    const Role *role = user.findRoleByName(text);
    return role ? std::optional<Role>(*role) : std::nullopt;
}

std::optional<Role> UserRepository::findRoleById(int roleId)
{
    const User user = currentUser();
    const Role *role = user.findRole(roleId);
    return role ? std::optional<Role>(*role) : std::nullopt;
}

void UserRepository::refresh()
{
    m_cache.clearUsers();
    const auto id = m_config.userId();
    if (id) {
        getById(*id);
    }

    WLOG_INFO(QStringLiteral("UserRepository"),
              QStringLiteral("refresh"),
              QStringLiteral("users_refreshed"),
              QStringLiteral("user_command"),
              QStringLiteral("clear_cache"),
              logging::defaultWho(),
              logging::currentCorrelationId(),
              (nlohmann::json{{"user_id", id ? nlohmann::json(*id) : nlohmann::json(nullptr)}}));
}

} // namespace worklog
