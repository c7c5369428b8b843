#include "common/models.hpp"

#include "common/string_utils.hpp"

namespace worklog {

const Role *User::findRole(int roleId) const
{
    for (const auto &role : roles) {
        if (role.id == roleId) {
            return &role;
        }
    }
    return nullptr;
}

const Role *User::findRoleByName(const std::string &text) const
{
    for (const auto &role : roles) {
        if (containsCaseInsensitive(role.name, text)) {
            return &role;
        }
    }
    return nullptr;
}

} // namespace worklog
