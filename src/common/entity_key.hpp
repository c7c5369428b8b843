#pragma once

#include <optional>
#include <string>
#include <variant>

#include "common/enums.hpp"

namespace worklog {

// EntityKey identifies a project or activity: a Local key carries an 8-hex
// uuid, a Remote key the remote system's integer id. The id type always
// matches the source because keys are only built through local()/remote().
class EntityKey {
public:
    static EntityKey local(const std::string &uuid);
    static EntityKey remote(int id);

    // Inverse of toString(): digits are a remote id, 8 hex chars a local uuid.
    static EntityKey parse(const std::string &text);
    static std::optional<EntityKey> tryParse(const std::string &text);

    EntitySource source() const;
    bool isLocal() const;
    bool isRemote() const;

    const std::string &uuid() const;
    int remoteId() const;

    std::string toString() const;

    bool operator==(const EntityKey &other) const;
    bool operator!=(const EntityKey &other) const;
    bool operator<(const EntityKey &other) const;

private:
    explicit EntityKey(std::variant<std::string, int> id);

    std::variant<std::string, int> m_id;
};

std::string toSourceString(EntitySource source);
EntitySource parseSourceString(const std::string &value);

} // namespace worklog
