#include "common/entity_key.hpp"

#include <stdexcept>

#include "common/uuid.hpp"

namespace worklog {

EntityKey::EntityKey(std::variant<std::string, int> id)
    : m_id(std::move(id))
{
}

EntityKey EntityKey::local(const std::string &uuid)
{
    if (!isUuid(uuid)) {
        throw std::invalid_argument("not a local uuid: '" + uuid + "'");
    }
    return EntityKey(uuid);
}

EntityKey EntityKey::remote(int id)
{
    if (id < 0) {
        throw std::invalid_argument("remote id must not be negative: " + std::to_string(id));
    }
    return EntityKey(id);
}

std::optional<EntityKey> EntityKey::tryParse(const std::string &text)
{
    if (text.empty()) {
        return std::nullopt;
    }
    if (text.find_first_not_of("0123456789") == std::string::npos) {
        try {
            return remote(std::stoi(text));
        } catch (const std::out_of_range &) {
            return std::nullopt;
        }
    }
    if (isUuid(text)) {
        return local(text);
    }
    return std::nullopt;
}

EntityKey EntityKey::parse(const std::string &text)
{
    auto key = tryParse(text);
    if (!key) {
        throw std::invalid_argument("not an entity key: '" + text + "'");
    }
    return *key;
}

EntitySource EntityKey::source() const
{
    return std::holds_alternative<int>(m_id) ? EntitySource::Remote : EntitySource::Local;
}

bool EntityKey::isLocal() const
{
    return source() == EntitySource::Local;
}

bool EntityKey::isRemote() const
{
    return source() == EntitySource::Remote;
}

const std::string &EntityKey::uuid() const
{
    if (!isLocal()) {
        throw std::logic_error("remote key has no uuid: " + toString());
    }
    return std::get<std::string>(m_id);
}

int EntityKey::remoteId() const
{
    if (!isRemote()) {
        throw std::logic_error("local key has no remote id: " + toString());
    }
    return std::get<int>(m_id);
}

std::string EntityKey::toString() const
{
    if (isRemote()) {
        return std::to_string(std::get<int>(m_id));
    }
    return std::get<std::string>(m_id);
}

bool EntityKey::operator==(const EntityKey &other) const
{
    return m_id == other.m_id;
}

bool EntityKey::operator!=(const EntityKey &other) const
{
    return !(*this == other);
}

bool EntityKey::operator<(const EntityKey &other) const
{
    return m_id < other.m_id;
}

std::string toSourceString(EntitySource source)
{
    switch (source) {
    case EntitySource::Local:
        return "local";
    case EntitySource::Remote:
        return "remote";
    }
    return "local";
}

EntitySource parseSourceString(const std::string &value)
{
    if (value == "local") {
        return EntitySource::Local;
    }
    if (value == "remote") {
        return EntitySource::Remote;
    }
    throw std::invalid_argument("unknown entity source: '" + value + "'");
}

} // namespace worklog
