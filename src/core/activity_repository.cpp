#include "core/activity_repository.hpp"

namespace worklog {

namespace {

std::vector<Activity> concat(std::vector<Activity> first, const std::vector<Activity> &second)
{
    first.insert(first.end(), second.begin(), second.end());
    return first;
}

} // namespace

ActivityRepository::ActivityRepository(LocalActivityStore &local, const ActivitySource &remote)
    : m_local(local)
    , m_remote(remote)
{
}

std::vector<Activity> ActivityRepository::all(bool activeOnly) const
{
    return concat(m_local.all(activeOnly), m_remote.all(activeOnly));
}

std::optional<Activity> ActivityRepository::get(const EntityKey &key) const
{
    switch (key.source()) {
    case EntitySource::Local:
        return m_local.get(key);
    case EntitySource::Remote:
        return m_remote.get(key);
    }
    return std::nullopt;
}

std::optional<Activity> ActivityRepository::getByAlias(const std::string &alias, bool activeOnly) const
{
    if (auto activity = m_local.getByAlias(alias, activeOnly)) {
        return activity;
    }
    return m_remote.getByAlias(alias, activeOnly);
}

std::vector<Activity> ActivityRepository::searchByNameOrAlias(const std::string &search, bool activeOnly) const
{
    return concat(m_local.searchByNameOrAlias(search, activeOnly),
                  m_remote.searchByNameOrAlias(search, activeOnly));
}

std::vector<Activity> ActivityRepository::searchByAlias(const std::string &search) const
{
    return concat(m_local.searchByAlias(search), m_remote.searchByAlias(search));
}

Activity ActivityRepository::create(const std::string &name,
                                    const std::string &description,
                                    const EntityKey &projectKey,
                                    std::optional<std::string> alias)
{
    return m_local.create(name, description, projectKey, std::move(alias));
}

Activity ActivityRepository::update(const EntityKey &key,
                                    std::optional<std::string> name,
                                    std::optional<std::string> description,
                                    std::optional<std::string> alias)
{
    return m_local.update(key, std::move(name), std::move(description), std::move(alias));
}

void ActivityRepository::remove(const EntityKey &key, bool force)
{
    m_local.remove(key, force);
}

bool ActivityRepository::hasFrames(const EntityKey &key) const
{
    return m_local.hasFrames(key);
}

std::vector<Frame> ActivityRepository::frames(const EntityKey &key) const
{
    return m_local.frames(key);
}

void ActivityRepository::forceDelete(const EntityKey &key, const FrameCallback &deleteFrame)
{
    m_local.forceDelete(key, deleteFrame);
}

} // namespace worklog
