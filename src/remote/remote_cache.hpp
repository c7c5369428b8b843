#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <QString>

#include "common/models.hpp"
#include "remote/remote_api.hpp"

namespace worklog {

// RemoteCache is the SQLite copy of read-only remote reference data:
// projects with their activities, users with their roles, and refresh
// metadata. It never holds timesheets.
class RemoteCache {
public:
    RemoteCache();
    explicit RemoteCache(const QString &path);
    ~RemoteCache();

    RemoteCache(const RemoteCache &) = delete;
    RemoteCache &operator=(const RemoteCache &) = delete;

    // Ordered by project id.
    std::vector<RemoteProjectData> projects() const;
    // Replaces every cached project in one transaction.
    void replaceProjects(const std::vector<RemoteProjectData> &projects);

    std::optional<User> user(int id) const;
    void upsertUser(const User &user);
    void clearUsers();

    std::optional<std::string> getMeta(const std::string &key) const;
    void setMeta(const std::string &key, const std::string &value);

    QString path() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace worklog
