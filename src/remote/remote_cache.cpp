#include "remote/remote_cache.hpp"

#include <QDir>
#include <QFileInfo>

#include <sqlite3.h>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/paths.hpp"
#include "common/time_utils.hpp"
#include "remote/remote_json.hpp"

namespace worklog {

namespace {

constexpr const char *kCreateProjectsTable =
    "CREATE TABLE IF NOT EXISTS projects ("
    "    id INTEGER PRIMARY KEY,"
    "    name TEXT NOT NULL,"
    "    status INTEGER NOT NULL,"
    "    payload TEXT NOT NULL"
    ");";

constexpr const char *kCreateUsersTable =
    "CREATE TABLE IF NOT EXISTS users ("
    "    id INTEGER PRIMARY KEY,"
    "    payload TEXT NOT NULL,"
    "    fetched_at INTEGER NOT NULL"
    ");";

constexpr const char *kCreateMetaTable =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw WorklogError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw WorklogError(message);
    }
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

// A cache row that no longer parses is dropped from the result, not fatal.
std::optional<nlohmann::json> columnJson(sqlite3_stmt *stmt, int index)
{
    const std::string text = columnText(stmt, index);
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error &ex) {
        WLOG_WARN(QStringLiteral("RemoteCache"),
                  QStringLiteral("columnJson"),
                  QStringLiteral("cache_row_unreadable"),
                  QStringLiteral("corrupt_payload"),
                  QStringLiteral("ignore_row"),
                  logging::defaultWho(),
                  QString(),
                  logging::errorContext(ex));
        return std::nullopt;
    }
}

class Transaction {
public:
    explicit Transaction(sqlite3 *db)
        : m_db(db)
    {
        execOrThrow(m_db, "BEGIN IMMEDIATE;");
    }

    ~Transaction()
    {
        if (!m_committed) {
            sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    void commit()
    {
        execOrThrow(m_db, "COMMIT;");
        m_committed = true;
    }

private:
    sqlite3 *m_db = nullptr;
    bool m_committed = false;
};

} // namespace

struct RemoteCache::Impl {
    sqlite3 *db = nullptr;
    QString path;
};

RemoteCache::RemoteCache()
    : RemoteCache(paths::dataFile(QStringLiteral("cache.db")))
{
}

RemoteCache::RemoteCache(const QString &path)
    : impl(std::make_unique<Impl>())
{
    impl->path = path;
    QDir().mkpath(QFileInfo(path).absolutePath());

    if (sqlite3_open(path.toStdString().c_str(), &impl->db) != SQLITE_OK) {
        const std::string message = impl->db ? sqlite3_errmsg(impl->db) : "out of memory";
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw WorklogError("failed to open cache database " + path.toStdString() + ": " + message);
    }

    execOrThrow(impl->db, kCreateProjectsTable);
    execOrThrow(impl->db, kCreateUsersTable);
    execOrThrow(impl->db, kCreateMetaTable);
}

RemoteCache::~RemoteCache()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

QString RemoteCache::path() const
{
    return impl->path;
}

std::vector<RemoteProjectData> RemoteCache::projects() const
{
    Statement stmt(impl->db, "SELECT payload FROM projects ORDER BY id ASC;");

    std::vector<RemoteProjectData> result;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        const auto payload = columnJson(stmt.get(), 0);
        if (!payload) {
            continue;
        }
        try {
            result.push_back(remote_json::parseProject(*payload));
        } catch (const RemoteUnavailable &ex) {
            WLOG_WARN(QStringLiteral("RemoteCache"),
                      QStringLiteral("projects"),
                      QStringLiteral("cache_row_unreadable"),
                      QStringLiteral("invalid_project_payload"),
                      QStringLiteral("ignore_row"),
                      logging::defaultWho(),
                      QString(),
                      logging::errorContext(ex));
        }
    }
    return result;
}

void RemoteCache::replaceProjects(const std::vector<RemoteProjectData> &projects)
{
    Transaction transaction(impl->db);
    execOrThrow(impl->db, "DELETE FROM projects;");

    for (const auto &project : projects) {
        Statement stmt(impl->db,
                       "INSERT OR REPLACE INTO projects (id, name, status, payload) "
                       "VALUES (?, ?, ?, ?);");
        sqlite3_bind_int(stmt.get(), 1, project.id);
        bindText(stmt.get(), 2, project.name);
        sqlite3_bind_int(stmt.get(), 3, project.status);
        bindText(stmt.get(), 4, remote_json::projectToJson(project).dump());

        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            throw WorklogError("failed to cache project " + std::to_string(project.id));
        }
    }

    transaction.commit();
    setMeta("projects_refreshed_at", toIso8601Utc(systemClock()()));

    WLOG_DEBUG(QStringLiteral("RemoteCache"),
               QStringLiteral("replaceProjects"),
               QStringLiteral("projects_cached"),
               QStringLiteral("refresh"),
               QStringLiteral("sqlite_transaction"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"count", projects.size()}}));
}

std::optional<User> RemoteCache::user(int id) const
{
    Statement stmt(impl->db, "SELECT payload FROM users WHERE id = ? LIMIT 1;");
    sqlite3_bind_int(stmt.get(), 1, id);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    const auto payload = columnJson(stmt.get(), 0);
    if (!payload) {
        return std::nullopt;
    }
    try {
        return remote_json::parseUser(*payload);
    } catch (const RemoteUnavailable &ex) {
        WLOG_WARN(QStringLiteral("RemoteCache"),
                  QStringLiteral("user"),
                  QStringLiteral("cache_row_unreadable"),
                  QStringLiteral("invalid_user_payload"),
                  QStringLiteral("ignore_row"),
                  logging::defaultWho(),
                  QString(),
                  logging::errorContext(ex, {{"userId", id}}));
        return std::nullopt;
    }
}

void RemoteCache::upsertUser(const User &user)
{
    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO users (id, payload, fetched_at) VALUES (?, ?, ?);");
    sqlite3_bind_int(stmt.get(), 1, user.id);
    bindText(stmt.get(), 2, remote_json::userToJson(user).dump());
    sqlite3_bind_int64(stmt.get(), 3, toEpochSeconds(systemClock()()));

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw WorklogError("failed to cache user " + std::to_string(user.id));
    }
}

void RemoteCache::clearUsers()
{
    execOrThrow(impl->db, "DELETE FROM users;");
}

std::optional<std::string> RemoteCache::getMeta(const std::string &key) const
{
    Statement stmt(impl->db, "SELECT value FROM meta WHERE key = ? LIMIT 1;");
    bindText(stmt.get(), 1, key);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return columnText(stmt.get(), 0);
}

void RemoteCache::setMeta(const std::string &key, const std::string &value)
{
    Statement stmt(impl->db, "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);");
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, value);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw WorklogError("failed to set meta value");
    }
}

} // namespace worklog
