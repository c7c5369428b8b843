#pragma once

#include <optional>
#include <string>

#include <QString>
#include <QTimeZone>

#include <nlohmann/json.hpp>

namespace worklog {

// Config is the user's JSON settings file with dotted-key access
// ("user.defaultRole.id" walks nested objects). Every set/unset is persisted
// immediately.
class Config {
public:
    Config();
    explicit Config(const QString &path);

    std::optional<nlohmann::json> get(const std::string &key) const;
    void set(const std::string &key, const nlohmann::json &value);
    bool unset(const std::string &key);

    const nlohmann::json &all() const;
    QString path() const;

    // Typed accessors for the keys the core reads.
    std::optional<int> userId() const;
    std::optional<int> defaultRoleId() const;
    QTimeZone timesheetZone() const;
    QString remoteBaseUri() const;
    QString remoteToken() const;
    int remoteTimeoutMs() const;

    // Integers may be stored as numbers or digit strings.
    static std::optional<int> toInt(const nlohmann::json &value);

private:
    QString m_path;
    nlohmann::json m_data;

    void save() const;
};

} // namespace worklog
