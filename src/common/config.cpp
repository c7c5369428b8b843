#include "common/config.hpp"

#include <vector>

#include "common/errors.hpp"
#include "common/json_file.hpp"
#include "common/logging.hpp"
#include "common/paths.hpp"

namespace worklog {

namespace {

constexpr const char *kDefaultTimezone = "Europe/Zurich";
constexpr int kDefaultTimeoutMs = 10000;

std::vector<std::string> splitKey(const std::string &key)
{
    std::vector<std::string> parts;
    std::string current;
    for (char c : key) {
        if (c == '.') {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(current);

    for (const auto &part : parts) {
        if (part.empty()) {
            throw InvalidOperation("invalid config key: '" + key + "'");
        }
    }
    return parts;
}

std::optional<std::string> stringValue(const std::optional<nlohmann::json> &value)
{
    if (!value || !value->is_string()) {
        return std::nullopt;
    }
    return value->get<std::string>();
}

} // namespace

Config::Config()
    : Config(paths::configDir() + QStringLiteral("/config.json"))
{
}

Config::Config(const QString &path)
    : m_path(path)
    , m_data(readJsonFile(path))
{
    if (!m_data.is_object()) {
        throw InvalidOperation("config root must be a JSON object: " + path.toStdString());
    }
}

std::optional<nlohmann::json> Config::get(const std::string &key) const
{
    const nlohmann::json *node = &m_data;
    for (const auto &part : splitKey(key)) {
        if (!node->is_object() || !node->contains(part)) {
            return std::nullopt;
        }
        node = &node->at(part);
    }
    if (node->is_null()) {
        return std::nullopt;
    }
    return *node;
}

void Config::set(const std::string &key, const nlohmann::json &value)
{
    const auto parts = splitKey(key);
    nlohmann::json *node = &m_data;
    for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
        nlohmann::json &child = (*node)[parts[i]];
        if (!child.is_object()) {
            child = nlohmann::json::object();
        }
        node = &child;
    }
    (*node)[parts.back()] = value;
    save();

    WLOG_INFO(QStringLiteral("Config"),
              QStringLiteral("set"),
              QStringLiteral("config_value_set"),
              QStringLiteral("user_request"),
              QStringLiteral("json_file"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"key", key}}));
}

bool Config::unset(const std::string &key)
{
    const auto parts = splitKey(key);
    nlohmann::json *node = &m_data;
    for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
        if (!node->is_object() || !node->contains(parts[i])) {
            return false;
        }
        node = &node->at(parts[i]);
    }
    if (!node->is_object() || node->erase(parts.back()) == 0) {
        return false;
    }
    save();
    return true;
}

const nlohmann::json &Config::all() const
{
    return m_data;
}

QString Config::path() const
{
    return m_path;
}

std::optional<int> Config::userId() const
{
    const auto value = get("user.id");
    return value ? toInt(*value) : std::nullopt;
}

std::optional<int> Config::defaultRoleId() const
{
    const auto value = get("user.defaultRole.id");
    return value ? toInt(*value) : std::nullopt;
}

QTimeZone Config::timesheetZone() const
{
    const auto configured = stringValue(get("timesheet.timezone"));
    const QByteArray id = configured ? QByteArray::fromStdString(*configured)
                                     : QByteArray(kDefaultTimezone);
    QTimeZone zone(id);
    if (!zone.isValid()) {
        throw InvalidOperation("unknown timezone in config: " + id.toStdString());
    }
    return zone;
}

QString Config::remoteBaseUri() const
{
    const QString env = qEnvironmentVariable("WORKLOG_BASE_URI");
    if (!env.isEmpty()) {
        return env;
    }
    const auto value = stringValue(get("remote.baseUri"));
    return value ? QString::fromStdString(*value) : QString();
}

QString Config::remoteToken() const
{
    const QString env = qEnvironmentVariable("WORKLOG_TOKEN");
    if (!env.isEmpty()) {
        return env;
    }
    const auto value = stringValue(get("remote.token"));
    return value ? QString::fromStdString(*value) : QString();
}

int Config::remoteTimeoutMs() const
{
    const auto value = get("remote.timeoutMs");
    const auto parsed = value ? toInt(*value) : std::nullopt;
    return parsed && *parsed > 0 ? *parsed : kDefaultTimeoutMs;
}

std::optional<int> Config::toInt(const nlohmann::json &value)
{
    if (value.is_number_integer()) {
        return value.get<int>();
    }
    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
            return std::nullopt;
        }
        try {
            return std::stoi(text);
        } catch (const std::out_of_range &) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

void Config::save() const
{
    writeJsonFileAtomic(m_path, m_data);
}

} // namespace worklog
