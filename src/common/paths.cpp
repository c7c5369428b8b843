#include "common/paths.hpp"

#include <QDir>

namespace worklog::paths {

QString homeDir()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".");
    }
    return home;
}

QString dataDir()
{
    return homeDir() + QStringLiteral("/.local/share/worklog");
}

QString logsDir()
{
    return dataDir() + QStringLiteral("/logs");
}

QString configDir()
{
    return homeDir() + QStringLiteral("/.config/worklog");
}

QString dataFile(const QString &name)
{
    return dataDir() + QDir::separator() + name;
}

} // namespace worklog::paths
