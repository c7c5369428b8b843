#pragma once

#include <QString>

namespace worklog::paths {

// All paths hang off $HOME so tests can isolate state with a temporary HOME.
QString homeDir();

// $HOME/.local/share/worklog: frames, timesheets, local projects, cache.db.
QString dataDir();
QString logsDir();

// $HOME/.config/worklog
QString configDir();

QString dataFile(const QString &name);

} // namespace worklog::paths
