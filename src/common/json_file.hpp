#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace worklog {

// Missing or empty files yield the fallback. A file that exists but does not
// parse throws InvalidOperation rather than being treated as empty.
nlohmann::json readJsonFile(const QString &path,
                            const nlohmann::json &fallback = nlohmann::json::object());

// Write-temp-then-rename through QSaveFile: readers see the old or the new
// content, never a partial file.
void writeJsonFileAtomic(const QString &path, const nlohmann::json &value);

} // namespace worklog
