#include "common/json_file.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace worklog {

nlohmann::json readJsonFile(const QString &path, const nlohmann::json &fallback)
{
    QFile file(path);
    if (!file.exists()) {
        return fallback;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        throw WorklogError("cannot open " + path.toStdString() + ": "
                           + file.errorString().toStdString());
    }

    const QByteArray bytes = file.readAll();
    if (bytes.trimmed().isEmpty()) {
        return fallback;
    }

    try {
        return nlohmann::json::parse(bytes.constData(), bytes.constData() + bytes.size());
    } catch (const nlohmann::json::parse_error &ex) {
        WLOG_ERROR(QStringLiteral("JsonFile"),
                   QStringLiteral("readJsonFile"),
                   QStringLiteral("json_parse_failed"),
                   QStringLiteral("corrupt_state_file"),
                   QStringLiteral("nlohmann_parse"),
                   logging::defaultWho(),
                   QString(),
                   logging::errorContext(ex, {{"path", path.toStdString()}}));
        throw InvalidOperation("corrupt JSON in " + path.toStdString() + ": " + ex.what());
    }
}

void writeJsonFileAtomic(const QString &path, const nlohmann::json &value)
{
    QDir().mkpath(QFileInfo(path).absolutePath());

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        throw WorklogError("cannot write " + path.toStdString() + ": "
                           + file.errorString().toStdString());
    }

    const std::string text = value.dump(2);
    if (file.write(text.data(), static_cast<qint64>(text.size()))
        != static_cast<qint64>(text.size())) {
        file.cancelWriting();
        throw WorklogError("short write to " + path.toStdString());
    }
    file.write("\n");

    if (!file.commit()) {
        throw WorklogError("cannot commit " + path.toStdString() + ": "
                           + file.errorString().toStdString());
    }
}

} // namespace worklog
