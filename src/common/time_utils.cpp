#include "common/time_utils.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

#include <QDateTime>
#include <QTime>

namespace worklog {

Clock systemClock()
{
    return [] {
        return truncateToSeconds(std::chrono::system_clock::now());
    };
}

Timestamp truncateToSeconds(Timestamp timestamp)
{
    return std::chrono::time_point_cast<std::chrono::seconds>(timestamp);
}

int64_t toEpochSeconds(Timestamp timestamp)
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               timestamp.time_since_epoch())
        .count();
}

Timestamp fromEpochSeconds(int64_t value)
{
    return Timestamp{std::chrono::seconds{value}};
}

std::string toIso8601Utc(Timestamp timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

std::optional<Timestamp> fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        return std::nullopt;
    }
    std::time_t time = timegm(&tm);
    if (time == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(time);
}

namespace {

Timestamp fromQDateTime(const QDateTime &dt)
{
    return fromEpochSeconds(dt.toSecsSinceEpoch());
}

QDateTime toLocalQDateTime(Timestamp timestamp)
{
    return QDateTime::fromSecsSinceEpoch(toEpochSeconds(timestamp)).toLocalTime();
}

} // namespace

std::optional<Timestamp> parseUserTime(const QString &value, Timestamp now)
{
    const QString trimmed = value.trimmed();
    if (trimmed.isEmpty()) {
        return std::nullopt;
    }

    bool isNumber = false;
    const qint64 epoch = trimmed.toLongLong(&isNumber);
    if (isNumber && trimmed.size() > 5) {
        return fromEpochSeconds(epoch);
    }

    QDateTime dt = QDateTime::fromString(trimmed, Qt::ISODate);
    if (dt.isValid()) {
        return fromQDateTime(dt);
    }

    static const char *const kLocalFormats[] = {
        "yyyy-MM-dd HH:mm:ss",
        "yyyy-MM-dd HH:mm",
    };
    for (const char *format : kLocalFormats) {
        dt = QDateTime::fromString(trimmed, QString::fromLatin1(format));
        if (dt.isValid()) {
            return fromQDateTime(dt);
        }
    }

    const QDate date = QDate::fromString(trimmed, Qt::ISODate);
    if (date.isValid()) {
        return fromQDateTime(date.startOfDay());
    }

    const QTime time = QTime::fromString(trimmed, QStringLiteral("HH:mm"));
    if (time.isValid()) {
        const QDate today = toLocalQDateTime(now).date();
        return fromQDateTime(QDateTime(today, time));
    }

    return std::nullopt;
}

std::optional<Timestamp> parseZonedDateTime(const QString &value, const QTimeZone &zone)
{
    QDateTime dt = QDateTime::fromString(value.trimmed(), QStringLiteral("yyyy-MM-dd HH:mm:ss"));
    if (!dt.isValid()) {
        return std::nullopt;
    }
    dt.setTimeZone(zone);
    return fromQDateTime(dt);
}

std::optional<QDate> parseIsoDate(const QString &value)
{
    const QDate date = QDate::fromString(value.trimmed(), QStringLiteral("yyyy-MM-dd"));
    if (!date.isValid()) {
        return std::nullopt;
    }
    return date;
}

QDate dateInZone(Timestamp timestamp, const QTimeZone &zone)
{
    return QDateTime::fromSecsSinceEpoch(toEpochSeconds(timestamp), zone).date();
}

Timestamp startOfDay(const QDate &date, const QTimeZone &zone)
{
    return fromQDateTime(date.startOfDay(zone));
}

QString formatLocal(Timestamp timestamp)
{
    return toLocalQDateTime(timestamp).toString(QStringLiteral("yyyy-MM-dd HH:mm"));
}

QString formatDuration(std::chrono::seconds duration)
{
    const qint64 total = duration.count() < 0 ? 0 : duration.count();
    const qint64 hours = total / 3600;
    const qint64 minutes = (total % 3600) / 60;
    return QStringLiteral("%1h %2m").arg(hours).arg(minutes, 2, 10, QLatin1Char('0'));
}

} // namespace worklog
