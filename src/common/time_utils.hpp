#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <QDate>
#include <QString>
#include <QTimeZone>

namespace worklog {

using Timestamp = std::chrono::system_clock::time_point;

// Injected wherever "now" matters so state machine checks are testable.
using Clock = std::function<Timestamp()>;

// Wall clock truncated to whole seconds, the resolution of every persisted time.
Clock systemClock();

Timestamp truncateToSeconds(Timestamp timestamp);

int64_t toEpochSeconds(Timestamp timestamp);
Timestamp fromEpochSeconds(int64_t value);

std::string toIso8601Utc(Timestamp timestamp);
std::optional<Timestamp> fromIso8601Utc(const std::string &value);

// Accepts ISO 8601 (with or without offset, local time when absent),
// "yyyy-MM-dd HH:mm[:ss]", "yyyy-MM-dd" (local midnight), "HH:mm" (today, local)
// and plain epoch seconds.
std::optional<Timestamp> parseUserTime(const QString &value, Timestamp now);

// "yyyy-MM-dd HH:mm:ss" interpreted in the given zone, as the remote API sends it.
std::optional<Timestamp> parseZonedDateTime(const QString &value, const QTimeZone &zone);

std::optional<QDate> parseIsoDate(const QString &value);

QDate dateInZone(Timestamp timestamp, const QTimeZone &zone);
Timestamp startOfDay(const QDate &date, const QTimeZone &zone);

QString formatLocal(Timestamp timestamp);
QString formatDuration(std::chrono::seconds duration);

} // namespace worklog
