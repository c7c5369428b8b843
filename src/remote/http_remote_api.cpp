#include "remote/http_remote_api.hpp"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QObject>
#include <QTimer>
#include <QUrl>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "remote/remote_json.hpp"

namespace worklog {

namespace {

const QString kTimesheetsPath = QStringLiteral("/api/v2/timesheets");

QUrlQuery payloadQuery(const TimesheetPayload &payload)
{
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("project_id"), QString::number(payload.projectId));
    query.addQueryItem(QStringLiteral("activity_id"), QString::number(payload.activityId));
    query.addQueryItem(QStringLiteral("description"), QString::fromStdString(payload.description));
    query.addQueryItem(QStringLiteral("time"), QString::number(payload.time));
    query.addQueryItem(QStringLiteral("date"), payload.date.toString(Qt::ISODate));
    if (payload.clientDescription) {
        query.addQueryItem(QStringLiteral("client_description"),
                           QString::fromStdString(*payload.clientDescription));
    }
    if (payload.roleId) {
        query.addQueryItem(QStringLiteral("role_id"), QString::number(*payload.roleId));
    }
    return query;
}

void logRequest(const QByteArray &verb, const QString &path, int status, const QString &what)
{
    WLOG_DEBUG(QStringLiteral("HttpRemoteApi"),
               QStringLiteral("send"),
               what,
               QStringLiteral("remote_call"),
               QStringLiteral("qnetworkaccessmanager"),
               logging::defaultWho(),
               logging::currentCorrelationId(),
               (nlohmann::json{{"method", verb.toStdString()},
                               {"path", path.toStdString()},
                               {"status", status}}));
}

} // namespace

HttpRemoteApi::HttpRemoteApi(const QString &baseUri, const QString &token, const QTimeZone &zone, int timeoutMs)
    : m_baseUri(baseUri)
    , m_token(token)
    , m_zone(zone)
    , m_timeoutMs(timeoutMs)
    , m_network(std::make_unique<QNetworkAccessManager>())
{
    while (m_baseUri.endsWith(QLatin1Char('/'))) {
        m_baseUri.chop(1);
    }
}

HttpRemoteApi::~HttpRemoteApi() = default;

std::unique_ptr<HttpRemoteApi> HttpRemoteApi::fromConfig(const Config &config)
{
    const QString baseUri = config.remoteBaseUri();
    if (baseUri.isEmpty()) {
        throw InvalidOperation("remote.baseUri is not configured (or set WORKLOG_BASE_URI)");
    }
    return std::make_unique<HttpRemoteApi>(baseUri,
                                           config.remoteToken(),
                                           config.timesheetZone(),
                                           config.remoteTimeoutMs());
}

nlohmann::json HttpRemoteApi::send(const QByteArray &verb, const QString &path, const QUrlQuery &query)
{
    QUrl url(m_baseUri + path);
    url.setQuery(query);

    QNetworkRequest request(url);
    request.setRawHeader("Accept", "application/json");
    if (!m_token.isEmpty()) {
        request.setRawHeader("Authorization", QStringLiteral("Bearer %1").arg(m_token).toUtf8());
    }

    QEventLoop loop;
    QTimer timeoutTimer;
    timeoutTimer.setSingleShot(true);
    QObject::connect(&timeoutTimer, &QTimer::timeout, &loop, &QEventLoop::quit);

    QNetworkReply *reply = nullptr;
    if (verb == "GET") {
        reply = m_network->get(request);
    } else if (verb == "POST") {
        reply = m_network->post(request, QByteArray());
    } else if (verb == "PUT") {
        reply = m_network->put(request, QByteArray());
    } else if (verb == "DELETE") {
        reply = m_network->deleteResource(request);
    } else {
        throw InvalidOperation("unsupported HTTP method " + verb.toStdString());
    }
    std::unique_ptr<QNetworkReply> guard(reply);

    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    timeoutTimer.start(m_timeoutMs);
    loop.exec();

    if (!timeoutTimer.isActive()) {
        reply->abort();
        logRequest(verb, path, 0, QStringLiteral("request_timeout"));
        throw RemoteUnavailable("request timed out after " + std::to_string(m_timeoutMs) + " ms: "
                                + verb.toStdString() + " " + path.toStdString());
    }
    timeoutTimer.stop();

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const QByteArray body = reply->readAll();
    logRequest(verb, path, status, QStringLiteral("request_finished"));

    if (status == 0 && reply->error() != QNetworkReply::NoError) {
        throw RemoteUnavailable("network error for " + verb.toStdString() + " " + path.toStdString()
                                + ": " + reply->errorString().toStdString());
    }
    if (status < 200 || status >= 300) {
        throw RemoteUnavailable("HTTP " + std::to_string(status) + " for " + verb.toStdString()
                                    + " " + path.toStdString(),
                                status);
    }

    try {
        return nlohmann::json::parse(body.toStdString());
    } catch (const nlohmann::json::parse_error &ex) {
        throw RemoteUnavailable("invalid JSON from " + path.toStdString() + ": " + ex.what(), status);
    }
}

std::vector<RemoteProjectData> HttpRemoteApi::fetchProjectsAll()
{
    QUrlQuery query;
    for (const char *status : {"0", "1", "2"}) {
        query.addQueryItem(QStringLiteral("statuses[]"), QString::fromLatin1(status));
    }
    return remote_json::parseProjectList(send("GET", QStringLiteral("/api/v2/projects"), query));
}

User HttpRemoteApi::fetchUserById(int id)
{
    return remote_json::parseUser(
        send("GET", QStringLiteral("/api/v2/users/%1").arg(id), QUrlQuery()));
}

RemoteTimesheetData HttpRemoteApi::fetchTimesheetById(int remoteId)
{
    nlohmann::json body;
    try {
        body = send("GET", kTimesheetsPath + QStringLiteral("/%1").arg(remoteId), QUrlQuery());
    } catch (const RemoteUnavailable &ex) {
        if (ex.httpStatus() == 404) {
            throw NotFound("remote timesheet " + std::to_string(remoteId) + " not found");
        }
        throw;
    }

    remote_json::requireSuccess(body);
    if (!body.contains("data") || !body.at("data").is_object()) {
        throw RemoteUnavailable("timesheet data not found in API response");
    }
    return remote_json::parseTimesheet(body.at("data"), m_zone);
}

std::vector<RemoteTimesheetData> HttpRemoteApi::fetchTimesheetsByDateRange(const QDate &from, const QDate &to)
{
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("start_date"), from.toString(Qt::ISODate));
    query.addQueryItem(QStringLiteral("end_date"), to.toString(Qt::ISODate));
    return remote_json::parseTimesheetList(send("GET", kTimesheetsPath, query), m_zone);
}

int HttpRemoteApi::createTimesheet(const TimesheetPayload &payload)
{
    const nlohmann::json body = send("POST", kTimesheetsPath, payloadQuery(payload));
    if (auto id = remote_json::parseCreatedId(body)) {
        return *id;
    }

    // Older deployments answer without the id: find the record we just made.
    for (const auto &candidate : fetchTimesheetsByDateRange(payload.date, payload.date)) {
        if (candidate.activityId == payload.activityId
            && candidate.description == payload.description
            && (!candidate.projectId || *candidate.projectId == payload.projectId)) {
            return candidate.id;
        }
    }
    throw RemoteUnavailable("timesheet may have been created but could not be fetched back");
}

void HttpRemoteApi::updateTimesheet(int remoteId, const TimesheetPayload &payload)
{
    remote_json::requireSuccess(
        send("PUT", kTimesheetsPath + QStringLiteral("/%1").arg(remoteId), payloadQuery(payload)));
}

void HttpRemoteApi::deleteTimesheet(int remoteId)
{
    remote_json::requireSuccess(
        send("DELETE", kTimesheetsPath + QStringLiteral("/%1").arg(remoteId), QUrlQuery()));
}

} // namespace worklog
