#pragma once

#include <memory>

#include <QByteArray>
#include <QString>
#include <QTimeZone>
#include <QUrlQuery>

#include <nlohmann/json.hpp>

#include "remote/remote_api.hpp"

class QNetworkAccessManager;

namespace worklog {

class Config;

// HttpRemoteApi talks to the remote REST API with QNetworkAccessManager.
// Calls are synchronous: each request spins a local event loop bounded by a
// timeout, so a QCoreApplication must exist.
class HttpRemoteApi : public RemoteApi {
public:
    HttpRemoteApi(const QString &baseUri, const QString &token, const QTimeZone &zone, int timeoutMs);
    ~HttpRemoteApi() override;

    // Reads remote.baseUri, remote.token, remote.timeoutMs and timesheet.timezone.
    static std::unique_ptr<HttpRemoteApi> fromConfig(const Config &config);

    std::vector<RemoteProjectData> fetchProjectsAll() override;
    User fetchUserById(int id) override;
    RemoteTimesheetData fetchTimesheetById(int remoteId) override;
    std::vector<RemoteTimesheetData> fetchTimesheetsByDateRange(const QDate &from,
                                                                const QDate &to) override;
    int createTimesheet(const TimesheetPayload &payload) override;
    void updateTimesheet(int remoteId, const TimesheetPayload &payload) override;
    void deleteTimesheet(int remoteId) override;

private:
    QString m_baseUri;
    QString m_token;
    QTimeZone m_zone;
    int m_timeoutMs = 10000;
    std::unique_ptr<QNetworkAccessManager> m_network;

    nlohmann::json send(const QByteArray &verb, const QString &path, const QUrlQuery &query);
};

} // namespace worklog
