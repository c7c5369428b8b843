#pragma once

#include <QString>
#include <QStringList>

#include "common/time_utils.hpp"

namespace worklog {

class RemoteApi;

class WorklogCli
{
public:
    WorklogCli();
    // api replaces the HTTP client built from the config; it is not owned.
    WorklogCli(RemoteApi *api, Clock clock);

    // returns exit code
    int run(int argc, char *argv[]);

private:
    // Repositories and services wired for one invocation.
    struct Session;

    RemoteApi *m_api = nullptr;
    Clock m_clock;

    int dispatch(Session &session, const QStringList &args);

    int runStart(Session &session, const QStringList &args);
    int runStop(Session &session, const QStringList &args);
    int runCancel(Session &session);
    int runRestart(Session &session, const QStringList &args);
    int runStatus(Session &session);
    int runAdd(Session &session, const QStringList &args);
    int runFrames(Session &session, const QStringList &args);
    int runEdit(Session &session, const QStringList &args);
    int runRemove(Session &session, const QStringList &args);

    int runProjects(Session &session, const QStringList &args);
    int runProject(Session &session, const QStringList &args);
    int runActivities(Session &session, const QStringList &args);
    int runActivity(Session &session, const QStringList &args);
    int runRoles(Session &session);
    int runRefresh(Session &session);

    // Subcommands: list, from-frames, push, pull, delete, merge.
    int runTimesheet(Session &session, const QStringList &args);
    int runConfig(Session &session, const QStringList &args);
};

} // namespace worklog
