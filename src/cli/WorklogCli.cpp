#include "cli/WorklogCli.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/string_utils.hpp"
#include "core/activity_repository.hpp"
#include "core/frame_repository.hpp"
#include "core/local_activity_repository.hpp"
#include "core/local_project_repository.hpp"
#include "core/project_repository.hpp"
#include "core/remote_activity_repository.hpp"
#include "core/remote_project_repository.hpp"
#include "core/track.hpp"
#include "core/user_repository.hpp"
#include "remote/http_remote_api.hpp"
#include "remote/remote_cache.hpp"
#include "timesheet/local_timesheet_repository.hpp"
#include "timesheet/remote_timesheet_repository.hpp"
#include "timesheet/timesheet_factory.hpp"
#include "timesheet/timesheet_sync_service.hpp"

namespace worklog {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  worklog start ACTIVITY [--desc TEXT] [--at TIME] [--no-gap] [--individual] [--role ROLE]\n"
        "  worklog stop [--at TIME]\n"
        "  worklog cancel\n"
        "  worklog restart [FRAME|-N] [--at TIME] [--no-gap]\n"
        "  worklog status\n"
        "  worklog add ACTIVITY --from TIME --to TIME [--desc TEXT] [--individual] [--role ROLE]\n"
        "  worklog frames [--from TIME] [--to TIME] [--project ID] [--issue KEY] [--current]\n"
        "  worklog edit FRAME|-N [--desc TEXT] [--start TIME] [--stop TIME]\n"
        "  worklog remove FRAME|-N\n"
        "  worklog projects [--all] [--search TEXT]\n"
        "  worklog project create NAME [--desc TEXT] [--status N]\n"
        "  worklog project delete KEY [--force]\n"
        "  worklog activities [--all] [--search TEXT]\n"
        "  worklog activity create NAME --project KEY [--desc TEXT] [--alias ALIAS]\n"
        "  worklog activity delete KEY [--force]\n"
        "  worklog roles\n"
        "  worklog refresh\n"
        "  worklog timesheet list [--from DATE] [--to DATE]\n"
        "  worklog timesheet create ACTIVITY --time HOURS --desc TEXT [--date DATE] [--client-desc TEXT]\n"
        "                           [--individual] [--role ROLE]\n"
        "  worklog timesheet edit UUID [--activity ACTIVITY] [--desc TEXT] [--client-desc TEXT] [--time HOURS]\n"
        "                         [--date DATE] [--individual|--no-individual] [--role ROLE] [--no-sync|--sync]\n"
        "  worklog timesheet from-frames [--date DATE] [--dry-run]\n"
        "  worklog timesheet push [UUID...] [--from DATE] [--to DATE]\n"
        "  worklog timesheet pull [--from DATE] [--to DATE] [--force]\n"
        "  worklog timesheet delete UUID\n"
        "  worklog timesheet merge UUID UUID...\n"
        "  worklog config get KEY | set KEY VALUE | unset KEY | list\n"
        "Global flags: --yes answers confirmations, --trace enables debug logs.\n");
}

const QStringList &valueOptions()
{
    static const QStringList options{
        QStringLiteral("--desc"),   QStringLiteral("--at"),     QStringLiteral("--role"),
        QStringLiteral("--from"),   QStringLiteral("--to"),     QStringLiteral("--project"),
        QStringLiteral("--issue"),  QStringLiteral("--start"),  QStringLiteral("--stop"),
        QStringLiteral("--status"), QStringLiteral("--search"), QStringLiteral("--alias"),
        QStringLiteral("--date"),   QStringLiteral("--time"),   QStringLiteral("--client-desc"),
        QStringLiteral("--activity"),
    };
    return options;
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QStringList getArgValues(const QStringList &args, const QString &key)
{
    QStringList values;
    for (int i = 0; i + 1 < args.size(); ++i) {
        if (args.at(i) == key) {
            values.push_back(args.at(i + 1));
        }
    }
    return values;
}

bool hasFlag(const QStringList &args, const QString &flag)
{
    return args.contains(flag);
}

// Arguments after the command words that are neither flags nor flag values.
QStringList positionals(const QStringList &args, int skip)
{
    QStringList result;
    for (int i = skip; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (arg.startsWith(QStringLiteral("--"))) {
            if (valueOptions().contains(arg)) {
                ++i;
            }
            continue;
        }
        result.push_back(arg);
    }
    return result;
}

std::string text(const QString &value)
{
    return value.toStdString();
}

std::string hours(double value)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << value;
    return out.str();
}

double parseHours(const QString &value)
{
    bool ok = false;
    const double hours = value.toDouble(&ok);
    if (!ok) {
        throw InvalidOperation("cannot read hours '" + text(value) + "', expected e.g. 1.25");
    }
    return hours;
}

std::optional<std::string> optionalText(const QStringList &args, const QString &key)
{
    if (!hasFlag(args, key)) {
        return std::nullopt;
    }
    return text(getArgValue(args, key));
}

std::string roleLabel(const RoleAssignment &role)
{
    const Role *assigned = role.role();
    if (!assigned) {
        return "individual";
    }
    return assigned->name.empty() ? "role " + std::to_string(assigned->id) : assigned->name;
}

void printFrame(const Frame &frame, Timestamp now)
{
    std::cout << frame.uuid << "  " << text(formatLocal(frame.start)) << " -> "
              << (frame.stop ? text(formatLocal(*frame.stop)) : std::string("running")) << "  "
              << text(formatDuration(frame.duration(now))) << "  " << frame.activity.name
              << " [" << frame.activity.key.toString() << "]";
    if (!frame.description.empty()) {
        std::cout << "  " << frame.description;
    }
    std::cout << "\n";
}

void printTimesheet(const Timesheet &timesheet)
{
    std::cout << timesheet.uuid << "  " << text(timesheet.date.toString(Qt::ISODate)) << "  "
              << hours(timesheet.time) << "h  " << timesheet.activity.name << "  "
              << roleLabel(timesheet.role) << "  "
              << (timesheet.remoteId ? "#" + std::to_string(*timesheet.remoteId) : std::string("unsynced"))
              << (timesheet.doNotSync ? "  (do not sync)" : "") << "  " << timesheet.description << "\n";
}

// Builds the HTTP client on first use so commands that never reach the
// remote system work without remote settings.
class LazyRemoteApi : public RemoteApi
{
public:
    explicit LazyRemoteApi(const Config &config)
        : m_config(config)
    {
    }

    std::vector<RemoteProjectData> fetchProjectsAll() override { return api().fetchProjectsAll(); }
    User fetchUserById(int id) override { return api().fetchUserById(id); }
    RemoteTimesheetData fetchTimesheetById(int remoteId) override { return api().fetchTimesheetById(remoteId); }
    std::vector<RemoteTimesheetData> fetchTimesheetsByDateRange(const QDate &from, const QDate &to) override
    {
        return api().fetchTimesheetsByDateRange(from, to);
    }
    int createTimesheet(const TimesheetPayload &payload) override { return api().createTimesheet(payload); }
    void updateTimesheet(int remoteId, const TimesheetPayload &payload) override
    {
        api().updateTimesheet(remoteId, payload);
    }
    void deleteTimesheet(int remoteId) override { api().deleteTimesheet(remoteId); }

private:
    const Config &m_config;
    std::unique_ptr<HttpRemoteApi> m_api;

    RemoteApi &api()
    {
        if (!m_api) {
            m_api = HttpRemoteApi::fromConfig(m_config);
        }
        return *m_api;
    }
};

} // namespace

struct WorklogCli::Session {
    Session(RemoteApi *api, Clock sessionClock, bool yes)
        : clock(std::move(sessionClock))
        , assumeYes(yes)
        , lazyApi(config)
        , remoteApi(api ? *api : lazyApi)
        , frames(clock)
        , remoteProjects(remoteApi, remoteCache)
        , projects(localProjects, remoteProjects)
        , localActivities(localProjects, &frames)
        , remoteActivities(remoteProjects)
        , activities(localActivities, remoteActivities)
        , users(remoteApi, remoteCache, config)
        , track(frames, [this]() { return users.defaultRole(); }, clock)
        , remoteTimesheets(remoteApi, activities, [this]() { return users.currentUserRoles(); }, clock)
        , sync(localTimesheets, remoteTimesheets)
    {
    }

    Clock clock;
    bool assumeYes = false;
    Config config;
    LazyRemoteApi lazyApi;
    RemoteApi &remoteApi;
    FrameRepository frames;
    LocalProjectRepository localProjects;
    RemoteCache remoteCache;
    RemoteProjectRepository remoteProjects;
    ProjectRepository projects;
    LocalActivityRepository localActivities;
    RemoteActivityRepository remoteActivities;
    ActivityRepository activities;
    UserRepository users;
    Track track;
    LocalTimesheetRepository localTimesheets;
    RemoteTimesheetRepository remoteTimesheets;
    TimesheetSyncService sync;

    Timestamp now() const { return clock(); }

    ConfirmCallback confirm() const
    {
        const bool yes = assumeYes;
        return [yes](const std::string &question) {
            std::cout << question << (yes ? " yes\n" : " no (pass --yes to accept)\n");
            return yes;
        };
    }

    Timestamp parseTime(const QString &value) const
    {
        const auto parsed = parseUserTime(value, now());
        if (!parsed) {
            throw InvalidTime("cannot read time '" + text(value) + "'");
        }
        return *parsed;
    }

    std::optional<Timestamp> optionalTime(const QStringList &args, const QString &key) const
    {
        const QString value = getArgValue(args, key);
        if (value.isEmpty()) {
            return std::nullopt;
        }
        return parseTime(value);
    }

    QDate today() const { return dateInZone(now(), config.timesheetZone()); }

    QDate parseDate(const QString &value) const
    {
        if (value.isEmpty() || value == QStringLiteral("today")) {
            return today();
        }
        if (value == QStringLiteral("yesterday")) {
            return today().addDays(-1);
        }
        const auto parsed = parseIsoDate(value);
        if (!parsed) {
            throw InvalidTime("cannot read date '" + text(value) + "', expected yyyy-MM-dd");
        }
        return *parsed;
    }

    Activity resolveActivity(const QString &value) const
    {
        const std::string wanted = text(value);
        if (const auto key = EntityKey::tryParse(wanted)) {
            if (auto activity = activities.get(*key)) {
                return *activity;
            }
        }
        if (auto activity = activities.getByAlias(wanted)) {
            return *activity;
        }
        const auto matches = activities.searchByNameOrAlias(wanted);
        if (matches.empty()) {
            throw NotFound("no activity matches '" + wanted + "'");
        }
        if (matches.size() > 1) {
            std::vector<std::string> names;
            for (const auto &activity : matches) {
                names.push_back(activity.name + " [" + activity.key.toString() + "]");
            }
            throw InvalidOperation("'" + wanted + "' matches several activities: " + join(names, ", "));
        }
        return matches.front();
    }

    std::optional<Role> resolveRole(const QStringList &args)
    {
        const QString value = getArgValue(args, QStringLiteral("--role"));
        if (value.isEmpty()) {
            return std::nullopt;
        }
        bool numeric = false;
        const int id = value.toInt(&numeric);
        const auto role = numeric ? users.findRoleById(id) : users.findRoleByName(text(value));
        if (!role) {
            throw NotFound("no role of the current user matches '" + text(value) + "'");
        }
        return role;
    }

    // A frame uuid, or -N for the N-th most recent closed frame.
    Frame resolveFrame(const QString &value) const
    {
        bool numeric = false;
        const int index = value.toInt(&numeric);
        if (numeric && index < 0) {
            const auto all = frames.all();
            const auto offset = static_cast<std::size_t>(-index);
            if (offset > all.size()) {
                throw NotFound("there is no frame at index " + text(value));
            }
            return all.at(all.size() - offset);
        }
        if (auto frame = frames.get(text(value))) {
            return *frame;
        }
        throw NotFound("frame " + text(value) + " not found");
    }

    EntityKey parseKey(const QString &value) const
    {
        const auto key = EntityKey::tryParse(text(value));
        if (!key) {
            throw NotFound("'" + text(value) + "' is not a project or activity key");
        }
        return *key;
    }

    void deleteFramesOf(const Activity &activity)
    {
        for (const auto &frame : localActivities.frames(activity.key)) {
            frames.remove(frame.uuid);
        }
    }
};

WorklogCli::WorklogCli()
    : WorklogCli(nullptr, systemClock())
{
}

WorklogCli::WorklogCli(RemoteApi *api, Clock clock)
    : m_api(api)
    , m_clock(std::move(clock))
{
}

int WorklogCli::run(int argc, char *argv[])
{
    // CLI entry: parse the command and delegate to its handler.
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    logging::CorrelationScope scope(logging::newCorrelationId());
    WLOG_INFO(QStringLiteral("WorklogCli"),
              QStringLiteral("run"),
              QStringLiteral("cli_command"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              logging::defaultWho(),
              logging::currentCorrelationId(),
              (nlohmann::json{{"command", command.toStdString()}, {"args", args.size()}}));

    try {
        Session session(m_api, m_clock, hasFlag(args, QStringLiteral("--yes")));
        return dispatch(session, args);
    } catch (const WorklogError &ex) {
        WLOG_ERROR(QStringLiteral("WorklogCli"),
                   QStringLiteral("run"),
                   QStringLiteral("cli_command_failed"),
                   QString::fromUtf8(ex.kind()),
                   QStringLiteral("exit_code_1"),
                   logging::defaultWho(),
                   logging::currentCorrelationId(),
                   logging::errorContext(ex, nlohmann::json{{"command", command.toStdString()}}));
        std::cerr << "Error (" << ex.kind() << "): " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception &ex) {
        WLOG_ERROR(QStringLiteral("WorklogCli"),
                   QStringLiteral("run"),
                   QStringLiteral("cli_command_crashed"),
                   QStringLiteral("unexpected_exception"),
                   QStringLiteral("exit_code_1"),
                   logging::defaultWho(),
                   logging::currentCorrelationId(),
                   logging::errorContext(ex, nlohmann::json{{"command", command.toStdString()}}));
        std::cerr << "Error (Unexpected): " << ex.what() << std::endl;
        return 1;
    }
}

int WorklogCli::dispatch(Session &session, const QStringList &args)
{
    const QString command = args.at(1);
    if (command == QStringLiteral("start")) {
        return runStart(session, args);
    }
    if (command == QStringLiteral("stop")) {
        return runStop(session, args);
    }
    if (command == QStringLiteral("cancel")) {
        return runCancel(session);
    }
    if (command == QStringLiteral("restart")) {
        return runRestart(session, args);
    }
    if (command == QStringLiteral("status")) {
        return runStatus(session);
    }
    if (command == QStringLiteral("add")) {
        return runAdd(session, args);
    }
    if (command == QStringLiteral("frames")) {
        return runFrames(session, args);
    }
    if (command == QStringLiteral("edit")) {
        return runEdit(session, args);
    }
    if (command == QStringLiteral("remove")) {
        return runRemove(session, args);
    }
    if (command == QStringLiteral("projects")) {
        return runProjects(session, args);
    }
    if (command == QStringLiteral("project")) {
        return runProject(session, args);
    }
    if (command == QStringLiteral("activities")) {
        return runActivities(session, args);
    }
    if (command == QStringLiteral("activity")) {
        return runActivity(session, args);
    }
    if (command == QStringLiteral("roles")) {
        return runRoles(session);
    }
    if (command == QStringLiteral("refresh")) {
        return runRefresh(session);
    }
    if (command == QStringLiteral("timesheet")) {
        return runTimesheet(session, args);
    }
    if (command == QStringLiteral("config")) {
        return runConfig(session, args);
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int WorklogCli::runStart(Session &session, const QStringList &args)
{
    const QStringList rest = positionals(args, 2);
    if (rest.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const Activity activity = session.resolveActivity(rest.at(0));
    const bool individual = hasFlag(args, QStringLiteral("--individual"));
    const Frame frame = session.track.start(activity,
                                            text(getArgValue(args, QStringLiteral("--desc"))),
                                            session.optionalTime(args, QStringLiteral("--at")),
                                            !hasFlag(args, QStringLiteral("--no-gap")),
                                            individual,
                                            individual ? std::nullopt : session.resolveRole(args));

    std::cout << "Started " << frame.activity.name << " at " << text(formatLocal(frame.start))
              << " (" << roleLabel(frame.role) << ", " << frame.uuid << ")\n";
    return 0;
}

int WorklogCli::runStop(Session &session, const QStringList &args)
{
    const Frame frame = session.track.stop(session.optionalTime(args, QStringLiteral("--at")));
    std::cout << "Stopped " << frame.activity.name << " at " << text(formatLocal(*frame.stop)) << " after "
              << text(formatDuration(frame.duration(session.now()))) << " (" << frame.uuid << ")\n";
    return 0;
}

int WorklogCli::runCancel(Session &session)
{
    const Frame frame = session.track.cancel();
    std::cout << "Cancelled " << frame.activity.name << " started at " << text(formatLocal(frame.start)) << "\n";
    return 0;
}

int WorklogCli::runRestart(Session &session, const QStringList &args)
{
    const QStringList rest = positionals(args, 2);
    std::optional<Frame> source;
    if (rest.isEmpty()) {
        source = session.track.lastFrame();
        if (!source) {
            throw NotFound("there is no frame to restart");
        }
    } else {
        source = session.resolveFrame(rest.at(0));
    }

    const Frame frame = session.track.restart(*source,
                                              session.optionalTime(args, QStringLiteral("--at")),
                                              !hasFlag(args, QStringLiteral("--no-gap")));
    std::cout << "Restarted " << frame.activity.name << " at " << text(formatLocal(frame.start)) << " ("
              << frame.uuid << ")\n";
    return 0;
}

int WorklogCli::runStatus(Session &session)
{
    const auto current = session.track.getCurrent();
    if (!current) {
        std::cout << "No frame started.\n";
        return 0;
    }
    std::cout << "Tracking " << current->activity.name << " since " << text(formatLocal(current->start)) << " ("
              << text(formatDuration(current->duration(session.now()))) << ", " << roleLabel(current->role)
              << ")";
    if (!current->description.empty()) {
        std::cout << ": " << current->description;
    }
    std::cout << "\n";
    return 0;
}

int WorklogCli::runAdd(Session &session, const QStringList &args)
{
    const QStringList rest = positionals(args, 2);
    const QString from = getArgValue(args, QStringLiteral("--from"));
    const QString to = getArgValue(args, QStringLiteral("--to"));
    if (rest.isEmpty() || from.isEmpty() || to.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const Activity activity = session.resolveActivity(rest.at(0));
    const bool individual = hasFlag(args, QStringLiteral("--individual"));
    const Frame frame = session.track.add(activity,
                                          session.parseTime(from),
                                          session.parseTime(to),
                                          text(getArgValue(args, QStringLiteral("--desc"))),
                                          individual,
                                          individual ? std::nullopt : session.resolveRole(args));
    std::cout << "Added ";
    printFrame(frame, session.now());
    return 0;
}

int WorklogCli::runFrames(Session &session, const QStringList &args)
{
    FrameFilter filter;
    filter.from = session.optionalTime(args, QStringLiteral("--from"));
    filter.to = session.optionalTime(args, QStringLiteral("--to"));
    filter.includePartial = true;
    filter.includeCurrent = hasFlag(args, QStringLiteral("--current"));
    for (const QString &project : getArgValues(args, QStringLiteral("--project"))) {
        bool ok = false;
        const int id = project.toInt(&ok);
        if (!ok) {
            throw InvalidOperation("--project takes a remote project id, got '" + text(project) + "'");
        }
        filter.projectIds.push_back(id);
    }
    for (const QString &issue : getArgValues(args, QStringLiteral("--issue"))) {
        filter.issueKeys.push_back(text(issue));
    }

    const auto frames = session.frames.filter(filter);
    if (frames.empty()) {
        std::cout << "No frames.\n";
        return 0;
    }
    std::chrono::seconds total{0};
    for (const auto &frame : frames) {
        printFrame(frame, session.now());
        total += frame.duration(session.now());
    }
    std::cout << frames.size() << " frame(s), " << text(formatDuration(total)) << "\n";
    return 0;
}

int WorklogCli::runEdit(Session &session, const QStringList &args)
{
    const QStringList rest = positionals(args, 2);
    if (rest.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const Frame frame = session.resolveFrame(rest.at(0));
    const Timestamp now = session.now();
    const Timestamp start = session.optionalTime(args, QStringLiteral("--start")).value_or(frame.start);
    std::optional<Timestamp> stop = frame.stop;
    if (auto value = session.optionalTime(args, QStringLiteral("--stop"))) {
        stop = value;
    }
    const std::string description = hasFlag(args, QStringLiteral("--desc"))
        ? text(getArgValue(args, QStringLiteral("--desc")))
        : frame.description;

    if (start > now || (stop && *stop > now)) {
        throw InvalidTime("frame " + frame.uuid + " cannot be moved into the future");
    }

    const Frame edited = makeFrame(frame.uuid, start, stop, frame.activity, description, frame.role, now);
    session.frames.update(edited);
    std::cout << "Updated ";
    printFrame(edited, now);
    return 0;
}

int WorklogCli::runRemove(Session &session, const QStringList &args)
{
    const QStringList rest = positionals(args, 2);
    if (rest.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const Frame frame = session.resolveFrame(rest.at(0));
    if (!session.confirm()("Remove frame " + frame.uuid + " (" + frame.activity.name + ")?")) {
        std::cout << "Frame kept.\n";
        return 0;
    }
    session.frames.remove(frame.uuid);
    std::cout << "Removed frame " << frame.uuid << "\n";
    return 0;
}

int WorklogCli::runProjects(Session &session, const QStringList &args)
{
    const QString search = getArgValue(args, QStringLiteral("--search"));
    const auto projects = search.isEmpty()
        ? session.projects.all(hasFlag(args, QStringLiteral("--all")) ? ProjectStatuses() : activeStatuses())
        : session.projects.getByNameLike(text(search));

    if (projects.empty()) {
        std::cout << "No projects.\n";
        return 0;
    }
    for (const auto &project : projects) {
        std::cout << std::left << std::setw(10) << project.key.toString() << " " << project.name
                  << "  (status " << project.status << ", " << project.activities.size() << " activities)\n";
    }
    return 0;
}

int WorklogCli::runProject(Session &session, const QStringList &args)
{
    const QStringList rest = positionals(args, 2);
    if (rest.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString action = rest.at(0);
    if (action == QStringLiteral("create")) {
        int status = static_cast<int>(ProjectStatus::Active);
        const QString statusValue = getArgValue(args, QStringLiteral("--status"));
        if (!statusValue.isEmpty()) {
            bool ok = false;
            status = statusValue.toInt(&ok);
            if (!ok) {
                throw InvalidOperation("--status takes 0, 1 or 2");
            }
        }
        const Project project = session.projects.create(text(rest.at(1)),
                                                        text(getArgValue(args, QStringLiteral("--desc"))),
                                                        status);
        std::cout << "Created project " << project.name << " (" << project.key.toString() << ")\n";
        return 0;
    }
    if (action == QStringLiteral("delete")) {
        const EntityKey key = session.parseKey(rest.at(1));
        if (hasFlag(args, QStringLiteral("--force"))) {
            session.projects.forceDelete(
                key,
                [&session](const Activity &activity) { session.localActivities.remove(activity.key, true); },
                [&session](const Activity &activity) { session.deleteFramesOf(activity); });
        } else {
            session.projects.remove(key);
        }
        std::cout << "Deleted project " << key.toString() << "\n";
        return 0;
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int WorklogCli::runActivities(Session &session, const QStringList &args)
{
    const bool activeOnly = !hasFlag(args, QStringLiteral("--all"));
    const QString search = getArgValue(args, QStringLiteral("--search"));
    const auto activities = search.isEmpty() ? session.activities.all(activeOnly)
                                             : session.activities.searchByNameOrAlias(text(search), activeOnly);

    if (activities.empty()) {
        std::cout << "No activities.\n";
        return 0;
    }
    for (const auto &activity : activities) {
        std::cout << std::left << std::setw(10) << activity.key.toString() << " " << activity.name;
        if (activity.alias) {
            std::cout << "  @" << *activity.alias;
        }
        std::cout << "  (project " << activity.projectKey.toString() << ")\n";
    }
    return 0;
}

int WorklogCli::runActivity(Session &session, const QStringList &args)
{
    const QStringList rest = positionals(args, 2);
    if (rest.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString action = rest.at(0);
    if (action == QStringLiteral("create")) {
        const QString project = getArgValue(args, QStringLiteral("--project"));
        if (project.isEmpty()) {
            std::cerr << usageText().toStdString();
            return 1;
        }
        const QString alias = getArgValue(args, QStringLiteral("--alias"));
        const Activity activity = session.activities.create(
            text(rest.at(1)),
            text(getArgValue(args, QStringLiteral("--desc"))),
            session.parseKey(project),
            alias.isEmpty() ? std::nullopt : std::optional<std::string>(text(alias)));
        std::cout << "Created activity " << activity.name << " (" << activity.key.toString() << ")\n";
        return 0;
    }
    if (action == QStringLiteral("delete")) {
        const EntityKey key = session.parseKey(rest.at(1));
        if (hasFlag(args, QStringLiteral("--force"))) {
            session.activities.forceDelete(key, [&session](const Frame &frame) { session.frames.remove(frame.uuid); });
        } else {
            session.activities.remove(key);
        }
        std::cout << "Deleted activity " << key.toString() << "\n";
        return 0;
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int WorklogCli::runRoles(Session &session)
{
    const auto defaultRole = session.users.defaultRole();
    for (const auto &role : session.users.currentUserRoles()) {
        const bool isDefault = defaultRole && defaultRole->id == role.id;
        std::cout << (isDefault ? "* " : "  ") << std::left << std::setw(8) << role.id << " " << role.name;
        if (!role.fullName.empty() && role.fullName != role.name) {
            std::cout << "  (" << role.fullName << ")";
        }
        std::cout << "\n";
    }
    return 0;
}

int WorklogCli::runRefresh(Session &session)
{
    session.projects.refresh();
    session.users.refresh();
    std::cout << "Refreshed " << session.remoteProjects.all(ProjectStatuses()).size() << " remote projects.\n";
    return 0;
}

int WorklogCli::runTimesheet(Session &session, const QStringList &args)
{
    const QStringList rest = positionals(args, 2);
    if (rest.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const QString action = rest.at(0);
    const QString fromValue = getArgValue(args, QStringLiteral("--from"));
    const QString toValue = getArgValue(args, QStringLiteral("--to"));

    if (action == QStringLiteral("list")) {
        const QDate from = session.parseDate(fromValue);
        const QDate to = toValue.isEmpty() ? from : session.parseDate(toValue);
        const auto timesheets = session.localTimesheets.getByDateRange(from, to);
        double total = 0.0;
        for (const auto &timesheet : timesheets) {
            printTimesheet(timesheet);
            total += timesheet.time;
        }
        std::cout << timesheets.size() << " timesheet(s), " << hours(total) << "h\n";
        return 0;
    }

    if (action == QStringLiteral("create")) {
        const QString time = getArgValue(args, QStringLiteral("--time"));
        if (rest.size() < 2 || time.isEmpty()) {
            std::cerr << usageText().toStdString();
            return 1;
        }
        const std::string description = text(getArgValue(args, QStringLiteral("--desc")));
        if (trim(description).empty()) {
            throw InvalidOperation("timesheet description cannot be empty; pass --desc");
        }
        const bool individual = hasFlag(args, QStringLiteral("--individual"));
        std::optional<Role> role = session.resolveRole(args);
        if (individual && role) {
            throw InvalidOperation("--role cannot be combined with --individual");
        }
        if (!individual && !role) {
            role = session.users.defaultRole();
            if (!role) {
                throw InvalidOperation("no role given and no default role found; pass --role or --individual");
            }
        }
        const std::string clientDescription = text(getArgValue(args, QStringLiteral("--client-desc")));

        const Timesheet timesheet = makeTimesheet(
            session.resolveActivity(rest.at(1)),
            description,
            trim(clientDescription).empty() ? std::nullopt : std::optional<std::string>(clientDescription),
            parseHours(time),
            session.parseDate(getArgValue(args, QStringLiteral("--date"))),
            role ? RoleAssignment::of(*role) : RoleAssignment::individual(),
            {},
            std::nullopt,
            session.now());
        session.localTimesheets.save(timesheet);
        std::cout << "Created ";
        printTimesheet(timesheet);
        return 0;
    }

    if (action == QStringLiteral("edit")) {
        if (rest.size() < 2) {
            std::cerr << usageText().toStdString();
            return 1;
        }
        const auto timesheet = session.localTimesheets.get(text(rest.at(1)));
        if (!timesheet) {
            throw NotFound("timesheet " + text(rest.at(1)) + " not found");
        }

        TimesheetEdit edit;
        const QString activity = getArgValue(args, QStringLiteral("--activity"));
        if (!activity.isEmpty()) {
            edit.activity = session.resolveActivity(activity);
        }
        edit.description = optionalText(args, QStringLiteral("--desc"));
        edit.clientDescription = optionalText(args, QStringLiteral("--client-desc"));
        const QString time = getArgValue(args, QStringLiteral("--time"));
        if (!time.isEmpty()) {
            edit.time = parseHours(time);
        }
        const QString date = getArgValue(args, QStringLiteral("--date"));
        if (!date.isEmpty()) {
            edit.date = session.parseDate(date);
        }
        if (hasFlag(args, QStringLiteral("--individual"))) {
            edit.individual = true;
        } else if (hasFlag(args, QStringLiteral("--no-individual"))) {
            edit.individual = false;
        }
        edit.role = session.resolveRole(args);
        if (hasFlag(args, QStringLiteral("--no-sync"))) {
            edit.doNotSync = true;
        } else if (hasFlag(args, QStringLiteral("--sync"))) {
            edit.doNotSync = false;
        }

        const Timesheet edited = applyEdit(*timesheet, edit, session.now());
        session.localTimesheets.update(edited);
        std::cout << "Updated ";
        printTimesheet(edited);
        return 0;
    }

    if (action == QStringLiteral("from-frames")) {
        const QDate date = session.parseDate(getArgValue(args, QStringLiteral("--date")));
        const QTimeZone zone = session.config.timesheetZone();
        FrameFilter filter;
        filter.from = startOfDay(date, zone);
        filter.to = startOfDay(date.addDays(1), zone) - std::chrono::seconds(1);
        filter.includePartial = true;

        const bool dryRun = hasFlag(args, QStringLiteral("--dry-run"));
        const TimesheetFactory factory(zone, session.clock);
        const FromFramesResult result =
            factory.fromFrames(session.frames.filter(filter), session.localTimesheets.getByDate(date));
        for (const auto &timesheet : result.created) {
            if (!dryRun) {
                session.localTimesheets.save(timesheet);
            }
            std::cout << (dryRun ? "Would create " : "Created ");
            printTimesheet(timesheet);
        }
        for (const auto &timesheet : result.updated) {
            if (!dryRun) {
                session.localTimesheets.update(timesheet);
            }
            std::cout << (dryRun ? "Would add frames to " : "Added frames to ");
            printTimesheet(timesheet);
        }
        for (const auto &timesheet : result.skipped) {
            std::cout << "Already covered by " << timesheet.uuid << "\n";
        }
        return 0;
    }

    if (action == QStringLiteral("push")) {
        PushReport report;
        const QStringList uuids = rest.mid(1);
        if (!uuids.isEmpty()) {
            for (const QString &uuid : uuids) {
                const auto timesheet = session.localTimesheets.get(text(uuid));
                if (!timesheet) {
                    throw NotFound("timesheet " + text(uuid) + " not found");
                }
                if (auto pushed = session.sync.push(*timesheet, session.confirm())) {
                    report.pushed.push_back(std::move(*pushed));
                } else {
                    report.skipped.push_back(timesheet->uuid);
                }
            }
        } else if (!fromValue.isEmpty()) {
            const QDate from = session.parseDate(fromValue);
            report = session.sync.pushRange(from, toValue.isEmpty() ? from : session.parseDate(toValue),
                                            session.confirm());
        } else {
            report = session.sync.pushUnsynced(session.confirm());
        }

        for (const auto &timesheet : report.pushed) {
            std::cout << "Pushed ";
            printTimesheet(timesheet);
        }
        for (const auto &uuid : report.skipped) {
            std::cout << "Skipped " << uuid << "\n";
        }
        for (const auto &failure : report.failures) {
            std::cerr << "Failed " << failure.uuid << " (" << failure.kind << "): " << failure.message << "\n";
        }
        return report.failures.empty() ? 0 : 1;
    }

    if (action == QStringLiteral("pull")) {
        const QDate from = session.parseDate(fromValue);
        const QDate to = toValue.isEmpty() ? from : session.parseDate(toValue);
        const auto written = session.sync.pull(from, to, hasFlag(args, QStringLiteral("--force")), session.confirm());
        for (const auto &timesheet : written) {
            std::cout << "Pulled ";
            printTimesheet(timesheet);
        }
        std::cout << written.size() << " timesheet(s) written\n";
        return 0;
    }

    if (action == QStringLiteral("delete")) {
        if (rest.size() < 2) {
            std::cerr << usageText().toStdString();
            return 1;
        }
        const DeleteOutcome outcome = session.sync.remove(text(rest.at(1)), session.confirm());
        std::cout << "Deleted timesheet " << text(rest.at(1)) << (outcome.remoteDeleted ? " locally and remotely" : " locally")
                  << "\n";
        if (!outcome.warning.empty()) {
            std::cerr << "Warning: " << outcome.warning << "\n";
        }
        return 0;
    }

    if (action == QStringLiteral("merge")) {
        std::vector<std::string> uuids;
        for (const QString &uuid : rest.mid(1)) {
            uuids.push_back(text(uuid));
        }
        const MergeOutcome outcome = session.sync.merge(uuids);
        std::cout << "Merged into ";
        printTimesheet(outcome.merged);
        if (!outcome.syncedRemoteIds.empty()) {
            std::vector<std::string> ids;
            for (const int remoteId : outcome.syncedRemoteIds) {
                ids.push_back("#" + std::to_string(remoteId));
            }
            std::cerr << "Warning: one or more timesheets were synced to the remote system ("
                      << join(ids, ", ") << "). The merged timesheet has lost its sync status; "
                      << "delete those remote records before pushing it.\n";
        }
        return 0;
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int WorklogCli::runConfig(Session &session, const QStringList &args)
{
    const QStringList rest = positionals(args, 2);
    if (rest.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const QString action = rest.at(0);

    if (action == QStringLiteral("list")) {
        std::cout << session.config.all().dump(2) << std::endl;
        return 0;
    }
    if (rest.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    const std::string key = text(rest.at(1));

    if (action == QStringLiteral("get")) {
        const auto value = session.config.get(key);
        if (!value) {
            throw NotFound("config key " + key + " is not set");
        }
        std::cout << (value->is_string() ? value->get<std::string>() : value->dump()) << "\n";
        return 0;
    }
    if (action == QStringLiteral("set") && rest.size() >= 3) {
        const std::string raw = text(rest.at(2));
        // Values that read as JSON keep their type; anything else is a string.
        const nlohmann::json value = nlohmann::json::accept(raw) ? nlohmann::json::parse(raw) : nlohmann::json(raw);
        session.config.set(key, value);
        std::cout << key << " = " << value.dump() << "\n";
        return 0;
    }
    if (action == QStringLiteral("unset")) {
        if (!session.config.unset(key)) {
            throw NotFound("config key " + key + " is not set");
        }
        std::cout << "Unset " << key << "\n";
        return 0;
    }

    std::cerr << usageText().toStdString();
    return 1;
}

} // namespace worklog
