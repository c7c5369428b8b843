#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <memory>

#include "common/errors.hpp"
#include "core/remote_activity_repository.hpp"
#include "core/remote_project_repository.hpp"
#include "remote/remote_cache.hpp"
#include "timesheet/timesheet_sync_service.hpp"
#include "fake_remote_api.hpp"

using namespace worklog;
using namespace worklog::testing;

class TimesheetSyncTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    void testRemoteConversion();
    void testPayload();
    void testPushCreates();
    void testPushRemoteNewerAsks();
    void testPushLocalNotOlder();
    void testPushSkipsAndFailures();
    void testPull();
    void testPullKeepsNewerLocal();
    void testRemove();
    void testMerge();
    void testMergeRejections();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    TestClock m_clock;
    FakeRemoteApi m_api;
    std::vector<Role> m_roles;
    bool m_rolesFail = false;
    std::vector<std::string> m_questions;

    std::unique_ptr<RemoteCache> m_cache;
    std::unique_ptr<RemoteProjectRepository> m_projects;
    std::unique_ptr<RemoteActivityRepository> m_activities;
    std::unique_ptr<LocalTimesheetRepository> m_local;
    std::unique_ptr<RemoteTimesheetRepository> m_remote;
    std::unique_ptr<TimesheetSyncService> m_sync;

    Activity m_dev = remoteActivity(40, 4, "Development", std::string("dev"));
    Activity m_ops = remoteActivity(41, 4, "Operations");

    ConfirmCallback answer(bool yes)
    {
        return [this, yes](const std::string &question) {
            m_questions.push_back(question);
            return yes;
        };
    }

    Timesheet sheet(const std::string &uuid, double time, Timestamp updatedAt,
                    std::optional<int> remoteId = std::nullopt, std::vector<std::string> frames = {}) const
    {
        return makeTimesheet(m_dev, "DEV-1 work", std::nullopt, time, QDate(2024, 3, 6),
                             RoleAssignment::individual(), std::move(frames), remoteId, updatedAt, uuid);
    }
};

void TimesheetSyncTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void TimesheetSyncTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void TimesheetSyncTests::init()
{
    const QString dataDir = m_tempDir.path() + "/.local/share/worklog";
    QFile::remove(dataDir + "/timesheets.json");
    QFile::remove(dataDir + "/cache.db");

    m_clock.now = utc(2024, 3, 6, 18);
    m_api = FakeRemoteApi();
    m_api.clock = m_clock.clock();
    RemoteProjectData project;
    project.id = 4;
    project.name = "Portal";
    project.status = 1;
    project.activities = {RemoteActivityData{40, "Development", "", std::string("dev")},
                          RemoteActivityData{41, "Operations", "", std::nullopt}};
    m_api.projects = {project};

    m_roles = {makeRole(1, "Developer"), makeRole(2, "Lead")};
    m_rolesFail = false;
    m_questions.clear();

    m_cache = std::make_unique<RemoteCache>();
    m_projects = std::make_unique<RemoteProjectRepository>(m_api, *m_cache);
    m_activities = std::make_unique<RemoteActivityRepository>(*m_projects);
    m_local = std::make_unique<LocalTimesheetRepository>();
    RoleLookup roles = [this]() {
        if (m_rolesFail) {
            throw InvalidOperation("no current user configured");
        }
        return m_roles;
    };
    m_remote = std::make_unique<RemoteTimesheetRepository>(m_api, *m_activities, roles, m_clock.clock());
    m_sync = std::make_unique<TimesheetSyncService>(*m_local, *m_remote);
}

void TimesheetSyncTests::cleanup()
{
    m_sync.reset();
    m_remote.reset();
    m_local.reset();
    m_activities.reset();
    m_projects.reset();
    m_cache.reset();
}

void TimesheetSyncTests::testRemoteConversion()
{
    RemoteTimesheetData data;
    data.id = 7;
    data.activityId = 40;
    data.projectId = 4;
    data.date = QDate(2024, 3, 6);
    data.time = 1.5;
    data.description = "ABC-1";
    data.roleId = 2;

    const auto withRole = m_remote->toTimesheet(data);
    QVERIFY(withRole.has_value());
    QCOMPARE(*withRole->remoteId, 7);
    QCOMPARE(withRole->role.role()->name, std::string("Lead"));
    QVERIFY(withRole->updatedAt == m_clock.now);
    QVERIFY(withRole->frameUuids.empty());
    QVERIFY(!withRole->uuid.empty());

    m_rolesFail = true;
    const auto bare = m_remote->toTimesheet(data);
    QCOMPARE(bare->role.roleId().value(), 2);
    QVERIFY(bare->role.role()->name.empty());

    data.individualAction = true;
    QVERIFY(m_remote->toTimesheet(data)->isIndividual());
    data.individualAction = false;
    data.roleId.reset();
    QVERIFY(m_remote->toTimesheet(data)->isIndividual());

    data.time = 0.3;
    QVERIFY(!m_remote->toTimesheet(data).has_value());
    data.time = 1.0;
    data.activityId = 99;
    QVERIFY(!m_remote->toTimesheet(data).has_value());

    QVERIFY(!m_remote->getByRemoteId(12345).has_value());
    QVERIFY_EXCEPTION_THROWN(m_remote->fetch(12345), NotFound);
}

void TimesheetSyncTests::testPayload()
{
    Timesheet timesheet = sheet("aaaa0001", 1.25, m_clock.now);
    timesheet.role = RoleAssignment::of(makeRole(2, "Lead"));
    timesheet.clientDescription = std::string("client text");

    const TimesheetPayload payload = toPayload(timesheet);
    QCOMPARE(payload.projectId, 4);
    QCOMPARE(payload.activityId, 40);
    QCOMPARE(payload.time, 1.25);
    QCOMPARE(payload.roleId.value(), 2);
    QCOMPARE(*payload.clientDescription, std::string("client text"));

    timesheet.activity = localActivity("bbbb0002", "cccc0003", "Hobby");
    QVERIFY_EXCEPTION_THROWN(toPayload(timesheet), InvalidOperation);
}

void TimesheetSyncTests::testPushCreates()
{
    const Timesheet local = sheet("aaaa0001", 1.5, utc(2024, 3, 6, 17), std::nullopt, {"f1", "f2"});
    m_local->save(local);

    const auto pushed = m_sync->push(local, answer(true));
    QVERIFY(pushed.has_value());
    QCOMPARE(m_api.creates, 1);
    QVERIFY(m_questions.empty());
    QCOMPARE(pushed->uuid, local.uuid);
    QCOMPARE(*pushed->remoteId, 1000);
    QVERIFY(pushed->frameUuids == local.frameUuids);
    QVERIFY(pushed->updatedAt == m_clock.now);

    const auto stored = m_local->get("aaaa0001");
    QVERIFY(*stored == *pushed);
    QVERIFY(m_local->getUnsynced().empty());
    QCOMPARE(m_api.timesheets.at(1000).description, std::string("DEV-1 work"));
    QVERIFY(m_api.timesheets.at(1000).individualAction);
}

void TimesheetSyncTests::testPushRemoteNewerAsks()
{
    const int remoteId = m_api.addTimesheet(40, 4, QDate(2024, 3, 6), 1.0, "remote text", utc(2024, 3, 6, 16)).id;
    Timesheet local = sheet("aaaa0001", 2.0, utc(2024, 3, 6, 15), remoteId);
    m_local->save(local);

    QVERIFY(!m_sync->push(local, answer(false)).has_value());
    QCOMPARE(m_questions.size(), std::size_t(1));
    QCOMPARE(m_api.updates, 0);
    QCOMPARE(m_local->get("aaaa0001")->time, 2.0);
    QVERIFY(!m_sync->push(local, ConfirmCallback()).has_value());

    const auto pushed = m_sync->push(local, answer(true));
    QVERIFY(pushed.has_value());
    QCOMPARE(m_api.updates, 1);
    QCOMPARE(m_api.timesheets.at(remoteId).time, 2.0);
    QCOMPARE(pushed->uuid, local.uuid);
    QVERIFY(pushed->updatedAt == m_clock.now);
}

void TimesheetSyncTests::testPushLocalNotOlder()
{
    const int remoteId = m_api.addTimesheet(40, 4, QDate(2024, 3, 6), 1.0, "remote text", utc(2024, 3, 6, 15)).id;

    // Equal timestamps do not count as newer.
    const Timesheet local = sheet("aaaa0001", 2.0, utc(2024, 3, 6, 15), remoteId);
    m_local->save(local);
    QVERIFY(m_sync->push(local, answer(false)).has_value());
    QVERIFY(m_questions.empty());
    QCOMPARE(m_api.updates, 1);

    const Timesheet orphan = sheet("bbbb0002", 1.0, utc(2024, 3, 6, 15), 4242);
    QVERIFY_EXCEPTION_THROWN(m_sync->push(orphan, answer(true)), NotFound);
}

void TimesheetSyncTests::testPushSkipsAndFailures()
{
    m_local->save(sheet("aaaa0001", 1.0, utc(2024, 3, 6, 15)));
    Timesheet excluded = sheet("bbbb0002", 1.0, utc(2024, 3, 6, 15));
    excluded.doNotSync = true;
    m_local->save(excluded);
    m_local->save(sheet("cccc0003", 1.0, utc(2024, 3, 6, 15), 4242));

    QVERIFY(!m_sync->push(excluded, answer(true)).has_value());
    QCOMPARE(m_api.creates, 0);

    const PushReport report = m_sync->pushRange(QDate(2024, 3, 6), std::nullopt, answer(true));
    QCOMPARE(report.pushed.size(), std::size_t(1));
    QCOMPARE(report.pushed.front().uuid, std::string("aaaa0001"));
    QCOMPARE(report.skipped.size(), std::size_t(1));
    QCOMPARE(report.skipped.front(), std::string("bbbb0002"));
    QCOMPARE(report.failures.size(), std::size_t(1));
    QCOMPARE(report.failures.front().uuid, std::string("cccc0003"));
    QCOMPARE(report.failures.front().kind, std::string("NotFound"));

    m_local->save(sheet("dddd0004", 0.5, utc(2024, 3, 6, 15)));
    m_api.failAll = true;
    const PushReport offline = m_sync->pushUnsynced(answer(true));
    QVERIFY(offline.pushed.empty());
    QCOMPARE(offline.failures.size(), std::size_t(1));
    QCOMPARE(offline.failures.front().kind, std::string("RemoteUnavailable"));
}

void TimesheetSyncTests::testPull()
{
    const int fresh = m_api.addTimesheet(40, 4, QDate(2024, 3, 6), 1.0, "fresh", utc(2024, 3, 6, 10)).id;
    const int changed = m_api.addTimesheet(41, 4, QDate(2024, 3, 6), 2.0, "changed", utc(2024, 3, 6, 12), 1).id;
    const int same = m_api.addTimesheet(40, 4, QDate(2024, 3, 6), 0.5, "same", utc(2024, 3, 6, 11)).id;
    m_api.addTimesheet(99, 4, QDate(2024, 3, 6), 1.0, "unknown activity", utc(2024, 3, 6, 10));
    m_api.addTimesheet(40, 4, QDate(2024, 3, 9), 1.0, "outside", utc(2024, 3, 6, 10));

    m_local->save(sheet("aaaa0001", 1.0, utc(2024, 3, 6, 9), changed, {"f1"}));
    m_local->save(sheet("bbbb0002", 1.0, utc(2024, 3, 6, 11), same));

    const auto written = m_sync->pull(QDate(2024, 3, 6), QDate(2024, 3, 7), false, answer(false));
    QCOMPARE(written.size(), std::size_t(3));
    QVERIFY(m_questions.empty());
    QCOMPARE(m_local->all().size(), std::size_t(3));

    const auto created = m_local->getByRemoteId(fresh);
    QVERIFY(created.has_value());
    QCOMPARE(created->description, std::string("fresh"));

    const auto overwritten = m_local->get("aaaa0001");
    QCOMPARE(overwritten->description, std::string("changed"));
    QCOMPARE(overwritten->activity.name, std::string("Operations"));
    QCOMPARE(overwritten->role.roleId().value(), 1);
    QCOMPARE(overwritten->frameUuids.front(), std::string("f1"));
    QCOMPARE(overwritten->time, 2.0);

    QCOMPARE(m_local->get("bbbb0002")->description, std::string("same"));
}

void TimesheetSyncTests::testPullKeepsNewerLocal()
{
    const int remoteId = m_api.addTimesheet(40, 4, QDate(2024, 3, 6), 1.0, "remote", utc(2024, 3, 6, 10)).id;
    m_local->save(sheet("aaaa0001", 2.0, utc(2024, 3, 6, 14), remoteId));

    QVERIFY(m_sync->pull(QDate(2024, 3, 6), std::nullopt, false, answer(false)).empty());
    QCOMPARE(m_questions.size(), std::size_t(1));
    QCOMPARE(m_local->get("aaaa0001")->time, 2.0);

    QCOMPARE(m_sync->pull(QDate(2024, 3, 6), std::nullopt, false, answer(true)).size(), std::size_t(1));
    QCOMPARE(m_local->get("aaaa0001")->time, 1.0);

    m_local->save(sheet("aaaa0001", 2.0, utc(2024, 3, 6, 14), remoteId));
    m_questions.clear();
    QCOMPARE(m_sync->pull(QDate(2024, 3, 6), std::nullopt, true, answer(false)).size(), std::size_t(1));
    QVERIFY(m_questions.empty());
    QCOMPARE(m_local->get("aaaa0001")->description, std::string("remote"));

    m_api.failAll = true;
    QVERIFY_EXCEPTION_THROWN(m_sync->pull(QDate(2024, 3, 6), std::nullopt, false, answer(true)),
                             RemoteUnavailable);
}

void TimesheetSyncTests::testRemove()
{
    QVERIFY_EXCEPTION_THROWN(m_sync->remove("missing", answer(true)), NotFound);

    m_local->save(sheet("aaaa0001", 1.0, utc(2024, 3, 6, 15)));
    DeleteOutcome localOnly = m_sync->remove("aaaa0001", answer(true));
    QVERIFY(!localOnly.remoteAttempted);
    QVERIFY(m_questions.empty());
    QVERIFY(!m_local->get("aaaa0001").has_value());

    const int first = m_api.addTimesheet(40, 4, QDate(2024, 3, 6), 1.0, "a", utc(2024, 3, 6, 10)).id;
    m_local->save(sheet("bbbb0002", 1.0, utc(2024, 3, 6, 15), first));
    const DeleteOutcome both = m_sync->remove("bbbb0002", answer(true));
    QVERIFY(both.remoteDeleted);
    QVERIFY(both.warning.empty());
    QCOMPARE(m_api.deletes, 1);
    QVERIFY(m_api.timesheets.find(first) == m_api.timesheets.end());

    const int second = m_api.addTimesheet(40, 4, QDate(2024, 3, 6), 1.0, "b", utc(2024, 3, 6, 10)).id;
    m_local->save(sheet("cccc0003", 1.0, utc(2024, 3, 6, 15), second));
    const DeleteOutcome declined = m_sync->remove("cccc0003", answer(false));
    QVERIFY(declined.remoteAttempted);
    QVERIFY(!declined.remoteDeleted);
    QVERIFY(!declined.warning.empty());
    QVERIFY(!m_local->get("cccc0003").has_value());
    QVERIFY(m_api.timesheets.find(second) != m_api.timesheets.end());

    m_local->save(sheet("dddd0004", 1.0, utc(2024, 3, 6, 15), second));
    m_api.failDelete = true;
    const DeleteOutcome failed = m_sync->remove("dddd0004", answer(true));
    QVERIFY(!failed.remoteDeleted);
    QVERIFY(QString::fromStdString(failed.warning).contains(QStringLiteral("RemoteUnavailable")));
    QVERIFY(!m_local->get("dddd0004").has_value());
}

void TimesheetSyncTests::testMerge()
{
    Timesheet first = sheet("aaaa0001", 0.5, utc(2024, 3, 6, 12), 55, {"f1", "f2"});
    first.clientDescription = std::string("for client");
    Timesheet second = sheet("bbbb0002", 0.75, utc(2024, 3, 6, 9), std::nullopt, {"f2", "f3"});
    second.description = "DEV-2 more";
    second.doNotSync = true;
    Timesheet third = sheet("cccc0003", 1.0, utc(2024, 3, 6, 10));
    third.clientDescription = std::string("  ");
    m_local->save(first);
    m_local->save(second);
    m_local->save(third);

    const MergeOutcome outcome = m_sync->merge({"aaaa0001", "bbbb0002", "cccc0003"});
    const Timesheet &merged = outcome.merged;
    QVERIFY(outcome.syncedRemoteIds == std::vector<int>{55});
    QCOMPARE(merged.uuid, std::string("aaaa0001"));
    QCOMPARE(merged.time, 2.25);
    QCOMPARE(merged.description, std::string("DEV-1 work | DEV-2 more | DEV-1 work"));
    QCOMPARE(*merged.clientDescription, std::string("for client"));
    QCOMPARE(merged.frameUuids.size(), std::size_t(3));
    QVERIFY(!merged.remoteId.has_value());
    QVERIFY(!merged.doNotSync);
    QVERIFY(merged.updatedAt == utc(2024, 3, 6, 9));

    const auto remaining = m_local->all();
    QCOMPARE(remaining.size(), std::size_t(1));
    QVERIFY(remaining.front() == merged);

    // Unsynced inputs report no remote ids.
    m_local->save(sheet("dddd0004", 0.25, utc(2024, 3, 6, 12)));
    m_local->save(sheet("eeee0005", 0.25, utc(2024, 3, 6, 12)));
    QVERIFY(m_sync->merge({"dddd0004", "eeee0005"}).syncedRemoteIds.empty());
}

void TimesheetSyncTests::testMergeRejections()
{
    m_local->save(sheet("aaaa0001", 0.5, utc(2024, 3, 6, 12)));
    m_local->save(sheet("bbbb0002", 0.5, utc(2024, 3, 6, 12)));
    Timesheet other = sheet("cccc0003", 0.5, utc(2024, 3, 6, 12));
    other.activity = m_ops;
    m_local->save(other);
    Timesheet roled = sheet("dddd0004", 0.5, utc(2024, 3, 6, 12));
    roled.role = RoleAssignment::of(makeRole(1, "Developer"));
    m_local->save(roled);

    QVERIFY_EXCEPTION_THROWN(m_sync->merge({"aaaa0001"}), InvalidOperation);
    QVERIFY_EXCEPTION_THROWN(m_sync->merge({"aaaa0001", "aaaa0001"}), InvalidOperation);
    QVERIFY_EXCEPTION_THROWN(m_sync->merge({"aaaa0001", "zzzz9999"}), NotFound);
    QVERIFY_EXCEPTION_THROWN(m_sync->merge({"aaaa0001", "cccc0003"}), InvalidOperation);
    QVERIFY_EXCEPTION_THROWN(m_sync->merge({"aaaa0001", "dddd0004"}), InvalidOperation);
    QCOMPARE(m_local->all().size(), std::size_t(4));
}

QTEST_MAIN(TimesheetSyncTests)
#include "test_timesheet_sync.moc"
