#include <QtTest/QtTest>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/uuid.hpp"
#include "fake_remote_api.hpp"

using namespace worklog;
using namespace worklog::testing;

class ModelsJsonTests : public QObject
{
    Q_OBJECT
private slots:
    void testFrameRoundTrip();
    void testOpenFrameRoundTrip();
    void testFrameRoleConsistency();
    void testIssueKeys();
    void testFrameStopBeforeStart();
    void testTimesheetRoundTrip();
    void testTimesheetValidation();
    void testTimesheetJsonRejects();
    void testUserRoleLookup();
};

void ModelsJsonTests::testFrameRoundTrip()
{
    const Activity activity = remoteActivity(11, 2, "Development", std::string("dev"));
    const Frame frame = makeFrame("a1b2c3d4",
                                  utc(2024, 3, 4, 8),
                                  utc(2024, 3, 4, 9, 30),
                                  activity,
                                  "Fix ABC-12 and ABC-12 then XY-7",
                                  RoleAssignment::of(makeRole(5, "Developer")),
                                  utc(2024, 3, 4, 9, 30));

    const nlohmann::json j = frameToJson(frame);
    QCOMPARE(j.at("isIndividual").get<bool>(), false);
    QCOMPARE(j.at("activity").at("key").at("source").get<std::string>(), std::string("remote"));

    const Frame parsed = frameFromJson(j);
    QVERIFY(parsed == frame);
    QCOMPARE(parsed.issueKeys.size(), std::size_t(2));
    QCOMPARE(parsed.role.roleId().value(), 5);
    QCOMPARE(*parsed.activity.alias, std::string("dev"));
}

void ModelsJsonTests::testOpenFrameRoundTrip()
{
    const Frame frame = makeFrame("0a0b0c0d",
                                  utc(2024, 3, 4, 8),
                                  std::nullopt,
                                  localActivity("feedbeef", "cafebabe", "Reading"),
                                  "",
                                  RoleAssignment::individual(),
                                  utc(2024, 3, 4, 8));
    const nlohmann::json j = frameToJson(frame);
    QVERIFY(j.at("stop").is_null());

    const Frame parsed = frameFromJson(j);
    QVERIFY(parsed.isActive());
    QVERIFY(parsed.isIndividual());
    QVERIFY(parsed.activity.key.isLocal());
    QVERIFY(parsed.duration(utc(2024, 3, 4, 8, 45)) == std::chrono::minutes(45));
}

void ModelsJsonTests::testFrameRoleConsistency()
{
    nlohmann::json j = frameToJson(closedFrame("a1b2c3d4", utc(2024, 1, 1, 8), utc(2024, 1, 1, 9),
                                               remoteActivity(1, 1, "Ops")));
    j["isIndividual"] = false;
    j["role"] = nullptr;
    QVERIFY_EXCEPTION_THROWN(frameFromJson(j), InvalidOperation);

    // An individual flag wins over a stray role.
    j["isIndividual"] = true;
    j["role"] = makeRole(3, "Support");
    QVERIFY(frameFromJson(j).isIndividual());

    nlohmann::json broken = j;
    broken.erase("activity");
    QVERIFY_EXCEPTION_THROWN(frameFromJson(broken), InvalidOperation);
}

void ModelsJsonTests::testIssueKeys()
{
    const auto keys = extractIssueKeys("PROJ-1: review, see AB-22 and PROJ-1; lowercase ab-3 ignored");
    QCOMPARE(keys.size(), std::size_t(2));
    QCOMPARE(keys[0], std::string("PROJ-1"));
    QCOMPARE(keys[1], std::string("AB-22"));
    QVERIFY(extractIssueKeys("no keys here").empty());
}

void ModelsJsonTests::testFrameStopBeforeStart()
{
    QVERIFY_EXCEPTION_THROWN(makeFrame("a1b2c3d4", utc(2024, 1, 1, 9), utc(2024, 1, 1, 8),
                                       remoteActivity(1, 1, "Ops"), "", RoleAssignment::individual(),
                                       utc(2024, 1, 1, 9)),
                             InvalidTime);

    const Frame frame = closedFrame("a1b2c3d4", utc(2024, 1, 1, 8), utc(2024, 1, 1, 9), remoteActivity(1, 1, "Ops"));
    const Frame renamed = withDescription(frame, "DEV-5 notes", utc(2024, 1, 2, 8));
    QCOMPARE(renamed.uuid, frame.uuid);
    QCOMPARE(renamed.issueKeys.size(), std::size_t(1));
    QVERIFY(renamed.updatedAt == utc(2024, 1, 2, 8));
}

void ModelsJsonTests::testTimesheetRoundTrip()
{
    const Timesheet timesheet = makeTimesheet(remoteActivity(11, 2, "Development"),
                                              "Sprint work",
                                              std::string("Client facing"),
                                              1.75,
                                              QDate(2024, 3, 4),
                                              RoleAssignment::of(makeRole(5, "Developer")),
                                              {"a1b2c3d4", "0a0b0c0d"},
                                              77,
                                              utc(2024, 3, 4, 18),
                                              std::string(),
                                              true);
    QVERIFY(isUuid(timesheet.uuid));
    QCOMPARE(timesheet.projectId(), 2);

    const nlohmann::json j = timesheetToJson(timesheet);
    QCOMPARE(j.at("date").get<std::string>(), std::string("2024-03-04"));
    QCOMPARE(j.at("individualAction").get<bool>(), false);
    QCOMPARE(j.at("projectId").get<int>(), 2);

    const Timesheet parsed = timesheetFromJson(j);
    QVERIFY(parsed == timesheet);
    QVERIFY(parsed.isSynced());
    QVERIFY(parsed.doNotSync);
}

void ModelsJsonTests::testTimesheetValidation()
{
    const auto build = [](Activity activity, double time) {
        return makeTimesheet(std::move(activity), "x", std::nullopt, time, QDate(2024, 3, 4),
                             RoleAssignment::individual(), {}, std::nullopt, utc(2024, 3, 4, 8));
    };
    QVERIFY_EXCEPTION_THROWN(build(remoteActivity(1, 1, "Ops"), 0.0), InvalidOperation);
    QVERIFY_EXCEPTION_THROWN(build(remoteActivity(1, 1, "Ops"), -0.25), InvalidOperation);
    QVERIFY_EXCEPTION_THROWN(build(remoteActivity(1, 1, "Ops"), 0.3), InvalidOperation);
    QVERIFY_EXCEPTION_THROWN(build(localActivity("feedbeef", "cafebabe", "Reading"), 1.0), InvalidOperation);
    QCOMPARE(build(remoteActivity(1, 1, "Ops"), 2.25).time, 2.25);

    QVERIFY(isQuarterHourMultiple(0.25));
    QVERIFY(isQuarterHourMultiple(3.0));
    QVERIFY(!isQuarterHourMultiple(0.1));

    Activity mixed = remoteActivity(1, 1, "Ops");
    mixed.projectKey = EntityKey::local("cafebabe");
    QVERIFY_EXCEPTION_THROWN(build(mixed, 1.0), InvalidOperation);
}

void ModelsJsonTests::testTimesheetJsonRejects()
{
    const Timesheet timesheet = makeTimesheet(remoteActivity(1, 1, "Ops"), "x", std::nullopt, 1.0,
                                              QDate(2024, 3, 4), RoleAssignment::individual(), {},
                                              std::nullopt, utc(2024, 3, 4, 8));
    nlohmann::json j = timesheetToJson(timesheet);

    nlohmann::json noRole = j;
    noRole["individualAction"] = false;
    QVERIFY_EXCEPTION_THROWN(timesheetFromJson(noRole), InvalidOperation);

    nlohmann::json badDate = j;
    badDate["date"] = "04.03.2024";
    QVERIFY_EXCEPTION_THROWN(timesheetFromJson(badDate), InvalidOperation);

    nlohmann::json badFrames = j;
    badFrames["frameUuids"] = "a1b2c3d4";
    QVERIFY_EXCEPTION_THROWN(timesheetFromJson(badFrames), InvalidOperation);

    nlohmann::json badKey = j;
    badKey["activity"]["key"]["source"] = "jira";
    QVERIFY_EXCEPTION_THROWN(timesheetFromJson(badKey), InvalidOperation);
}

void ModelsJsonTests::testUserRoleLookup()
{
    User user;
    user.id = 9;
    user.roles = {makeRole(1, "Developer"), makeRole(2, "Project Manager")};

    QVERIFY(user.findRole(2) != nullptr);
    QVERIFY(user.findRole(3) == nullptr);
    QCOMPARE(user.findRoleByName("manager")->id, 2);
    QVERIFY(user.findRoleByName("tester") == nullptr);

    const nlohmann::json j = user.roles.front();
    QCOMPARE(j.get<Role>().name, std::string("Developer"));
    QVERIFY(j.at("parentId").is_null());
}

QTEST_MAIN(ModelsJsonTests)
#include "test_models_and_json.moc"
