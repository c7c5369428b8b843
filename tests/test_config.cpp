#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/json_file.hpp"

using namespace worklog;

class ConfigTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testDefaultPathUnderHome();
    void testDottedSetAndGet();
    void testUnset();
    void testTypedAccessors();
    void testEnvironmentOverrides();
    void testInvalidInput();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString configPath() const;
};

void ConfigTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void ConfigTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ConfigTests::init()
{
    QFile::remove(configPath());
    qunsetenv("WORKLOG_BASE_URI");
    qunsetenv("WORKLOG_TOKEN");
}

QString ConfigTests::configPath() const
{
    return m_tempDir.path() + "/.config/worklog/config.json";
}

void ConfigTests::testDefaultPathUnderHome()
{
    Config config;
    QCOMPARE(config.path(), configPath());
    QVERIFY(config.all().empty());
    QVERIFY(!QFile::exists(configPath()));

    config.set("user.id", 12);
    QVERIFY(QFile::exists(configPath()));
}

void ConfigTests::testDottedSetAndGet()
{
    {
        Config config;
        config.set("user.defaultRole.id", 4);
        config.set("timesheet.timezone", "UTC");
        config.set("remote.enabled", true);
    }

    Config reloaded;
    QCOMPARE(reloaded.get("user.defaultRole.id")->get<int>(), 4);
    QVERIFY(reloaded.get("user.defaultRole")->is_object());
    QVERIFY(reloaded.get("remote.enabled")->get<bool>());
    QVERIFY(!reloaded.get("user.missing").has_value());
    QVERIFY(!reloaded.get("timesheet.timezone.inner").has_value());

    const auto raw = readJsonFile(configPath());
    QCOMPARE(raw["timesheet"]["timezone"].get<std::string>(), std::string("UTC"));

    // A scalar in the way is replaced by an object.
    reloaded.set("timesheet.timezone.name", "Europe/Berlin");
    QVERIFY(reloaded.get("timesheet.timezone")->is_object());
}

void ConfigTests::testUnset()
{
    Config config;
    config.set("remote.baseUri", "https://example.test/api");
    config.set("remote.token", "secret");

    QVERIFY(config.unset("remote.token"));
    QVERIFY(!config.unset("remote.token"));
    QVERIFY(!config.unset("nothing.here"));

    Config reloaded;
    QVERIFY(!reloaded.get("remote.token").has_value());
    QVERIFY(reloaded.get("remote.baseUri").has_value());
}

void ConfigTests::testTypedAccessors()
{
    Config config;
    QVERIFY(!config.userId().has_value());
    QVERIFY(!config.defaultRoleId().has_value());
    QCOMPARE(config.timesheetZone().id(), QByteArray("Europe/Zurich"));
    QCOMPARE(config.remoteTimeoutMs(), 10000);

    config.set("user.id", "42");
    config.set("user.defaultRole.id", 7);
    config.set("timesheet.timezone", "UTC");
    config.set("remote.timeoutMs", 2500);
    QCOMPARE(config.userId().value(), 42);
    QCOMPARE(config.defaultRoleId().value(), 7);
    QCOMPARE(config.timesheetZone().id(), QByteArray("UTC"));
    QCOMPARE(config.remoteTimeoutMs(), 2500);

    config.set("user.id", "4x");
    QVERIFY(!config.userId().has_value());
    config.set("remote.timeoutMs", -5);
    QCOMPARE(config.remoteTimeoutMs(), 10000);

    QCOMPARE(Config::toInt(nlohmann::json(3)).value(), 3);
    QVERIFY(!Config::toInt(nlohmann::json(1.5)).has_value());
    QVERIFY(!Config::toInt(nlohmann::json("99999999999")).has_value());
}

void ConfigTests::testEnvironmentOverrides()
{
    Config config;
    config.set("remote.baseUri", "https://configured.test");
    config.set("remote.token", "from-file");
    QCOMPARE(config.remoteBaseUri(), QStringLiteral("https://configured.test"));
    QCOMPARE(config.remoteToken(), QStringLiteral("from-file"));

    qputenv("WORKLOG_BASE_URI", "https://env.test");
    qputenv("WORKLOG_TOKEN", "from-env");
    QCOMPARE(config.remoteBaseUri(), QStringLiteral("https://env.test"));
    QCOMPARE(config.remoteToken(), QStringLiteral("from-env"));
}

void ConfigTests::testInvalidInput()
{
    Config config;
    QVERIFY_EXCEPTION_THROWN(config.set("user..id", 1), InvalidOperation);
    QVERIFY_EXCEPTION_THROWN(config.get(".leading"), InvalidOperation);

    config.set("timesheet.timezone", "Mars/Olympus");
    QVERIFY_EXCEPTION_THROWN(config.timesheetZone(), InvalidOperation);

    QFile file(configPath());
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write("{ not json");
    file.close();
    QVERIFY_EXCEPTION_THROWN(Config{}, InvalidOperation);

    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write("[1, 2]");
    file.close();
    QVERIFY_EXCEPTION_THROWN(Config{}, InvalidOperation);
}

QTEST_MAIN(ConfigTests)
#include "test_config.moc"
