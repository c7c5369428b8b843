#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QFile>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testLogEventWrites();
    void testDebugDroppedWithoutTrace();
    void testTraceWrites();
    void testCorrelationScope();
    void testMinimumLevel();
    void testErrorContext();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString logPath(const QString &suffix) const;
    QList<nlohmann::json> readLines(const QString &path) const;
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void LoggingTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

QString LoggingTests::logPath(const QString &suffix) const
{
    return m_tempDir.path() + "/.local/share/worklog/logs/worklog-test" + suffix;
}

QList<nlohmann::json> LoggingTests::readLines(const QString &path) const
{
    QList<nlohmann::json> lines;
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return lines;
    }
    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        if (!line.isEmpty()) {
            lines.push_back(nlohmann::json::parse(line.toStdString()));
        }
    }
    return lines;
}

void LoggingTests::testLogEventWrites()
{
    worklog::logging::initLogging(QStringLiteral("worklog-test"), false);

    worklog::logging::logEvent(worklog::logging::LogLevel::Info,
                               QStringLiteral("worklog-test"),
                               QStringLiteral("Test"),
                               QStringLiteral("testLogEventWrites"),
                               QStringLiteral("test_log"),
                               QStringLiteral("unit_test"),
                               QStringLiteral("direct_call"),
                               worklog::logging::defaultWho(),
                               QStringLiteral("corr-1"),
                               nlohmann::json{{"key", "value"}});

    const auto lines = readLines(logPath(QStringLiteral(".log")));
    QVERIFY(!lines.isEmpty());
    const auto &parsed = lines.last();
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("corr-1"));
    QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("INFO"));
    QCOMPARE(parsed["context"].value("key", ""), std::string("value"));
}

void LoggingTests::testDebugDroppedWithoutTrace()
{
    worklog::logging::initLogging(QStringLiteral("worklog-test"), false);
    const auto before = readLines(logPath(QStringLiteral(".log"))).size();

    WLOG_DEBUG(QStringLiteral("Test"),
               QStringLiteral("testDebugDroppedWithoutTrace"),
               QStringLiteral("debug_hidden"),
               QStringLiteral("unit_test"),
               QStringLiteral("macro"),
               worklog::logging::defaultWho(),
               QStringLiteral("corr-d"),
               nlohmann::json::object());

    QCOMPARE(readLines(logPath(QStringLiteral(".log"))).size(), before);
    QVERIFY(!QFile::exists(logPath(QStringLiteral("-trace.log"))));
}

void LoggingTests::testTraceWrites()
{
    worklog::logging::initLogging(QStringLiteral("worklog-test"), true);
    QVERIFY(worklog::logging::isTraceEnabled());

    worklog::logging::logEvent(worklog::logging::LogLevel::Debug,
                               QStringLiteral("worklog-test"),
                               QStringLiteral("Test"),
                               QStringLiteral("testTraceWrites"),
                               QStringLiteral("test_trace"),
                               QStringLiteral("unit_test"),
                               QStringLiteral("direct_call"),
                               worklog::logging::defaultWho(),
                               QStringLiteral("corr-2"),
                               nlohmann::json::object());

    const auto trace = readLines(logPath(QStringLiteral("-trace.log")));
    QVERIFY(!trace.isEmpty());
    QCOMPARE(QString::fromStdString(trace.last().value("what", "")), QStringLiteral("test_trace"));

    worklog::logging::initLogging(QStringLiteral("worklog-test"), false);
}

void LoggingTests::testCorrelationScope()
{
    worklog::logging::setCorrelationId(QStringLiteral("outer"));
    {
        worklog::logging::CorrelationScope scope(QStringLiteral("inner"));
        QCOMPARE(worklog::logging::currentCorrelationId(), QStringLiteral("inner"));

        WLOG_INFO(QStringLiteral("Test"),
                  QStringLiteral("testCorrelationScope"),
                  QStringLiteral("scoped_event"),
                  QStringLiteral("unit_test"),
                  QStringLiteral("macro"),
                  worklog::logging::defaultWho(),
                  QString(),
                  nlohmann::json::object());
    }
    QCOMPARE(worklog::logging::currentCorrelationId(), QStringLiteral("outer"));

    const auto lines = readLines(logPath(QStringLiteral(".log")));
    QVERIFY(!lines.isEmpty());
    QCOMPARE(lines.last().value("corr", ""), std::string("inner"));

    const QString id = worklog::logging::newCorrelationId();
    QVERIFY(id.size() == 8);
    QVERIFY(id != worklog::logging::newCorrelationId());
    worklog::logging::setCorrelationId(QString());
}

void LoggingTests::testMinimumLevel()
{
    using worklog::logging::LogLevel;
    QVERIFY(worklog::logging::parseLogLevel(QStringLiteral(" WARNING ")) == LogLevel::Warn);
    QVERIFY(worklog::logging::parseLogLevel(QStringLiteral("bogus"), LogLevel::Error) == LogLevel::Error);

    worklog::logging::setMinimumLevel(LogLevel::Warn);
    const auto before = readLines(logPath(QStringLiteral(".log"))).size();
    worklog::logging::logEvent(LogLevel::Info,
                               QStringLiteral("worklog-test"),
                               QStringLiteral("Test"),
                               QStringLiteral("testMinimumLevel"),
                               QStringLiteral("below_minimum"),
                               QStringLiteral("unit_test"),
                               QStringLiteral("direct_call"),
                               worklog::logging::defaultWho(),
                               QStringLiteral("corr-3"),
                               nlohmann::json::object());
    QCOMPARE(readLines(logPath(QStringLiteral(".log"))).size(), before);
    worklog::logging::setMinimumLevel(LogLevel::Debug);
}

void LoggingTests::testErrorContext()
{
    const std::runtime_error error("disk full");
    const auto context = worklog::logging::errorContext(error, nlohmann::json{{"uuid", "abcd1234"}});
    QCOMPARE(context.value("error", ""), std::string("disk full"));
    QCOMPARE(context.value("uuid", ""), std::string("abcd1234"));

    const auto bare = worklog::logging::errorContext(error, nlohmann::json::array());
    QVERIFY(bare.is_object());
    QCOMPARE(bare.value("error", ""), std::string("disk full"));
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
