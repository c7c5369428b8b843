#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include "common/errors.hpp"
#include "core/frame_repository.hpp"
#include "core/track.hpp"
#include "fake_remote_api.hpp"

using namespace worklog;
using namespace worklog::testing;

class TrackTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testStartStop();
    void testStartWhileStarted();
    void testStartTimeChecks();
    void testStartWithoutGap();
    void testStopChecks();
    void testCancel();
    void testRoleResolution();
    void testAdd();
    void testRestart();
    void testLastFrameIgnoresFuture();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    TestClock m_clock;
    std::optional<Role> m_defaultRole;

    Activity m_dev = remoteActivity(11, 2, "Development");

    DefaultRoleResolver resolver()
    {
        return [this]() { return m_defaultRole; };
    }
};

void TrackTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void TrackTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void TrackTests::init()
{
    QFile::remove(m_tempDir.path() + "/.local/share/worklog/frames.json");
    m_clock.now = utc(2024, 3, 6, 12);
    m_defaultRole = makeRole(5, "Developer");
}

void TrackTests::testStartStop()
{
    FrameRepository frames(m_clock.clock());
    Track track(frames, resolver(), m_clock.clock());
    QVERIFY(!track.isStarted());

    const Frame started = track.start(m_dev, "DEV-1 pairing");
    QVERIFY(track.isStarted());
    QVERIFY(started.start == m_clock.now);
    QVERIFY(started.isActive());
    QCOMPARE(started.role.roleId().value(), 5);
    QCOMPARE(started.issueKeys.front(), std::string("DEV-1"));
    QVERIFY(*track.getCurrent() == started);

    m_clock.advance(std::chrono::minutes(90));
    const Frame stopped = track.stop();
    QVERIFY(!track.isStarted());
    QVERIFY(stopped.stop == m_clock.now);
    QCOMPARE(stopped.uuid, started.uuid);
    QVERIFY(stopped.duration(m_clock.now) == std::chrono::minutes(90));
    QCOMPARE(frames.all().size(), std::size_t(1));
}

void TrackTests::testStartWhileStarted()
{
    FrameRepository frames(m_clock.clock());
    Track track(frames, resolver(), m_clock.clock());
    const Frame first = track.start(m_dev);
    QVERIFY_EXCEPTION_THROWN(track.start(remoteActivity(12, 3, "Operations")), FrameAlreadyStarted);
    QCOMPARE(track.getCurrent()->uuid, first.uuid);
}

void TrackTests::testStartTimeChecks()
{
    FrameRepository frames(m_clock.clock());
    Track track(frames, resolver(), m_clock.clock());
    QVERIFY_EXCEPTION_THROWN(track.start(m_dev, "", utc(2024, 3, 6, 13)), InvalidTime);

    frames.save(closedFrame("aaaa0001", utc(2024, 3, 6, 9), utc(2024, 3, 6, 11), m_dev));
    // Overlapping the last frame is refused.
    QVERIFY_EXCEPTION_THROWN(track.start(m_dev, "", utc(2024, 3, 6, 10)), InvalidTime);
    QVERIFY(!track.isStarted());

    const Frame frame = track.start(m_dev, "", utc(2024, 3, 6, 11, 30));
    QVERIFY(frame.start == utc(2024, 3, 6, 11, 30));
}

void TrackTests::testStartWithoutGap()
{
    FrameRepository frames(m_clock.clock());
    Track track(frames, resolver(), m_clock.clock());
    frames.save(closedFrame("aaaa0001", utc(2024, 3, 6, 8), utc(2024, 3, 6, 10, 15), m_dev));

    const Frame frame = track.start(m_dev, "", std::nullopt, false);
    QVERIFY(frame.start == utc(2024, 3, 6, 10, 15));

    // Without any previous frame the requested time is used.
    track.cancel();
    frames.remove("aaaa0001");
    const Frame fresh = track.start(m_dev, "", utc(2024, 3, 6, 9), false);
    QVERIFY(fresh.start == utc(2024, 3, 6, 9));
}

void TrackTests::testStopChecks()
{
    FrameRepository frames(m_clock.clock());
    Track track(frames, resolver(), m_clock.clock());
    QVERIFY_EXCEPTION_THROWN(track.stop(), NoFrameStarted);

    track.start(m_dev, "", utc(2024, 3, 6, 10));
    QVERIFY_EXCEPTION_THROWN(track.stop(utc(2024, 3, 6, 12, 1)), InvalidTime);
    QVERIFY_EXCEPTION_THROWN(track.stop(utc(2024, 3, 6, 9)), InvalidTime);
    QVERIFY(track.isStarted());

    const Frame stopped = track.stop(utc(2024, 3, 6, 11));
    QVERIFY(stopped.stop == utc(2024, 3, 6, 11));
}

void TrackTests::testCancel()
{
    FrameRepository frames(m_clock.clock());
    Track track(frames, resolver(), m_clock.clock());
    QVERIFY_EXCEPTION_THROWN(track.cancel(), NoFrameStarted);

    const Frame started = track.start(m_dev);
    const Frame cancelled = track.cancel();
    QCOMPARE(cancelled.uuid, started.uuid);
    QVERIFY(!track.isStarted());
    QVERIFY(frames.all().empty());
}

void TrackTests::testRoleResolution()
{
    FrameRepository frames(m_clock.clock());
    Track track(frames, resolver(), m_clock.clock());

    const Frame explicitRole = track.start(m_dev, "", std::nullopt, true, false, makeRole(8, "Reviewer"));
    QCOMPARE(explicitRole.role.roleId().value(), 8);
    track.cancel();

    const Frame individual = track.start(m_dev, "", std::nullopt, true, true, makeRole(8, "Reviewer"));
    QVERIFY(individual.isIndividual());
    track.cancel();

    m_defaultRole.reset();
    QVERIFY_EXCEPTION_THROWN(track.start(m_dev), InvalidOperation);
    QVERIFY(!track.isStarted());

    Track noResolver(frames, DefaultRoleResolver(), m_clock.clock());
    QVERIFY_EXCEPTION_THROWN(noResolver.start(m_dev), InvalidOperation);
    QVERIFY(noResolver.start(m_dev, "", std::nullopt, true, true).isIndividual());
}

void TrackTests::testAdd()
{
    FrameRepository frames(m_clock.clock());
    Track track(frames, resolver(), m_clock.clock());

    QVERIFY_EXCEPTION_THROWN(track.add(m_dev, utc(2024, 3, 6, 10), utc(2024, 3, 6, 9)), InvalidTime);
    QVERIFY_EXCEPTION_THROWN(track.add(m_dev, utc(2024, 3, 6, 11), utc(2024, 3, 6, 13)), InvalidTime);

    track.start(m_dev);
    // Adding never touches the current frame.
    const Frame added = track.add(m_dev, utc(2024, 3, 5, 9), utc(2024, 3, 5, 17), "ABC-3", true);
    QVERIFY(track.isStarted());
    QVERIFY(added.isIndividual());
    QVERIFY(added.updatedAt == m_clock.now);
    QCOMPARE(frames.all().size(), std::size_t(1));
}

void TrackTests::testRestart()
{
    FrameRepository frames(m_clock.clock());
    Track track(frames, resolver(), m_clock.clock());
    const Frame source = closedFrame("aaaa0001", utc(2024, 3, 6, 8), utc(2024, 3, 6, 9), m_dev,
                                     "ABC-9 design", RoleAssignment::of(makeRole(6, "Architect")));
    frames.save(source);

    const Frame restarted = track.restart(source);
    QVERIFY(restarted.uuid != source.uuid);
    QCOMPARE(restarted.description, source.description);
    QCOMPARE(restarted.role.roleId().value(), 6);
    QVERIFY(restarted.activity == source.activity);
    QVERIFY(restarted.start == m_clock.now);

    track.cancel();
    const Frame contiguous = track.restart(source, std::nullopt, false);
    QVERIFY(contiguous.start == utc(2024, 3, 6, 9));
}

void TrackTests::testLastFrameIgnoresFuture()
{
    FrameRepository frames(m_clock.clock());
    Track track(frames, resolver(), m_clock.clock());
    QVERIFY(!track.lastFrame().has_value());

    frames.save(closedFrame("aaaa0001", utc(2024, 3, 6, 8), utc(2024, 3, 6, 9), m_dev));
    frames.save(closedFrame("bbbb0002", utc(2024, 3, 6, 11), utc(2024, 3, 6, 14), m_dev));
    QCOMPARE(track.lastFrame()->uuid, std::string("aaaa0001"));
}

QTEST_MAIN(TrackTests)
#include "test_track.moc"
