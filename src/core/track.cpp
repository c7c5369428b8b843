#include "core/track.hpp"

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/uuid.hpp"

namespace worklog {

namespace {

std::string describeFrame(const Frame &frame)
{
    const Role *role = frame.role.role();
    return "uuid=" + frame.uuid + ", start=" + formatLocal(frame.start).toStdString()
        + ", activity=" + frame.activity.name
        + ", role=" + (role ? role->name : std::string("Individual"));
}

void logTransition(const QString &where, const QString &what, const Frame &frame)
{
    WLOG_INFO(QStringLiteral("Track"),
              where,
              what,
              QStringLiteral("user_command"),
              QStringLiteral("frame_repository"),
              logging::defaultWho(),
              logging::currentCorrelationId(),
              (nlohmann::json{{"uuid", frame.uuid},
                              {"activity", frame.activity.key.toString()},
                              {"start", toIso8601Utc(frame.start)},
                              {"stop", frame.stop ? nlohmann::json(toIso8601Utc(*frame.stop))
                                                  : nlohmann::json(nullptr)}}));
}

} // namespace

Track::Track(FrameRepository &frames, DefaultRoleResolver defaultRole, Clock clock)
    : m_frames(frames)
    , m_defaultRole(std::move(defaultRole))
    , m_clock(std::move(clock))
{
}

RoleAssignment Track::resolveRole(bool isIndividual, std::optional<Role> role) const
{
    if (isIndividual) {
        return RoleAssignment::individual();
    }
    if (!role && m_defaultRole) {
        role = m_defaultRole();
    }
    if (!role) {
        throw InvalidOperation("no role given and no default role found; "
                               "set user.defaultRole.id in the config");
    }
    return RoleAssignment::of(std::move(*role));
}

std::optional<Frame> Track::lastFrame() const
{
    const Timestamp now = m_clock();
    std::optional<Frame> last;
    for (auto &frame : m_frames.all()) {
        if (!frame.stop || *frame.stop > now) {
            continue;
        }
        if (!last || frame.start >= last->start) {
            last = std::move(frame);
        }
    }
    return last;
}

Frame Track::start(const Activity &activity,
                   const std::string &description,
                   std::optional<Timestamp> at,
                   bool gap,
                   bool isIndividual,
                   std::optional<Role> role)
{
    if (auto current = m_frames.getCurrent()) {
        throw FrameAlreadyStarted("a frame is already started; stop or cancel it first ("
                                  + describeFrame(*current) + ")");
    }

    const Timestamp now = m_clock();
    Timestamp startTime = truncateToSeconds(at.value_or(now));
    const std::optional<Frame> last = lastFrame();

    if (!gap && last) {
        startTime = *last->stop;
    }

    if (startTime > now) {
        throw InvalidTime("cannot start a frame in the future (start " + toIso8601Utc(startTime)
                          + ", now " + toIso8601Utc(now) + ")");
    }
    if (gap && last && startTime < *last->stop) {
        throw InvalidTime("cannot start a frame before the previous frame ends (start "
                          + toIso8601Utc(startTime) + ", previous stop "
                          + toIso8601Utc(*last->stop) + ")");
    }

    const Frame frame = makeFrame(generateUuid(),
                                  startTime,
                                  std::nullopt,
                                  activity,
                                  description,
                                  resolveRole(isIndividual, std::move(role)),
                                  now);
    m_frames.saveCurrent(frame);
    logTransition(QStringLiteral("start"), QStringLiteral("frame_started"), frame);
    return frame;
}

Frame Track::stop(std::optional<Timestamp> at)
{
    const std::optional<Frame> current = m_frames.getCurrent();
    if (!current) {
        throw NoFrameStarted("no frame is started; start a frame before stopping");
    }

    const Timestamp now = m_clock();
    const Timestamp stopTime = truncateToSeconds(at.value_or(now));

    if (stopTime > now) {
        throw InvalidTime("cannot stop a frame in the future (stop " + toIso8601Utc(stopTime)
                          + ", now " + toIso8601Utc(now) + ")");
    }
    if (stopTime < current->start) {
        throw InvalidTime("cannot stop a frame before it starts (stop " + toIso8601Utc(stopTime)
                          + ", start " + toIso8601Utc(current->start) + ")");
    }

    const Frame completed = m_frames.completeCurrent(stopTime);
    logTransition(QStringLiteral("stop"), QStringLiteral("frame_stopped"), completed);
    return completed;
}

Frame Track::cancel()
{
    const std::optional<Frame> current = m_frames.getCurrent();
    if (!current) {
        throw NoFrameStarted("no frame is started; start a frame before cancelling");
    }
    m_frames.clearCurrent();
    logTransition(QStringLiteral("cancel"), QStringLiteral("frame_cancelled"), *current);
    return *current;
}

Frame Track::add(const Activity &activity,
                 Timestamp from,
                 Timestamp to,
                 const std::string &description,
                 bool isIndividual,
                 std::optional<Role> role)
{
    const Timestamp now = m_clock();
    from = truncateToSeconds(from);
    to = truncateToSeconds(to);

    if (from > to) {
        throw InvalidTime("cannot add a frame whose start is after its stop (start "
                          + toIso8601Utc(from) + ", stop " + toIso8601Utc(to) + ")");
    }
    if (from > now || to > now) {
        throw InvalidTime("cannot add a frame in the future (stop " + toIso8601Utc(to)
                          + ", now " + toIso8601Utc(now) + ")");
    }

    const Frame frame = makeFrame(generateUuid(),
                                  from,
                                  to,
                                  activity,
                                  description,
                                  resolveRole(isIndividual, std::move(role)),
                                  now);
    m_frames.save(frame);
    logTransition(QStringLiteral("add"), QStringLiteral("frame_added"), frame);
    return frame;
}

Frame Track::restart(const Frame &source, std::optional<Timestamp> at, bool gap)
{
    const Role *role = source.role.role();
    return start(source.activity,
                 source.description,
                 at,
                 gap,
                 source.isIndividual(),
                 role ? std::optional<Role>(*role) : std::nullopt);
}

bool Track::isStarted() const
{
    return m_frames.hasCurrent();
}

std::optional<Frame> Track::getCurrent() const
{
    return m_frames.getCurrent();
}

} // namespace worklog
