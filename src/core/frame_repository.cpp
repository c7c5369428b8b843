#include "core/frame_repository.hpp"

#include <algorithm>

#include "common/errors.hpp"
#include "common/json_file.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/paths.hpp"

namespace worklog {

namespace {

constexpr const char *kFramesKey = "frames";
constexpr const char *kCurrentKey = "current";

nlohmann::json emptyDocument()
{
    return nlohmann::json{{kFramesKey, nlohmann::json::object()}, {kCurrentKey, nullptr}};
}

Frame parseFrame(const nlohmann::json &j)
{
    try {
        return frameFromJson(j);
    } catch (const nlohmann::json::exception &ex) {
        throw InvalidOperation(std::string("invalid frame JSON: ") + ex.what());
    }
}

bool hasCurrentFrame(const nlohmann::json &document)
{
    return document.contains(kCurrentKey) && document.at(kCurrentKey).is_object()
        && !document.at(kCurrentKey).empty();
}

std::string currentUuid(const nlohmann::json &document)
{
    return hasCurrentFrame(document)
        ? document.at(kCurrentKey).value("uuid", std::string())
        : std::string();
}

bool containsAny(const std::vector<std::string> &haystack, const std::vector<std::string> &needles)
{
    return std::any_of(needles.begin(), needles.end(), [&](const std::string &needle) {
        return std::find(haystack.begin(), haystack.end(), needle) != haystack.end();
    });
}

bool containsInt(const std::vector<int> &values, int value)
{
    return std::find(values.begin(), values.end(), value) != values.end();
}

void logMutation(const QString &where, const QString &what, const std::string &uuid)
{
    WLOG_DEBUG(QStringLiteral("FrameRepository"),
               where,
               what,
               QStringLiteral("frame_state_change"),
               QStringLiteral("atomic_json_write"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"uuid", uuid}}));
}

} // namespace

FrameRepository::FrameRepository(Clock clock)
    : FrameRepository(paths::dataFile(QStringLiteral("frames.json")), std::move(clock))
{
}

FrameRepository::FrameRepository(const QString &path, Clock clock)
    : m_path(path)
    , m_clock(std::move(clock))
{
}

Timestamp FrameRepository::now() const
{
    return m_clock();
}

QString FrameRepository::path() const
{
    return m_path;
}

nlohmann::json FrameRepository::load() const
{
    nlohmann::json document = readJsonFile(m_path, emptyDocument());
    if (!document.is_object()) {
        throw InvalidOperation("frame store root must be an object: " + m_path.toStdString());
    }
    if (!document.contains(kFramesKey) || !document.at(kFramesKey).is_object()) {
        document[kFramesKey] = nlohmann::json::object();
    }
    if (!document.contains(kCurrentKey)) {
        document[kCurrentKey] = nullptr;
    }
    return document;
}

void FrameRepository::persist(const nlohmann::json &document) const
{
    writeJsonFileAtomic(m_path, document);
}

void FrameRepository::save(const Frame &frame)
{
    if (frame.isActive()) {
        throw InvalidOperation("cannot save frame " + frame.uuid
                               + " without a stop time; use saveCurrent");
    }

    nlohmann::json document = load();
    document[kFramesKey][frame.uuid] = frameToJson(frame);
    persist(document);
    logMutation(QStringLiteral("save"), QStringLiteral("frame_saved"), frame.uuid);
}

void FrameRepository::update(const Frame &frame)
{
    nlohmann::json document = load();
    auto &frames = document[kFramesKey];
    const bool inCollection = frames.contains(frame.uuid);
    const bool isCurrent = currentUuid(document) == frame.uuid;

    if (!inCollection && !isCurrent) {
        throw NotFound("cannot update frame: frame '" + frame.uuid + "' does not exist");
    }

    if (frame.isActive()) {
        checkCurrentCandidate(frame, document);
        frames.erase(frame.uuid);
        document[kCurrentKey] = frameToJson(frame);
    } else {
        frames[frame.uuid] = frameToJson(frame);
        if (isCurrent) {
            document[kCurrentKey] = nullptr;
        }
    }

    persist(document);
    logMutation(QStringLiteral("update"), QStringLiteral("frame_updated"), frame.uuid);
}

void FrameRepository::remove(const std::string &uuid)
{
    nlohmann::json document = load();
    const bool erased = document[kFramesKey].erase(uuid) > 0;
    const bool wasCurrent = currentUuid(document) == uuid;

    if (!erased && !wasCurrent) {
        throw NotFound("cannot remove frame: frame '" + uuid + "' does not exist");
    }
    if (wasCurrent) {
        document[kCurrentKey] = nullptr;
    }

    persist(document);
    logMutation(QStringLiteral("remove"), QStringLiteral("frame_removed"), uuid);
}

std::vector<Frame> FrameRepository::all() const
{
    const nlohmann::json document = load();
    std::vector<Frame> frames;
    frames.reserve(document.at(kFramesKey).size());
    for (const auto &item : document.at(kFramesKey).items()) {
        frames.push_back(parseFrame(item.value()));
    }
    std::stable_sort(frames.begin(), frames.end(), [](const Frame &a, const Frame &b) {
        return a.start < b.start;
    });
    return frames;
}

std::optional<Frame> FrameRepository::get(const std::string &uuid) const
{
    const nlohmann::json document = load();
    const auto &frames = document.at(kFramesKey);
    if (frames.contains(uuid)) {
        return parseFrame(frames.at(uuid));
    }
    if (currentUuid(document) == uuid) {
        return parseFrame(document.at(kCurrentKey));
    }
    return std::nullopt;
}

std::vector<Frame> FrameRepository::getByDateRange(Timestamp from, std::optional<Timestamp> to) const
{
    std::vector<Frame> result;
    for (auto &frame : all()) {
        if (frame.start < from) {
            continue;
        }
        if (to && frame.start > *to) {
            continue;
        }
        result.push_back(std::move(frame));
    }
    return result;
}

std::vector<Frame> FrameRepository::filter(const FrameFilter &filter) const
{
    std::vector<Frame> candidates = all();
    if (filter.includeCurrent) {
        if (auto current = getCurrent()) {
            candidates.push_back(std::move(*current));
        }
    }

    const Timestamp current = now();
    std::vector<Frame> result;

    for (auto &frame : candidates) {
        const std::optional<int> projectId = frame.activity.projectKey.isRemote()
            ? std::optional<int>(frame.activity.projectKey.remoteId())
            : std::nullopt;

        if (!filter.projectIds.empty()
            && (!projectId || !containsInt(filter.projectIds, *projectId))) {
            continue;
        }
        if (!filter.excludeProjectIds.empty() && projectId
            && containsInt(filter.excludeProjectIds, *projectId)) {
            continue;
        }
        if (!filter.issueKeys.empty() && !containsAny(frame.issueKeys, filter.issueKeys)) {
            continue;
        }
        if (!filter.excludeIssueKeys.empty() && containsAny(frame.issueKeys, filter.excludeIssueKeys)) {
            continue;
        }

        if (filter.from || filter.to) {
            const Timestamp effectiveStop = frame.stop.value_or(current);
            if (filter.includePartial) {
                const bool startsBeforeEnd = !filter.to || frame.start <= *filter.to;
                const bool endsAfterStart = !filter.from || effectiveStop >= *filter.from;
                if (!startsBeforeEnd || !endsAfterStart) {
                    continue;
                }
            } else {
                if (filter.from && frame.start < *filter.from) {
                    continue;
                }
                if (filter.to && effectiveStop > *filter.to) {
                    continue;
                }
            }
        }

        result.push_back(std::move(frame));
    }
    return result;
}

void FrameRepository::checkCurrentCandidate(const Frame &frame, const nlohmann::json &document) const
{
    if (!frame.isActive()) {
        throw InvalidOperation("frame " + frame.uuid
                               + " has a stop time and cannot be the current frame");
    }

    const Timestamp current = now();
    if (frame.start > current) {
        throw InvalidTime("current frame " + frame.uuid + " cannot start in the future ("
                          + toIso8601Utc(frame.start) + " > " + toIso8601Utc(current) + ")");
    }

    const std::string existing = currentUuid(document);
    if (!existing.empty() && existing != frame.uuid) {
        throw FrameAlreadyStarted("frame " + existing
                                  + " is already the current frame; cannot make "
                                  + frame.uuid + " current");
    }
}

void FrameRepository::saveCurrent(const Frame &frame)
{
    nlohmann::json document = load();
    checkCurrentCandidate(frame, document);
    document[kFramesKey].erase(frame.uuid);
    document[kCurrentKey] = frameToJson(frame);
    persist(document);
    logMutation(QStringLiteral("saveCurrent"), QStringLiteral("current_frame_saved"), frame.uuid);
}

std::optional<Frame> FrameRepository::getCurrent() const
{
    const nlohmann::json document = load();
    if (!hasCurrentFrame(document)) {
        return std::nullopt;
    }
    return parseFrame(document.at(kCurrentKey));
}

bool FrameRepository::hasCurrent() const
{
    return hasCurrentFrame(load());
}

Frame FrameRepository::completeCurrent(std::optional<Timestamp> stop)
{
    nlohmann::json document = load();
    if (!hasCurrentFrame(document)) {
        throw NoFrameStarted("no current frame to complete");
    }

    const Frame currentFrame = parseFrame(document.at(kCurrentKey));
    const Timestamp current = now();
    const Timestamp stopTime = stop.value_or(current);

    if (stopTime > current) {
        throw InvalidTime("cannot stop frame " + currentFrame.uuid + " in the future ("
                          + toIso8601Utc(stopTime) + " > " + toIso8601Utc(current) + ")");
    }
    if (stopTime < currentFrame.start) {
        throw InvalidTime("cannot stop frame " + currentFrame.uuid + " before its start ("
                          + toIso8601Utc(stopTime) + " < " + toIso8601Utc(currentFrame.start) + ")");
    }

    const Frame completed = withStopTime(currentFrame, stopTime, current);
    document[kFramesKey][completed.uuid] = frameToJson(completed);
    document[kCurrentKey] = nullptr;
    persist(document);

    logMutation(QStringLiteral("completeCurrent"), QStringLiteral("current_frame_completed"),
                completed.uuid);
    return completed;
}

void FrameRepository::clearCurrent()
{
    nlohmann::json document = load();
    if (!hasCurrentFrame(document)) {
        return;
    }
    const std::string uuid = currentUuid(document);
    document[kCurrentKey] = nullptr;
    persist(document);
    logMutation(QStringLiteral("clearCurrent"), QStringLiteral("current_frame_cleared"), uuid);
}

std::optional<Role> FrameRepository::getLastUsedRoleForActivity(const EntityKey &activityKey) const
{
    std::optional<Frame> latest;
    for (auto &frame : all()) {
        if (frame.activity.key != activityKey || frame.isIndividual()) {
            continue;
        }
        if (!latest || frame.start >= latest->start) {
            latest = std::move(frame);
        }
    }
    if (!latest) {
        return std::nullopt;
    }
    return *latest->role.role();
}

std::optional<Activity> FrameRepository::getLastActivityForIssueKeys(std::vector<std::string> issueKeys) const
{
    if (issueKeys.empty()) {
        return std::nullopt;
    }
    std::sort(issueKeys.begin(), issueKeys.end());

    std::optional<Frame> latest;
    for (auto &frame : all()) {
        std::vector<std::string> frameKeys = frame.issueKeys;
        std::sort(frameKeys.begin(), frameKeys.end());
        if (frameKeys != issueKeys) {
            continue;
        }
        if (!latest || frame.start >= latest->start) {
            latest = std::move(frame);
        }
    }
    if (!latest) {
        return std::nullopt;
    }
    return latest->activity;
}

} // namespace worklog
