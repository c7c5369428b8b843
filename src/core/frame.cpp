#include "core/frame.hpp"

#include <algorithm>
#include <regex>

#include "common/errors.hpp"

namespace worklog {

namespace {

const std::regex &issueKeyPattern()
{
    static const std::regex pattern("[A-Z]{2,6}-[0-9]{1,5}");
    return pattern;
}

} // namespace

std::chrono::seconds Frame::duration(Timestamp now) const
{
    const Timestamp end = stop.value_or(now);
    return std::chrono::duration_cast<std::chrono::seconds>(end - start);
}

bool Frame::operator==(const Frame &other) const
{
    return uuid == other.uuid && start == other.start && stop == other.stop
        && activity == other.activity && description == other.description
        && role == other.role && issueKeys == other.issueKeys
        && updatedAt == other.updatedAt;
}

std::vector<std::string> extractIssueKeys(const std::string &description)
{
    std::vector<std::string> keys;
    auto begin = std::sregex_iterator(description.begin(), description.end(), issueKeyPattern());
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        const std::string key = it->str();
        if (std::find(keys.begin(), keys.end(), key) == keys.end()) {
            keys.push_back(key);
        }
    }
    return keys;
}

Frame makeFrame(const std::string &uuid,
                Timestamp start,
                std::optional<Timestamp> stop,
                Activity activity,
                const std::string &description,
                RoleAssignment role,
                Timestamp updatedAt)
{
    if (stop && *stop < start) {
        throw InvalidTime("frame " + uuid + " stops (" + toIso8601Utc(*stop)
                          + ") before it starts (" + toIso8601Utc(start) + ")");
    }

    return Frame{uuid,
                 truncateToSeconds(start),
                 stop ? std::optional<Timestamp>(truncateToSeconds(*stop)) : std::nullopt,
                 std::move(activity),
                 description,
                 std::move(role),
                 extractIssueKeys(description),
                 truncateToSeconds(updatedAt)};
}

Frame withStopTime(const Frame &frame, Timestamp stop, Timestamp now)
{
    return makeFrame(frame.uuid, frame.start, stop, frame.activity,
                     frame.description, frame.role, now);
}

Frame withDescription(const Frame &frame, const std::string &description, Timestamp now)
{
    return makeFrame(frame.uuid, frame.start, frame.stop, frame.activity,
                     description, frame.role, now);
}

} // namespace worklog
