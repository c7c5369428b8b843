#include "core/project_store.hpp"

#include <algorithm>

#include "common/string_utils.hpp"

namespace worklog {

std::vector<Project> matchProjectsByName(const std::vector<Project> &projects,
                                         const std::string &name,
                                         bool containsFallbackOnly)
{
    const std::string needle = toLower(name);
    std::vector<Project> startsWith;
    std::vector<Project> contains;

    for (const auto &project : projects) {
        const std::string candidate = trim(toLower(project.name));
        if (candidate.rfind(needle, 0) == 0) {
            startsWith.push_back(project);
        } else if (candidate.find(needle) != std::string::npos) {
            contains.push_back(project);
        }
    }

    const auto byName = [](const Project &a, const Project &b) {
        return lessCaseInsensitive(a.name, b.name);
    };
    std::stable_sort(startsWith.begin(), startsWith.end(), byName);
    std::stable_sort(contains.begin(), contains.end(), byName);

    if (containsFallbackOnly) {
        return startsWith.empty() ? contains : startsWith;
    }
    startsWith.insert(startsWith.end(), contains.begin(), contains.end());
    return startsWith;
}

bool hasProjectStatus(const Project &project, const ProjectStatuses &statuses)
{
    if (statuses.empty()) {
        return true;
    }
    return std::any_of(statuses.begin(), statuses.end(), [&](ProjectStatus status) {
        return project.hasStatus(status);
    });
}

} // namespace worklog
