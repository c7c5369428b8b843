#pragma once

#include <string>

namespace worklog {

// Local identifiers: 8 lowercase hex characters, never purely numeric so they
// cannot be mistaken for a remote integer id.
std::string generateUuid();

bool isUuid(const std::string &value);

} // namespace worklog
