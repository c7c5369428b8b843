#include "common/uuid.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace worklog {

namespace {

constexpr std::size_t kUuidLength = 8;

bool allDigits(const std::string &value)
{
    return std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

} // namespace

std::string generateUuid()
{
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> dist;

    std::string value;
    do {
        std::ostringstream out;
        out << std::hex << std::setw(kUuidLength) << std::setfill('0') << dist(gen);
        value = out.str();
    } while (allDigits(value));
    return value;
}

bool isUuid(const std::string &value)
{
    if (value.size() != kUuidLength || allDigits(value)) {
        return false;
    }
    return std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isdigit(c) != 0 || (c >= 'a' && c <= 'f');
    });
}

} // namespace worklog
