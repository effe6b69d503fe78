/**
 * Address validation and normalization.
 */

#include "relay/address.h"

#include <algorithm>
#include <cctype>

namespace address {

namespace {
constexpr std::size_t kHexDigits = 40;
}

bool is_valid(const std::string& value) {
    if (value.size() != kHexDigits + 2) return false;
    if (value[0] != '0' || value[1] != 'x') return false;
    return std::all_of(value.begin() + 2, value.end(), [](unsigned char c) {
        return std::isxdigit(c) != 0;
    });
}

std::string normalize(const std::string& value) {
    std::string out = value;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

} // namespace address
