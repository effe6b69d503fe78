#pragma once

#include <string>

/**
 * Identity address helpers.
 *
 * An address is "0x" followed by 40 hex digits. The canonical form is
 * lower-case; every store and the connection registry key on it.
 */
namespace address {

/// True if `value` matches ^0x[a-fA-F0-9]{40}$.
bool is_valid(const std::string& value);

/// Lower-cased copy of `value`. Does not validate.
std::string normalize(const std::string& value);

} // namespace address
