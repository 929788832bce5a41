/**
 * @file duration.hpp
 * @brief Human-readable duration parsing utilities.
 *
 * Parses duration strings such as "5s", "250ms" or "1m30s" into
 * std::chrono::milliseconds for the safety delay configuration.
 */
#ifndef GIT_PRUNE_MERGED_UTIL_DURATION_HPP
#define GIT_PRUNE_MERGED_UTIL_DURATION_HPP

#include <chrono>
#include <string>

namespace gpm {

/**
 * Parse a human-readable duration string ("250ms", "5s", "2m", "1h",
 * "1m30s") into milliseconds. Units can be combined and a bare number is
 * interpreted as seconds.
 *
 * @param str Duration string; empty string returns zero.
 * @return Parsed duration in milliseconds.
 * @throws std::runtime_error if an invalid format or suffix is provided.
 */
std::chrono::milliseconds parse_duration(const std::string &str);

/**
 * Format a duration for user-facing messages ("5s", "1500ms").
 */
std::string format_duration(std::chrono::milliseconds duration);

} // namespace gpm

#endif // GIT_PRUNE_MERGED_UTIL_DURATION_HPP
