#include "util/duration.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace gpm {

namespace {

constexpr long long kMaxMs = std::numeric_limits<long long>::max();

/**
 * Add @p value units of @p unit_ms milliseconds to @p total.
 *
 * @throws std::runtime_error When the result does not fit in long long.
 */
void accumulate(long long &total, long long value, long long unit_ms,
                const std::string &str) {
  if (value > kMaxMs / unit_ms || total > kMaxMs - value * unit_ms) {
    throw std::runtime_error("Duration out of range '" + str + "'");
  }
  total += value * unit_ms;
}

} // namespace

/**
 * Parse a human-readable duration string (e.g., "5s", "250ms").
 *
 * @param str Duration string comprised of number/unit pairs.
 * @return Parsed duration in milliseconds.
 * @throws std::runtime_error When the format or unit is invalid.
 */
std::chrono::milliseconds parse_duration(const std::string &str) {
  if (str.empty()) {
    return std::chrono::milliseconds{0};
  }

  long long total_ms = 0;
  std::size_t i = 0;
  bool has_unit = false;

  while (i < str.size()) {
    if (!std::isdigit(static_cast<unsigned char>(str[i]))) {
      throw std::runtime_error("Invalid duration string '" + str + "'");
    }

    long long value = 0;
    while (i < str.size() && std::isdigit(static_cast<unsigned char>(str[i]))) {
      int digit = str[i] - '0';
      if (value > (kMaxMs - digit) / 10) {
        throw std::runtime_error("Duration out of range '" + str + "'");
      }
      value = value * 10 + digit;
      ++i;
    }

    if (i == str.size()) {
      if (has_unit) {
        throw std::runtime_error("Missing unit in duration '" + str + "'");
      }
      accumulate(total_ms, value, 1000, str);
      break;
    }

    char unit = static_cast<char>(std::tolower(static_cast<unsigned char>(str[i])));
    ++i;
    switch (unit) {
    case 'm':
      if (i < str.size() &&
          std::tolower(static_cast<unsigned char>(str[i])) == 's') {
        ++i;
        accumulate(total_ms, value, 1, str);
      } else {
        accumulate(total_ms, value, 60 * 1000, str);
      }
      break;
    case 's':
      accumulate(total_ms, value, 1000, str);
      break;
    case 'h':
      accumulate(total_ms, value, 3600 * 1000, str);
      break;
    default:
      throw std::runtime_error("Invalid duration suffix in '" + str + "'");
    }
    has_unit = true;
  }

  return std::chrono::milliseconds{total_ms};
}

std::string format_duration(std::chrono::milliseconds duration) {
  auto ms = duration.count();
  if (ms % 1000 == 0) {
    return std::to_string(ms / 1000) + "s";
  }
  return std::to_string(ms) + "ms";
}

} // namespace gpm
