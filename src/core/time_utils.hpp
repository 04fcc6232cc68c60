#ifndef SCENKIT_CORE_TIME_UTILS_HPP_
#define SCENKIT_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iomanip>
#include <sstream>
#include <string>

namespace scenkit::core {

// Canonical UTC timestamp formatter used by diagnostics.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
#if defined(_WIN32)
  const errno_t result = gmtime_s(&utc_time, &epoch_seconds);
  if (result != 0) {
    return "";
  }
#else
  const std::tm* result = gmtime_r(&epoch_seconds, &utc_time);
  if (result == nullptr) {
    return "";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// Wall-clock source in epoch milliseconds. Injected wherever a name or
// record depends on "now" so tests can pin it.
using EpochMillisClock = std::function<std::int64_t()>;

inline std::int64_t SystemEpochMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

// Lowercase base-36 rendering (digits then a-z), matching the radix-36
// form scripting runtimes print for integers. Negative values keep a sign.
inline std::string ToBase36(std::int64_t value) {
  if (value == 0) {
    return "0";
  }

  const bool negative = value < 0;
  // Work in unsigned space so INT64_MIN does not overflow on negation.
  std::uint64_t magnitude = negative ? static_cast<std::uint64_t>(-(value + 1)) + 1U
                                     : static_cast<std::uint64_t>(value);

  constexpr char kDigits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  std::string reversed;
  while (magnitude > 0U) {
    reversed.push_back(kDigits[magnitude % 36U]);
    magnitude /= 36U;
  }
  if (negative) {
    reversed.push_back('-');
  }
  return std::string(reversed.rbegin(), reversed.rend());
}

} // namespace scenkit::core

#endif // SCENKIT_CORE_TIME_UTILS_HPP_
