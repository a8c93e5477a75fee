#ifndef BOOTSTREAM_CORE_TIME_UTILS_HPP_
#define BOOTSTREAM_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <ctime>
#include <functional>
#include <iomanip>
#include <locale>
#include <sstream>
#include <string>

namespace bootstream::core {

// Injected wall clock. Engine code never calls system_clock::now() directly so
// tests can pin `updated` stamps.
using Clock = std::function<std::chrono::system_clock::time_point()>;

inline Clock SystemClock() {
  return [] { return std::chrono::system_clock::now(); };
}

namespace detail {

inline bool ToUtc(std::chrono::system_clock::time_point timestamp, std::tm& utc_time) {
  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
#if defined(_WIN32)
  return gmtime_s(&utc_time, &epoch_seconds) == 0;
#else
  return gmtime_r(&epoch_seconds, &utc_time) != nullptr;
#endif
}

inline bool FromUtc(std::tm& utc_time, std::chrono::system_clock::time_point& timestamp) {
#if defined(_WIN32)
  const std::time_t epoch_seconds = _mkgmtime(&utc_time);
#else
  const std::time_t epoch_seconds = timegm(&utc_time);
#endif
  if (epoch_seconds == static_cast<std::time_t>(-1)) {
    return false;
  }
  timestamp = std::chrono::system_clock::from_time_t(epoch_seconds);
  return true;
}

} // namespace detail

// Millisecond ISO-8601 UTC timestamp used by log lines.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  std::tm utc_time{};
  if (!detail::ToUtc(timestamp, utc_time)) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// The `updated` format of stream documents: "Tue, 17 Feb 2026 00:00:00 +0000".
// Day and month names are fixed English abbreviations regardless of locale.
inline std::string FormatStreamTimestamp(std::chrono::system_clock::time_point timestamp) {
  static constexpr const char* kDays[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
  static constexpr const char* kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                            "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

  std::tm utc_time{};
  if (!detail::ToUtc(timestamp, utc_time)) {
    return "";
  }

  std::ostringstream out;
  out << kDays[utc_time.tm_wday % 7] << ", " << std::setw(2) << std::setfill('0')
      << utc_time.tm_mday << ' ' << kMonths[utc_time.tm_mon % 12] << ' '
      << (utc_time.tm_year + 1900) << ' ' << std::setw(2) << utc_time.tm_hour << ':'
      << std::setw(2) << utc_time.tm_min << ':' << std::setw(2) << utc_time.tm_sec << " +0000";
  return out.str();
}

// Inverse of FormatStreamTimestamp(). Only the +0000 zone is accepted.
inline bool ParseStreamTimestamp(const std::string& text,
                                 std::chrono::system_clock::time_point& timestamp) {
  std::istringstream in(text);
  in.imbue(std::locale::classic());
  std::tm utc_time{};
  in >> std::get_time(&utc_time, "%a, %d %b %Y %H:%M:%S");
  std::string zone;
  if (in.fail() || !(in >> zone) || zone != "+0000") {
    return false;
  }
  std::string trailing;
  if (in >> trailing) {
    return false;
  }
  return detail::FromUtc(utc_time, timestamp);
}

} // namespace bootstream::core

#endif // BOOTSTREAM_CORE_TIME_UTILS_HPP_
