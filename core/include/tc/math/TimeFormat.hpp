#pragma once
#include <cstdint>
#include <ctime>
#include <string>

namespace tc {

// Choose an appropriate strftime format string based on tick interval.
inline const char* chooseTimeFormat(double stepSeconds) {
  if (stepSeconds < 60)       return "%H:%M:%S";   // 14:30:15
  if (stepSeconds < 86400)    return "%H:%M";       // 14:30
  if (stepSeconds < 2592000)  return "%b %d";       // Jan 15
  if (stepSeconds < 31536000) return "%b %Y";       // Jan 2024
  return "%Y";                                       // 2024
}

// Cross-platform timegm (struct tm -> epoch seconds as UTC).
inline std::time_t portableTimegm(std::tm* tm) {
#ifdef _WIN32
  return _mkgmtime(tm);
#else
  return timegm(tm);
#endif
}

// Format an epoch-milliseconds timestamp (UTC) using strftime.
inline std::string formatTimestampMs(std::int64_t epochMs, const char* fmt) {
  auto epoch = static_cast<std::time_t>(epochMs / 1000);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &epoch);
#else
  gmtime_r(&epoch, &tm);
#endif
  char buf[64];
  std::strftime(buf, sizeof(buf), fmt, &tm);
  return buf;
}

// Epoch ms of 1 January 00:00 UTC of the year containing `epochMs`.
inline std::int64_t startOfUtcYearMs(std::int64_t epochMs) {
  auto epoch = static_cast<std::time_t>(epochMs / 1000);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &epoch);
#else
  gmtime_r(&epoch, &tm);
#endif
  tm.tm_mon = 0;
  tm.tm_mday = 1;
  tm.tm_hour = 0;
  tm.tm_min = 0;
  tm.tm_sec = 0;
  return static_cast<std::int64_t>(portableTimegm(&tm)) * 1000;
}

} // namespace tc
