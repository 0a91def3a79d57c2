#include "tc/math/NiceTimeTicks.hpp"
#include "tc/math/TimeFormat.hpp"

#include <cmath>
#include <ctime>

namespace tc {

// Interval table (seconds)
static const double kTimeIntervals[] = {
  1, 2, 5, 10, 15, 30,                         // sub-minute
  60, 120, 300, 600, 900, 1800,                 // minutes
  3600, 7200, 14400, 21600, 43200,              // hours
  86400, 172800, 604800,                         // days/weeks
  2592000, 7776000, 15552000, 31536000           // months/quarters/years
};
static constexpr int kTimeIntervalCount = 24;

static constexpr double kMonth = 2592000.0;
static constexpr double kYear = 31536000.0;

static std::tm utcTm(std::int64_t epochSeconds) {
  auto epoch = static_cast<std::time_t>(epochSeconds);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &epoch);
#else
  gmtime_r(&epoch, &tm);
#endif
  return tm;
}

static std::int64_t toMs(std::tm& tm) {
  return static_cast<std::int64_t>(portableTimegm(&tm)) * 1000;
}

TimeTickSet computeNiceTimeTicks(std::int64_t tMinMs, std::int64_t tMaxMs,
                                 int targetCount) {
  TimeTickSet result;
  if (targetCount < 1) targetCount = 1;
  if (tMaxMs <= tMinMs) {
    result.stepSeconds = 1.0;
    result.values.push_back(tMinMs);
    return result;
  }

  double rangeSec = static_cast<double>(tMaxMs - tMinMs) / 1000.0;
  double rawStep = rangeSec / static_cast<double>(targetCount);

  // Smallest interval >= rawStep
  double step = kTimeIntervals[kTimeIntervalCount - 1];
  for (int i = 0; i < kTimeIntervalCount; i++) {
    if (kTimeIntervals[i] >= rawStep) {
      step = kTimeIntervals[i];
      break;
    }
  }
  result.stepSeconds = step;

  const int maxTicks = targetCount * 3;

  if (step < 86400.0) {
    auto stepMs = static_cast<std::int64_t>(step * 1000.0);
    std::int64_t first = (tMinMs / stepMs) * stepMs;
    if (first < tMinMs) first += stepMs;
    for (std::int64_t t = first; t <= tMaxMs && static_cast<int>(result.values.size()) < maxTicks; t += stepMs)
      result.values.push_back(t);
    return result;
  }

  // Day+ intervals: floor to day/month/year boundary
  std::tm tm = utcTm(tMinMs / 1000);
  tm.tm_hour = 0;
  tm.tm_min = 0;
  tm.tm_sec = 0;
  if (step >= kMonth) {
    tm.tm_mday = 1;
    if (step >= kYear) tm.tm_mon = 0;
  }

  int monthStep = static_cast<int>(step / kMonth + 0.5);
  if (monthStep < 1) monthStep = 1;
  auto dayStepMs = static_cast<std::int64_t>(step * 1000.0);

  std::int64_t t = toMs(tm);
  for (int guard = 0; guard < maxTicks * 4 && static_cast<int>(result.values.size()) < maxTicks; ++guard) {
    if (t > tMaxMs) break;
    if (t >= tMinMs) result.values.push_back(t);
    if (step >= kYear) {
      tm.tm_year++;
      t = toMs(tm);
    } else if (step >= kMonth) {
      tm.tm_mon += monthStep;
      while (tm.tm_mon > 11) { tm.tm_mon -= 12; tm.tm_year++; }
      t = toMs(tm);
    } else {
      t += dayStepMs;
    }
  }

  return result;
}

} // namespace tc
