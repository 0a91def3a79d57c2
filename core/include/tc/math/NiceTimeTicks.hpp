#pragma once
#include <cstdint>
#include <vector>

namespace tc {

struct TimeTickSet {
  double stepSeconds{1};               // chosen interval in seconds
  std::vector<std::int64_t> values;    // tick positions (epoch ms)
};

// Compute time-aligned tick positions for [tMinMs, tMaxMs].
// Snaps to human-meaningful intervals (1s, 5s, 1min, 1hr, 1day, 1mo, ...);
// day-and-longer steps are aligned to UTC calendar boundaries.
TimeTickSet computeNiceTimeTicks(std::int64_t tMinMs, std::int64_t tMaxMs,
                                 int targetCount = 6);

} // namespace tc
