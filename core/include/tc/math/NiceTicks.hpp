#pragma once
#include <vector>

namespace tc {

struct TickSet {
  double min{0}, max{0}, step{1};
  std::vector<double> values;
};

// Compute "nice" tick values for an axis range.
// Snaps step to {1, 2, 2.5, 5, 10} x 10^n, then generates values in [lo, hi].
TickSet computeNiceTicks(double lo, double hi, int targetCount = 5);

// Order-of-magnitude rounding step for a price range:
// 10^(floor(log10(range)) - 1). Returns 0 for empty/non-finite ranges.
double magnitudeStep(double range);

} // namespace tc
