#include "tc/math/NiceTicks.hpp"
#include <cmath>

namespace tc {

TickSet computeNiceTicks(double lo, double hi, int targetCount) {
  TickSet result;
  if (targetCount < 1) targetCount = 1;
  if (!(hi > lo) || !std::isfinite(lo) || !std::isfinite(hi)) {
    result.min = lo;
    result.max = hi;
    result.step = 1.0;
    if (std::isfinite(lo)) result.values.push_back(lo);
    return result;
  }

  double range = hi - lo;
  double rawStep = range / static_cast<double>(targetCount);

  double mag = std::pow(10.0, std::floor(std::log10(rawStep)));
  double residual = rawStep / mag;

  double niceStep;
  if (residual <= 1.0)       niceStep = 1.0 * mag;
  else if (residual <= 2.0)  niceStep = 2.0 * mag;
  else if (residual <= 2.5)  niceStep = 2.5 * mag;
  else if (residual <= 5.0)  niceStep = 5.0 * mag;
  else                       niceStep = 10.0 * mag;

  result.step = niceStep;
  result.min = std::ceil(lo / niceStep) * niceStep;
  result.max = std::floor(hi / niceStep) * niceStep;

  // Index-based generation avoids accumulated float drift.
  long n = static_cast<long>(std::floor((result.max - result.min) / niceStep + 0.5));
  for (long i = 0; i <= n; ++i) {
    result.values.push_back(result.min + static_cast<double>(i) * niceStep);
  }

  return result;
}

double magnitudeStep(double range) {
  if (!(range > 0.0) || !std::isfinite(range)) return 0.0;
  return std::pow(10.0, std::floor(std::log10(range)) - 1.0);
}

} // namespace tc
