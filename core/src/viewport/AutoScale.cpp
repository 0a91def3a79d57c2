#include "tc/viewport/AutoScale.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace tc {

bool AutoScale::computePriceRange(const std::vector<Bar>& bars,
                                  std::size_t first, std::size_t last,
                                  double& priceMin, double& priceMax) const {
  if (bars.empty() || first > last || first >= bars.size()) return false;
  last = std::min(last, bars.size() - 1);

  double lo = std::numeric_limits<double>::max();
  double hi = std::numeric_limits<double>::lowest();
  for (std::size_t i = first; i <= last; i++) {
    lo = std::min(lo, bars[i].low);
    hi = std::max(hi, bars[i].high);
  }

  double span = hi - lo;
  if (span <= 0.0) {
    // Flat: pad by 1% of the level, at least one unit
    double pad = std::max(std::fabs(hi) * 0.01, 1.0);
    lo -= pad;
    hi += pad;
  } else {
    double margin = span * config_.marginFraction;
    lo -= margin;
    hi += margin;
  }

  if (config_.includeZero) {
    if (lo > 0.0) lo = 0.0;
    if (hi < 0.0) hi = 0.0;
  }

  priceMin = lo;
  priceMax = hi;
  return true;
}

double AutoScale::maxVolume(const std::vector<Bar>& bars,
                            std::size_t first, std::size_t last) {
  if (bars.empty() || first > last || first >= bars.size()) return 0.0;
  last = std::min(last, bars.size() - 1);
  double v = 0.0;
  for (std::size_t i = first; i <= last; i++) v = std::max(v, bars[i].volume);
  return v;
}

} // namespace tc
