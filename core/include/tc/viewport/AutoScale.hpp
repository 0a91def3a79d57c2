#pragma once
#include "tc/data/Bar.hpp"

#include <cstddef>
#include <vector>

namespace tc {

struct AutoScaleConfig {
  double marginFraction{0.08};   // padding on each side
  bool includeZero{false};
};

class AutoScale {
public:
  void setConfig(const AutoScaleConfig& cfg) { config_ = cfg; }

  // Compute a padded price range over bars[first..last] (inclusive).
  // A flat range is widened so that max > min always holds.
  // Returns false if the index range holds no bars.
  bool computePriceRange(const std::vector<Bar>& bars,
                         std::size_t first, std::size_t last,
                         double& priceMin, double& priceMax) const;

  // Largest volume in bars[first..last]; 0 when empty.
  static double maxVolume(const std::vector<Bar>& bars,
                          std::size_t first, std::size_t last);

private:
  AutoScaleConfig config_;
};

} // namespace tc
