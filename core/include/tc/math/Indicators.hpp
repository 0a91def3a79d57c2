#pragma once
#include "tc/data/Bar.hpp"

#include <vector>

namespace tc {

// Overlay series consumed read-only by the chart renderer.
// All outputs are aligned to bar indices; warm-up slots hold NaN.

std::vector<double> computeSma(const std::vector<Bar>& bars, int period);

// Seeded with the SMA of the first `period` closes.
std::vector<double> computeEma(const std::vector<Bar>& bars, int period);

// Wilder-smoothed RSI (0-100). First `period` values are NaN.
std::vector<double> computeRsi(const std::vector<Bar>& bars, int period = 14);

struct BollingerBands {
  std::vector<double> middle;
  std::vector<double> upper;
  std::vector<double> lower;
};

BollingerBands computeBollinger(const std::vector<Bar>& bars, int period = 20,
                                double stdDevMultiplier = 2.0);

struct StochasticResult {
  std::vector<double> percentK;
  std::vector<double> percentD;
};

StochasticResult computeStochastic(const std::vector<Bar>& bars,
                                   int kPeriod = 14, int dPeriod = 3);

// Volume-at-price histogram over bars with timestamp in [tMin, tMax] and
// price range [pMin, pMax]. Each bar's typical price (h+l+c)/3 picks its bin.
struct VolumeProfile {
  double priceMin{0};
  double priceMax{0};
  std::vector<double> binVolume;   // index 0 = lowest price
  int pocBin{-1};                  // -1 when no volume landed
  int valueAreaLow{-1};            // inclusive bin range holding valueAreaFraction
  int valueAreaHigh{-1};
  double totalVolume{0};
};

VolumeProfile computeVolumeProfile(const std::vector<Bar>& bars,
                                   double tMin, double tMax,
                                   double pMin, double pMax,
                                   int bins = 24, double valueAreaFraction = 0.7);

} // namespace tc
