#include "tc/math/Indicators.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace tc {

static constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

std::vector<double> computeSma(const std::vector<Bar>& bars, int period) {
  const int count = static_cast<int>(bars.size());
  std::vector<double> out(bars.size(), kNaN);
  if (period < 1 || count < period) return out;

  double sum = 0.0;
  for (int i = 0; i < count; i++) {
    sum += bars[static_cast<std::size_t>(i)].close;
    if (i >= period) sum -= bars[static_cast<std::size_t>(i - period)].close;
    if (i >= period - 1)
      out[static_cast<std::size_t>(i)] = sum / static_cast<double>(period);
  }
  return out;
}

std::vector<double> computeEma(const std::vector<Bar>& bars, int period) {
  const int count = static_cast<int>(bars.size());
  std::vector<double> out(bars.size(), kNaN);
  if (period < 1 || count < period) return out;

  double seed = 0.0;
  for (int i = 0; i < period; i++) seed += bars[static_cast<std::size_t>(i)].close;
  out[static_cast<std::size_t>(period - 1)] = seed / static_cast<double>(period);

  const double k = 2.0 / (static_cast<double>(period) + 1.0);
  for (int i = period; i < count; i++) {
    auto idx = static_cast<std::size_t>(i);
    out[idx] = bars[idx].close * k + out[idx - 1] * (1.0 - k);
  }
  return out;
}

std::vector<double> computeRsi(const std::vector<Bar>& bars, int period) {
  const int count = static_cast<int>(bars.size());
  std::vector<double> rsi(bars.size(), kNaN);
  if (period < 1 || count < period + 1) return rsi;

  double avgGain = 0.0, avgLoss = 0.0;
  for (int i = 1; i <= period; i++) {
    double change = bars[static_cast<std::size_t>(i)].close -
                    bars[static_cast<std::size_t>(i - 1)].close;
    if (change > 0) avgGain += change;
    else avgLoss -= change;
  }
  avgGain /= static_cast<double>(period);
  avgLoss /= static_cast<double>(period);

  auto value = [](double gain, double loss) {
    if (loss == 0.0) return 100.0;
    return 100.0 - 100.0 / (1.0 + gain / loss);
  };
  rsi[static_cast<std::size_t>(period)] = value(avgGain, avgLoss);

  // Wilder's smoothing
  const double p = static_cast<double>(period);
  for (int i = period + 1; i < count; i++) {
    double change = bars[static_cast<std::size_t>(i)].close -
                    bars[static_cast<std::size_t>(i - 1)].close;
    double gain = change > 0 ? change : 0.0;
    double loss = change < 0 ? -change : 0.0;
    avgGain = (avgGain * (p - 1.0) + gain) / p;
    avgLoss = (avgLoss * (p - 1.0) + loss) / p;
    rsi[static_cast<std::size_t>(i)] = value(avgGain, avgLoss);
  }
  return rsi;
}

BollingerBands computeBollinger(const std::vector<Bar>& bars, int period,
                                double stdDevMultiplier) {
  BollingerBands bands;
  bands.middle = computeSma(bars, period);
  bands.upper.assign(bars.size(), kNaN);
  bands.lower.assign(bars.size(), kNaN);
  if (period < 1) return bands;

  for (std::size_t i = 0; i < bars.size(); i++) {
    double mean = bands.middle[i];
    if (std::isnan(mean)) continue;
    double var = 0.0;
    for (std::size_t j = i + 1 - static_cast<std::size_t>(period); j <= i; j++) {
      double d = bars[j].close - mean;
      var += d * d;
    }
    double sd = std::sqrt(var / static_cast<double>(period));
    bands.upper[i] = mean + stdDevMultiplier * sd;
    bands.lower[i] = mean - stdDevMultiplier * sd;
  }
  return bands;
}

StochasticResult computeStochastic(const std::vector<Bar>& bars,
                                   int kPeriod, int dPeriod) {
  const int count = static_cast<int>(bars.size());
  StochasticResult result;
  result.percentK.assign(bars.size(), kNaN);
  result.percentD.assign(bars.size(), kNaN);
  if (kPeriod < 1 || count < kPeriod) return result;

  for (int i = kPeriod - 1; i < count; i++) {
    double hh = bars[static_cast<std::size_t>(i)].high;
    double ll = bars[static_cast<std::size_t>(i)].low;
    for (int j = i - kPeriod + 1; j < i; j++) {
      const Bar& b = bars[static_cast<std::size_t>(j)];
      if (b.high > hh) hh = b.high;
      if (b.low < ll) ll = b.low;
    }
    double range = hh - ll;
    result.percentK[static_cast<std::size_t>(i)] =
      range > 0.0 ? (bars[static_cast<std::size_t>(i)].close - ll) / range * 100.0 : 50.0;
  }

  if (dPeriod < 1) return result;
  for (int i = kPeriod - 1 + dPeriod - 1; i < count; i++) {
    double sum = 0.0;
    for (int j = i - dPeriod + 1; j <= i; j++)
      sum += result.percentK[static_cast<std::size_t>(j)];
    result.percentD[static_cast<std::size_t>(i)] = sum / static_cast<double>(dPeriod);
  }
  return result;
}

VolumeProfile computeVolumeProfile(const std::vector<Bar>& bars,
                                   double tMin, double tMax,
                                   double pMin, double pMax,
                                   int bins, double valueAreaFraction) {
  VolumeProfile vp;
  if (tMin > tMax) std::swap(tMin, tMax);
  if (pMin > pMax) std::swap(pMin, pMax);
  vp.priceMin = pMin;
  vp.priceMax = pMax;
  if (bins <= 0) return vp;
  vp.binVolume.assign(static_cast<std::size_t>(bins), 0.0);

  double range = pMax - pMin;
  if (!(range > 0.0)) return vp;

  for (const Bar& b : bars) {
    double t = static_cast<double>(b.timestamp);
    if (t < tMin || t > tMax) continue;
    double typical = (b.high + b.low + b.close) / 3.0;
    if (typical < pMin || typical > pMax) continue;
    int bin = static_cast<int>((typical - pMin) / range * bins);
    if (bin >= bins) bin = bins - 1;
    vp.binVolume[static_cast<std::size_t>(bin)] += b.volume;
    vp.totalVolume += b.volume;
  }
  if (vp.totalVolume <= 0.0) return vp;

  vp.pocBin = static_cast<int>(std::max_element(vp.binVolume.begin(), vp.binVolume.end()) -
                               vp.binVolume.begin());

  // Grow from the POC toward the heavier neighbour until the target is met.
  int lo = vp.pocBin, hi = vp.pocBin;
  double acc = vp.binVolume[static_cast<std::size_t>(vp.pocBin)];
  double target = vp.totalVolume * valueAreaFraction;
  while (acc < target && (lo > 0 || hi < bins - 1)) {
    double below = lo > 0 ? vp.binVolume[static_cast<std::size_t>(lo - 1)] : -1.0;
    double above = hi < bins - 1 ? vp.binVolume[static_cast<std::size_t>(hi + 1)] : -1.0;
    if (above >= below) {
      ++hi;
      acc += above;
    } else {
      --lo;
      acc += below;
    }
  }
  vp.valueAreaLow = lo;
  vp.valueAreaHigh = hi;
  return vp;
}

} // namespace tc
