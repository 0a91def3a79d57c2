// T3.2: Overlay indicators and the volume-at-price profile

#include "tc/math/Indicators.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static bool approx(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) < eps;
}

static std::vector<tc::Bar> fromCloses(const std::vector<double>& closes) {
  std::vector<tc::Bar> bars;
  for (std::size_t i = 0; i < closes.size(); i++) {
    tc::Bar b;
    b.timestamp = static_cast<std::int64_t>(i);
    b.open = closes[i];
    b.close = closes[i];
    b.high = closes[i] + 1.0;
    b.low = closes[i] - 1.0;
    b.volume = 100.0;
    bars.push_back(b);
  }
  return bars;
}

int main() {
  // closes 1..10
  std::vector<double> ramp;
  for (int i = 1; i <= 10; i++) ramp.push_back(i);
  auto bars = fromCloses(ramp);

  // ---- Test 1: SMA ----
  {
    auto sma = tc::computeSma(bars, 3);
    requireTrue(sma.size() == 10, "aligned to bars");
    requireTrue(std::isnan(sma[0]) && std::isnan(sma[1]), "warm-up is NaN");
    requireTrue(approx(sma[2], 2.0), "mean of 1,2,3");
    requireTrue(approx(sma[9], 9.0), "mean of 8,9,10");

    auto tooShort = tc::computeSma(bars, 20);
    requireTrue(std::isnan(tooShort[9]), "period longer than series");
    std::printf("  Test 1 (sma): PASS\n");
  }

  // ---- Test 2: EMA ----
  {
    auto ema = tc::computeEma(bars, 3);
    requireTrue(std::isnan(ema[1]), "warm-up is NaN");
    requireTrue(approx(ema[2], 2.0), "seeded with the SMA");
    requireTrue(approx(ema[3], 3.0), "k = 0.5");
    requireTrue(approx(ema[9], 9.0), "lags a ramp by one bar");
    std::printf("  Test 2 (ema): PASS\n");
  }

  // ---- Test 3: RSI ----
  {
    auto rising = tc::computeRsi(bars, 3);
    requireTrue(std::isnan(rising[2]), "first period values NaN");
    requireTrue(approx(rising[3], 100.0), "no losses -> 100");

    auto zigzag = tc::computeRsi(fromCloses({10, 11, 10, 11, 10, 11}), 2);
    requireTrue(approx(zigzag[2], 50.0), "equal gains and losses -> 50");
    for (std::size_t i = 2; i < zigzag.size(); i++)
      requireTrue(zigzag[i] >= 0.0 && zigzag[i] <= 100.0, "bounded");
    std::printf("  Test 3 (rsi): PASS\n");
  }

  // ---- Test 4: Bollinger bands ----
  {
    auto bands = tc::computeBollinger(fromCloses({1, 2, 3, 4, 5}), 5, 2.0);
    requireTrue(std::isnan(bands.upper[3]), "warm-up");
    requireTrue(approx(bands.middle[4], 3.0), "middle is the SMA");
    requireTrue(approx(bands.upper[4], 3.0 + 2.0 * std::sqrt(2.0)), "upper = mean + 2 sd");
    requireTrue(approx(bands.lower[4], 3.0 - 2.0 * std::sqrt(2.0)), "lower = mean - 2 sd");

    auto flat = tc::computeBollinger(fromCloses({5, 5, 5, 5}), 2, 2.0);
    requireTrue(approx(flat.upper[3], 5.0) && approx(flat.lower[3], 5.0), "zero spread");
    std::printf("  Test 4 (bollinger): PASS\n");
  }

  // ---- Test 5: Stochastic ----
  {
    auto st = tc::computeStochastic(bars, 3, 3);
    requireTrue(std::isnan(st.percentK[1]), "K warm-up");
    requireTrue(approx(st.percentK[2], 75.0), "close 3 in range [0, 4]");
    requireTrue(std::isnan(st.percentD[3]), "D warm-up");
    requireTrue(approx(st.percentD[4], 75.0), "D averages K");
    std::printf("  Test 5 (stochastic): PASS\n");
  }

  // ---- Test 6: volume profile ----
  {
    auto vbars = bars;
    vbars[4].volume = 1000.0;   // close 5

    tc::VolumeProfile vp = tc::computeVolumeProfile(vbars, 0, 9, 0, 10, 10, 0.7);
    requireTrue(vp.binVolume.size() == 10, "bin count");
    requireTrue(approx(vp.totalVolume, 1900.0), "all bars counted");
    requireTrue(vp.pocBin == 5, "point of control at close 5");
    requireTrue(approx(vp.binVolume[9], 200.0), "top price clamps into last bin");
    requireTrue(vp.valueAreaLow <= vp.pocBin && vp.valueAreaHigh >= vp.pocBin, "area covers poc");

    double inArea = 0.0;
    for (int i = vp.valueAreaLow; i <= vp.valueAreaHigh; i++)
      inArea += vp.binVolume[static_cast<std::size_t>(i)];
    requireTrue(inArea >= 0.7 * vp.totalVolume, "value area holds 70%");

    tc::VolumeProfile part = tc::computeVolumeProfile(vbars, 4, 0, 10, 0, 10, 0.7);
    requireTrue(approx(part.totalVolume, 1400.0), "time window filter (swapped bounds)");

    tc::VolumeProfile none = tc::computeVolumeProfile(vbars, 100, 200, 0, 10, 10, 0.7);
    requireTrue(none.pocBin == -1, "no volume -> no poc");
    std::printf("  Test 6 (volume profile): PASS\n");
  }

  std::printf("T3.2 indicators: ALL PASS\n");
  return 0;
}
