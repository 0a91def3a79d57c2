#pragma once
#include <cstdint>
#include <string>

namespace tc {

enum class Timeframe : std::uint8_t {
  OneDay = 0, FiveDays, OneMonth, ThreeMonths, SixMonths,
  OneYear, YearToDate, FiveYears, All,
  Custom   // set after a manual pan/zoom
};

const char* timeframeName(Timeframe tf);

// Accepts "1D","5D","1M","3M","6M","1Y","YTD","5Y","ALL".
// "Custom" is a state, not a request, and is rejected here.
bool parseTimeframe(const std::string& name, Timeframe& out);

// Bar interval best suited to a period ("5m", "1D", "1W", ...).
const char* recommendedInterval(Timeframe tf);

enum class TimeAxisLevel : std::uint8_t {
  Minute = 0, Hour, Day, Month, Year
};

const char* timeAxisLevelName(TimeAxisLevel level);

// Visible window in fractional bar indices plus the price range and
// canvas size. Bar i is centred at index i.
struct ViewportState {
  double visibleStart{-0.5};
  double visibleEnd{0.5};
  double priceMin{0};
  double priceMax{1};
  int widthPx{800};
  int heightPx{600};
  Timeframe timeframe{Timeframe::OneYear};

  // Derived on every change
  double visibleBars{1};
  double barWidthPx{800};
  double volumeMax{0};
  TimeAxisLevel timeAxisLevel{TimeAxisLevel::Day};
  bool autoScalePrice{true};
};

struct ViewportConfig {
  double minBars{20};
  double maxBars{2000};
  double pricePaddingFraction{0.08};   // above and below the visible extremes
  double zoomSensitivity{0.002};       // wheel: factor = exp(-deltaY * s)
  double defaultBarIntervalMs{86400000.0};
  double volumeHeadroom{1.1};
  double edgeLoadThresholdBars{10};
};

} // namespace tc
