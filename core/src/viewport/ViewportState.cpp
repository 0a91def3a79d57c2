#include "tc/viewport/ViewportState.hpp"

namespace tc {

const char* timeframeName(Timeframe tf) {
  switch (tf) {
    case Timeframe::OneDay:      return "1D";
    case Timeframe::FiveDays:    return "5D";
    case Timeframe::OneMonth:    return "1M";
    case Timeframe::ThreeMonths: return "3M";
    case Timeframe::SixMonths:   return "6M";
    case Timeframe::OneYear:     return "1Y";
    case Timeframe::YearToDate:  return "YTD";
    case Timeframe::FiveYears:   return "5Y";
    case Timeframe::All:         return "ALL";
    case Timeframe::Custom:      return "Custom";
  }
  return "Custom";
}

bool parseTimeframe(const std::string& name, Timeframe& out) {
  static const Timeframe kRequestable[] = {
    Timeframe::OneDay, Timeframe::FiveDays, Timeframe::OneMonth,
    Timeframe::ThreeMonths, Timeframe::SixMonths, Timeframe::OneYear,
    Timeframe::YearToDate, Timeframe::FiveYears, Timeframe::All
  };
  for (Timeframe tf : kRequestable) {
    if (name == timeframeName(tf)) {
      out = tf;
      return true;
    }
  }
  return false;
}

const char* recommendedInterval(Timeframe tf) {
  switch (tf) {
    case Timeframe::OneDay:      return "5m";
    case Timeframe::FiveDays:    return "15m";
    case Timeframe::OneMonth:    return "1h";
    case Timeframe::ThreeMonths: return "4h";
    case Timeframe::SixMonths:   return "1D";
    case Timeframe::OneYear:     return "1D";
    case Timeframe::YearToDate:  return "1D";
    case Timeframe::FiveYears:   return "1W";
    case Timeframe::All:         return "1M";
    case Timeframe::Custom:      return "1D";
  }
  return "1D";
}

const char* timeAxisLevelName(TimeAxisLevel level) {
  switch (level) {
    case TimeAxisLevel::Minute: return "minute";
    case TimeAxisLevel::Hour:   return "hour";
    case TimeAxisLevel::Day:    return "day";
    case TimeAxisLevel::Month:  return "month";
    case TimeAxisLevel::Year:   return "year";
  }
  return "day";
}

} // namespace tc
