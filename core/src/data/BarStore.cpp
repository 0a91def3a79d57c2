#include "tc/data/BarStore.hpp"

#include <algorithm>
#include <cmath>
#include <rapidjson/document.h>

namespace tc {

BarStore::BarStore() : bars_(std::make_shared<const BarSeries>()) {}

bool isFiniteBar(const Bar& b) {
  return std::isfinite(b.open) && std::isfinite(b.high) &&
         std::isfinite(b.low) && std::isfinite(b.close) &&
         std::isfinite(b.volume);
}

std::size_t BarStore::replace(std::vector<Bar> bars) {
  const std::size_t inputCount = bars.size();

  bars.erase(std::remove_if(bars.begin(), bars.end(),
               [](const Bar& b) { return !isFiniteBar(b); }),
             bars.end());

  std::stable_sort(bars.begin(), bars.end(),
    [](const Bar& a, const Bar& b) { return a.timestamp < b.timestamp; });

  auto series = std::make_shared<BarSeries>();
  series->reserve(bars.size());
  for (const auto& b : bars) {
    if (!series->empty() && series->back().timestamp == b.timestamp)
      series->back() = b;
    else
      series->push_back(b);
  }

  const std::size_t dropped = inputCount - series->size();
  bars_ = std::move(series);
  ++version_;
  return dropped;
}

bool BarStore::append(const Bar& bar) {
  if (!isFiniteBar(bar)) return false;
  if (!bars_->empty() && bar.timestamp < bars_->back().timestamp) return false;

  auto series = std::make_shared<BarSeries>(*bars_);
  if (!series->empty() && series->back().timestamp == bar.timestamp)
    series->back() = bar;
  else
    series->push_back(bar);

  bars_ = std::move(series);
  ++version_;
  return true;
}

void BarStore::clear() {
  bars_ = std::make_shared<const BarSeries>();
  ++version_;
}

std::size_t BarStore::lowerBound(std::int64_t ts) const {
  auto it = std::lower_bound(bars_->begin(), bars_->end(), ts,
    [](const Bar& b, std::int64_t t) { return b.timestamp < t; });
  return static_cast<std::size_t>(it - bars_->begin());
}

long BarStore::nearestIndex(std::int64_t ts) const {
  if (bars_->empty()) return -1;
  std::size_t i = lowerBound(ts);
  if (i >= bars_->size()) return static_cast<long>(bars_->size() - 1);
  if (i == 0) return 0;
  std::int64_t dNext = (*bars_)[i].timestamp - ts;
  std::int64_t dPrev = ts - (*bars_)[i - 1].timestamp;
  return static_cast<long>(dPrev <= dNext ? i - 1 : i);
}

static bool readNumber(const rapidjson::Value& v, const char* key, double& out) {
  if (!v.HasMember(key) || !v[key].IsNumber()) return false;
  out = v[key].GetDouble();
  return true;
}

bool loadBarsJSON(const std::string& json, BarStore& store) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsArray()) return false;

  std::vector<Bar> bars;
  bars.reserve(doc.Size());
  for (const auto& v : doc.GetArray()) {
    if (!v.IsObject()) return false;
    Bar b;
    double ts = 0;
    if (!readNumber(v, "timestamp", ts) && !readNumber(v, "time", ts))
      return false;
    b.timestamp = static_cast<std::int64_t>(ts);
    if (!readNumber(v, "open", b.open)) return false;
    if (!readNumber(v, "high", b.high)) return false;
    if (!readNumber(v, "low", b.low)) return false;
    if (!readNumber(v, "close", b.close)) return false;
    if (!readNumber(v, "volume", b.volume)) b.volume = 0.0; // optional
    bars.push_back(b);
  }

  store.replace(std::move(bars));
  return true;
}

} // namespace tc
