#pragma once
#include "tc/data/Bar.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace tc {

using BarSeries = std::vector<Bar>;
using BarSnapshot = std::shared_ptr<const BarSeries>;

// Ordered, unique-timestamp bar sequence. Every update swaps in a new
// immutable series, so a snapshot taken by a reader never changes under it.
class BarStore {
public:
  BarStore();

  // Sort, drop non-finite bars, collapse duplicate timestamps (last wins).
  // Returns how many input bars were dropped.
  std::size_t replace(std::vector<Bar> bars);

  // Newer timestamp appends; equal to the last timestamp updates the live bar.
  // Older or non-finite bars are rejected.
  bool append(const Bar& bar);

  void clear();

  BarSnapshot snapshot() const { return bars_; }
  const BarSeries& bars() const { return *bars_; }
  std::size_t size() const { return bars_->size(); }
  bool empty() const { return bars_->empty(); }
  const Bar& at(std::size_t i) const { return (*bars_)[i]; }

  // First index with timestamp >= ts (size() if none).
  std::size_t lowerBound(std::int64_t ts) const;

  // Index of the bar closest in time, or -1 when empty.
  long nearestIndex(std::int64_t ts) const;

  std::uint64_t version() const { return version_; }

private:
  BarSnapshot bars_;
  std::uint64_t version_{0};
};

bool isFiniteBar(const Bar& b);

// Parse `[{"timestamp"|"time": ms, "open":..,"high":..,"low":..,"close":..,
// "volume":..}, ...]` into the store. Returns false on malformed JSON.
bool loadBarsJSON(const std::string& json, BarStore& store);

} // namespace tc
