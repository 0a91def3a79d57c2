#pragma once
#include <cstdint>
#include <string>

namespace tc {

// Drawing objects are keyed by string ids of the form "drawing_<serial>".
// Hosts may import objects with arbitrary ids; only the serial form feeds
// back into id generation.
using Serial = std::uint64_t;

inline constexpr Serial kInvalidSerial = 0;
inline constexpr const char* kObjectIdPrefix = "drawing_";

inline std::string makeObjectId(Serial serial) {
  return std::string(kObjectIdPrefix) + std::to_string(serial);
}

// Returns kInvalidSerial when `id` is not "drawing_<decimal digits>".
inline Serial parseObjectSerial(const std::string& id) {
  const std::string prefix(kObjectIdPrefix);
  if (id.size() <= prefix.size()) return kInvalidSerial;
  if (id.compare(0, prefix.size(), prefix) != 0) return kInvalidSerial;
  Serial v = 0;
  for (std::size_t i = prefix.size(); i < id.size(); ++i) {
    char c = id[i];
    if (c < '0' || c > '9') return kInvalidSerial;
    v = v * 10 + static_cast<Serial>(c - '0');
  }
  return v;
}

} // namespace tc
