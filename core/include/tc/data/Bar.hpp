#pragma once
#include <cstdint>

namespace tc {

// One OHLCV record. Timestamps are epoch milliseconds.
struct Bar {
  std::int64_t timestamp{0};
  double open{0}, high{0}, low{0}, close{0};
  double volume{0};
};

} // namespace tc
