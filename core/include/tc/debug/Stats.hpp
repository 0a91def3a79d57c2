#pragma once
#include <cstdint>

namespace tc {

struct Stats {
  // Timing (only collected when EngineConfig::performanceMetrics is set)
  double lastRenderMs = 0.0;

  // Rendering
  std::uint32_t objectsRendered = 0;
  std::uint32_t framesRendered = 0;

  // Interaction
  std::uint64_t hitTests = 0;
  std::uint64_t snapsApplied = 0;
  std::uint64_t historyPushes = 0;
};

} // namespace tc
