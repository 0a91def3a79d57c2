#pragma once
#include "tc/drawing/DrawingStore.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>

namespace tc {

// Scene graph state as it was before a committed mutation. `objects`
// shares handles with the live list, so a snapshot costs one pointer per
// object rather than a deep copy.
struct HistorySnapshot {
  std::string description;     // e.g. "Add trendline", "Move", "Delete"
  std::int64_t timestampMs{0};
  ObjectList objects;
};

// Bounded undo/redo over whole scene-graph snapshots.
class DrawingHistory {
public:
  explicit DrawingHistory(std::size_t maxDepth = 100);

  // Drops the oldest entries when the new bound is smaller.
  void setMaxDepth(std::size_t maxDepth);
  std::size_t maxDepth() const { return maxDepth_; }

  // Record the state before a mutation. Clears the redo branch.
  void push(HistorySnapshot before);

  // Swap `live` with the top of the undo (redo) stack. The state being left
  // goes onto the opposite stack under the same description.
  bool undo(ObjectList& live, std::string* description = nullptr);
  bool redo(ObjectList& live, std::string* description = nullptr);

  bool canUndo() const { return !undo_.empty(); }
  bool canRedo() const { return !redo_.empty(); }
  std::size_t undoCount() const { return undo_.size(); }
  std::size_t redoCount() const { return redo_.size(); }

  const std::string& undoDescription() const;
  const std::string& redoDescription() const;

  void clear();

private:
  void trim();

  std::deque<HistorySnapshot> undo_;
  std::deque<HistorySnapshot> redo_;
  std::size_t maxDepth_;
  static const std::string empty_;
};

} // namespace tc
