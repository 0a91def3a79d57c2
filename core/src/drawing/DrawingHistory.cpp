#include "tc/drawing/DrawingHistory.hpp"

namespace tc {

const std::string DrawingHistory::empty_;

DrawingHistory::DrawingHistory(std::size_t maxDepth)
  : maxDepth_(maxDepth > 0 ? maxDepth : 1) {}

void DrawingHistory::setMaxDepth(std::size_t maxDepth) {
  maxDepth_ = maxDepth > 0 ? maxDepth : 1;
  trim();
  while (redo_.size() > maxDepth_) redo_.pop_front();
}

void DrawingHistory::trim() {
  while (undo_.size() > maxDepth_) undo_.pop_front();
}

void DrawingHistory::push(HistorySnapshot before) {
  undo_.push_back(std::move(before));
  redo_.clear();
  trim();
}

bool DrawingHistory::undo(ObjectList& live, std::string* description) {
  if (undo_.empty()) return false;
  HistorySnapshot prev = std::move(undo_.back());
  undo_.pop_back();

  HistorySnapshot current{prev.description, prev.timestampMs, std::move(live)};
  live = std::move(prev.objects);
  if (description) *description = current.description;
  redo_.push_back(std::move(current));
  return true;
}

bool DrawingHistory::redo(ObjectList& live, std::string* description) {
  if (redo_.empty()) return false;
  HistorySnapshot next = std::move(redo_.back());
  redo_.pop_back();

  HistorySnapshot current{next.description, next.timestampMs, std::move(live)};
  live = std::move(next.objects);
  if (description) *description = current.description;
  undo_.push_back(std::move(current));
  trim();
  return true;
}

const std::string& DrawingHistory::undoDescription() const {
  return undo_.empty() ? empty_ : undo_.back().description;
}

const std::string& DrawingHistory::redoDescription() const {
  return redo_.empty() ? empty_ : redo_.back().description;
}

void DrawingHistory::clear() {
  undo_.clear();
  redo_.clear();
}

} // namespace tc
