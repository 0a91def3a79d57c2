#pragma once
#include "tc/drawing/DrawingTypes.hpp"
#include "tc/drawing/ToolRegistry.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace tc {

using SubscriptionId = std::uint64_t;

// Listeners for one event signature. Emission walks a copy of the list, so
// a callback may unsubscribe itself (or others) while being called.
template <typename... Args>
class CallbackList {
public:
  using Callback = std::function<void(Args...)>;

  SubscriptionId subscribe(Callback cb) {
    SubscriptionId id = nextId_++;
    entries_.push_back(Entry{id, std::move(cb)});
    return id;
  }

  bool unsubscribe(SubscriptionId id) {
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
      if (it->id == id) {
        entries_.erase(it);
        return true;
      }
    }
    return false;
  }

  void emit(Args... args) const {
    std::vector<Entry> snapshot = entries_;
    for (const auto& e : snapshot) {
      if (e.cb) e.cb(args...);
    }
  }

  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  void clear() { entries_.clear(); }

private:
  struct Entry {
    SubscriptionId id;
    Callback cb;
  };

  std::vector<Entry> entries_;
  SubscriptionId nextId_{1};
};

// Notifications from the drawing engine, delivered synchronously in the
// order the mutations happened.
struct DrawingEvents {
  CallbackList<const DrawingObject&> objectCreated;
  CallbackList<const DrawingObject&> objectUpdated;
  CallbackList<const std::string&> objectDeleted;
  CallbackList<const std::string&> objectSelected;    // empty id = cleared
  CallbackList<ToolId> toolChanged;
  CallbackList<> needsRender;

  // A text object was placed with placeholder text; the host collects the
  // real text and calls setObjectText / updateObject.
  CallbackList<const DrawingObject&> textEditRequested;

  void clear() {
    objectCreated.clear();
    objectUpdated.clear();
    objectDeleted.clear();
    objectSelected.clear();
    toolChanged.clear();
    needsRender.clear();
    textEditRequested.clear();
  }
};

} // namespace tc
