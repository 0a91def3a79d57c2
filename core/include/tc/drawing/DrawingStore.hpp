#pragma once
#include "tc/drawing/DrawingTypes.hpp"
#include "tc/ids/Id.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace tc {

using ObjectHandle = std::shared_ptr<const DrawingObject>;
using ObjectList = std::vector<ObjectHandle>;

// Scene graph of finished drawing objects, in insertion order.
// Objects are immutable once stored: every edit swaps in a fresh handle, so
// an ObjectList taken by snapshot() shares unchanged objects with the live
// list and never sees later edits.
class DrawingStore {
public:
  // Stores `obj`. An empty or already-used id is replaced by a fresh one.
  // Returns the id the object was stored under.
  std::string add(DrawingObject obj);

  // Replace the object with the same id. False when the id is unknown.
  bool replace(const DrawingObject& obj);

  bool remove(const std::string& id);
  void clear();

  const DrawingObject* get(const std::string& id) const;
  ObjectHandle handle(const std::string& id) const;
  bool contains(const std::string& id) const { return indexOf(id) >= 0; }

  const ObjectList& objects() const { return objects_; }
  std::size_t count() const { return objects_.size(); }
  bool empty() const { return objects_.empty(); }

  // Insertion index, or -1.
  int indexOf(const std::string& id) const;

  // zIndex bounds over the stored objects (0 when empty).
  int maxZIndex() const;
  int minZIndex() const;

  ObjectList snapshot() const { return objects_; }

  // Swap in a previously taken snapshot; reseeds id generation.
  void restore(ObjectList objects);

  // Next generated id; does not consume it.
  std::string peekNextId() const { return makeObjectId(nextSerial_); }

private:
  std::string allocateId();
  void reseed();

  ObjectList objects_;
  Serial nextSerial_{1};
};

} // namespace tc
