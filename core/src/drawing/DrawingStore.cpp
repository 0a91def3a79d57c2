#include "tc/drawing/DrawingStore.hpp"

#include <algorithm>

namespace tc {

std::string DrawingStore::allocateId() {
  std::string id = makeObjectId(nextSerial_++);
  while (contains(id)) id = makeObjectId(nextSerial_++);
  return id;
}

void DrawingStore::reseed() {
  Serial maxSerial = kInvalidSerial;
  for (const auto& h : objects_) maxSerial = std::max(maxSerial, parseObjectSerial(h->id));
  nextSerial_ = maxSerial + 1;
}

std::string DrawingStore::add(DrawingObject obj) {
  if (obj.id.empty() || contains(obj.id)) {
    obj.id = allocateId();
  } else {
    // Keep generated ids ahead of imported ones
    Serial s = parseObjectSerial(obj.id);
    if (s >= nextSerial_) nextSerial_ = s + 1;
  }
  std::string id = obj.id;
  objects_.push_back(std::make_shared<const DrawingObject>(std::move(obj)));
  return id;
}

bool DrawingStore::replace(const DrawingObject& obj) {
  int idx = indexOf(obj.id);
  if (idx < 0) return false;
  objects_[static_cast<std::size_t>(idx)] = std::make_shared<const DrawingObject>(obj);
  return true;
}

bool DrawingStore::remove(const std::string& id) {
  int idx = indexOf(id);
  if (idx < 0) return false;
  objects_.erase(objects_.begin() + idx);
  return true;
}

void DrawingStore::clear() {
  objects_.clear();
}

const DrawingObject* DrawingStore::get(const std::string& id) const {
  int idx = indexOf(id);
  return idx < 0 ? nullptr : objects_[static_cast<std::size_t>(idx)].get();
}

ObjectHandle DrawingStore::handle(const std::string& id) const {
  int idx = indexOf(id);
  return idx < 0 ? ObjectHandle() : objects_[static_cast<std::size_t>(idx)];
}

int DrawingStore::indexOf(const std::string& id) const {
  for (std::size_t i = 0; i < objects_.size(); ++i) {
    if (objects_[i]->id == id) return static_cast<int>(i);
  }
  return -1;
}

int DrawingStore::maxZIndex() const {
  if (objects_.empty()) return 0;
  int z = objects_.front()->zIndex;
  for (const auto& h : objects_) z = std::max(z, h->zIndex);
  return z;
}

int DrawingStore::minZIndex() const {
  if (objects_.empty()) return 0;
  int z = objects_.front()->zIndex;
  for (const auto& h : objects_) z = std::min(z, h->zIndex);
  return z;
}

void DrawingStore::restore(ObjectList objects) {
  objects_ = std::move(objects);
  reseed();
}

} // namespace tc
