#include "tc/drawing/DrawingEngine.hpp"
#include "tc/drawing/DrawingSerializer.hpp"
#include "tc/drawing/HitTester.hpp"
#include "tc/drawing/tools/AdvancedTools.hpp"
#include "tc/render/Color.hpp"
#include "tc/render/RenderContext.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <vector>

namespace tc {

static constexpr double kTwoPi = 6.28318530717958647692;

DrawingEngine::DrawingEngine(Diagnostics& diag)
  : diag_(diag), history_(config_.maxHistory) {}

DrawingEngine::DrawingEngine(const EngineConfig& cfg, Diagnostics& diag)
  : config_(cfg), diag_(diag), history_(cfg.maxHistory) {}

void DrawingEngine::setConfig(const EngineConfig& cfg) {
  config_ = cfg;
  history_.setMaxDepth(cfg.maxHistory);
}

void DrawingEngine::log(LogLevel level, const std::string& message) const {
  if (level < config_.logLevel) return;
  diag_.log(level, message);
}

std::int64_t DrawingEngine::nowMs() const {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

bool DrawingEngine::requireViewport(const char* what) {
  if (viewport_) return true;
  log(LogLevel::Warn, std::string(what) + " ignored: no viewport attached");
  return false;
}

WorldPoint DrawingEngine::sanitizePoint(const WorldPoint& w) const {
  WorldPoint out = w;
  if (!std::isfinite(out.t)) {
    if (viewport_ && !viewport_->bars().empty())
      out.t = static_cast<double>(viewport_->bars().back().timestamp);
    else
      out.t = static_cast<double>(nowMs());
  }
  if (!std::isfinite(out.p)) {
    ViewportState st = viewport_ ? viewport_->state() : ViewportState();
    out.p = (st.priceMin + st.priceMax) * 0.5;
  }
  return out;
}

// ---- Tools ----

void DrawingEngine::setTool(ToolId tool) {
  if (hasDraft_) cancelDraft();
  if (mode_ == InteractionMode::Editing || mode_ == InteractionMode::Resizing) commitGesture();
  mode_ = InteractionMode::Idle;

  if (tool == tool_) return;
  tool_ = tool;
  events_.toolChanged.emit(tool);
  requestRender();
}

ToolId DrawingEngine::setTool(const std::string& id) {
  ToolId tool = parseToolId(id);
  if (tool == ToolId::Select && id != "select")
    log(LogLevel::Warn, "unknown tool '" + id + "', using select");
  setTool(tool);
  return tool;
}

// ---- Input ----

bool DrawingEngine::onPointerDown(double x, double y) {
  if (!requireViewport("pointer down")) return false;
  CoordinateTransform xf = viewport_->transform();
  ScreenPoint s{x, y};
  return handleDown(sanitizePoint(xf.screenToWorld(s)), s, xf);
}

bool DrawingEngine::onPointerMove(double x, double y) {
  if (!requireViewport("pointer move")) return false;
  CoordinateTransform xf = viewport_->transform();
  ScreenPoint s{x, y};
  return handleMove(sanitizePoint(xf.screenToWorld(s)), s, xf);
}

bool DrawingEngine::onPointerUp(double x, double y) {
  (void)x;
  (void)y;
  if (!requireViewport("pointer up")) return false;
  return handleUp(viewport_->transform());
}

bool DrawingEngine::pointerDownAt(const WorldPoint& w) {
  if (!requireViewport("pointer down")) return false;
  CoordinateTransform xf = viewport_->transform();
  WorldPoint p = sanitizePoint(w);
  return handleDown(p, xf.worldToScreen(p), xf);
}

bool DrawingEngine::pointerMoveAt(const WorldPoint& w) {
  if (!requireViewport("pointer move")) return false;
  CoordinateTransform xf = viewport_->transform();
  WorldPoint p = sanitizePoint(w);
  return handleMove(p, xf.worldToScreen(p), xf);
}

bool DrawingEngine::pointerUpAt(const WorldPoint& w) {
  (void)w;
  if (!requireViewport("pointer up")) return false;
  return handleUp(viewport_->transform());
}

bool DrawingEngine::handleDown(const WorldPoint& w, const ScreenPoint& s,
                               const CoordinateTransform& xf) {
  switch (mode_) {
    case InteractionMode::Drawing:
      // Next click of a multi-point tool
      updateDraft(w, xf);
      return true;
    case InteractionMode::Editing:
    case InteractionMode::Resizing:
      // Missed pointer-up; close the previous gesture first
      commitGesture();
      mode_ = InteractionMode::Idle;
      break;
    case InteractionMode::Panning:
    case InteractionMode::Idle:
      mode_ = InteractionMode::Idle;
      break;
  }

  if (tool_ != ToolId::Select) return beginDraft(w, xf);

  HitOptions opts;
  opts.thresholdPx = config_.hitThresholdPx;
  opts.handleRadiusPx = config_.handleRadiusPx;
  opts.selectedId = selectedId_;
  opts.pane = paneId_;
  HitResult hit = HitTester::hitTest(w, xf, store_.objects(), opts);
  ++stats_.hitTests;

  if (!hit.hit()) {
    clearSelection();
    mode_ = InteractionMode::Panning;
    lastPanX_ = s.x;
    return false;
  }

  selectObject(hit.objectId);
  // A selection listener may have removed or replaced the object
  const DrawingObject* obj = store_.get(hit.objectId);
  if (!obj || selectedId_ != hit.objectId) {
    mode_ = InteractionMode::Idle;
    return false;
  }
  gestureBefore_ = store_.snapshot();
  gestureOriginal_ = *obj;
  dragStartWorld_ = w;
  if (hit.isHandle()) {
    mode_ = InteractionMode::Resizing;
    handleIndex_ = hit.handleIndex;
  } else {
    mode_ = InteractionMode::Editing;
    handleIndex_ = -1;
  }
  requestRender();
  return true;
}

bool DrawingEngine::handleMove(const WorldPoint& w, const ScreenPoint& s,
                               const CoordinateTransform& xf) {
  switch (mode_) {
    case InteractionMode::Drawing:
      updateDraft(w, xf);
      return true;

    case InteractionMode::Editing: {
      const DrawingObject* obj = store_.get(selectedId_);
      if (!obj) {
        mode_ = InteractionMode::Idle;
        return false;
      }
      DrawingObject moved = *obj;
      double dt = w.t - dragStartWorld_.t;
      double dp = w.p - dragStartWorld_.p;
      for (auto& p : moved.points) {
        p.t += dt;
        p.p += dp;
      }
      store_.replace(moved);
      dragStartWorld_ = w;
      requestRender();
      return true;
    }

    case InteractionMode::Resizing: {
      const DrawingObject* obj = store_.get(selectedId_);
      if (!obj) {
        mode_ = InteractionMode::Idle;
        return false;
      }
      DrawingObject resized = *obj;
      if (handleIndex_ >= 0 && static_cast<std::size_t>(handleIndex_) < resized.points.size()) {
        resized.points[static_cast<std::size_t>(handleIndex_)] = w;
        store_.replace(resized);
        requestRender();
      }
      return true;
    }

    case InteractionMode::Panning: {
      double dx = s.x - lastPanX_;
      lastPanX_ = s.x;
      if (dx != 0.0) {
        viewport_->panByPixels(dx);
        requestRender();
      }
      return false;
    }

    case InteractionMode::Idle:
      updateHover(w, xf);
      return false;
  }
  return false;
}

bool DrawingEngine::handleUp(const CoordinateTransform& xf) {
  (void)xf;
  switch (mode_) {
    case InteractionMode::Drawing:
      return finishDraft();
    case InteractionMode::Editing:
    case InteractionMode::Resizing:
      commitGesture();
      mode_ = InteractionMode::Idle;
      return true;
    case InteractionMode::Panning:
      mode_ = InteractionMode::Idle;
      return false;
    case InteractionMode::Idle:
      return false;
  }
  return false;
}

void DrawingEngine::updateHover(const WorldPoint& w, const CoordinateTransform& xf) {
  HitOptions opts;
  opts.thresholdPx = config_.hitThresholdPx;
  opts.handleRadiusPx = config_.handleRadiusPx;
  opts.selectedId = selectedId_;
  opts.pane = paneId_;
  HitResult hit = HitTester::hitTest(w, xf, store_.objects(), opts);
  ++stats_.hitTests;
  if (hit.objectId == hoveredId_) return;
  hoveredId_ = hit.objectId;
  requestRender();
}

bool DrawingEngine::onKey(const KeyEvent& ev) {
  bool command = ev.ctrl || ev.meta;

  switch (ev.code) {
    case KeyCode::Escape:
      return escape();

    case KeyCode::Delete:
    case KeyCode::Backspace:
      if (selectedId_.empty()) return false;
      return deleteSelected();

    case KeyCode::Character:
      if (command) {
        if (ev.ch == 'z' && !ev.shift) {
          undo();
          return true;
        }
        if ((ev.ch == 'z' && ev.shift) || ev.ch == 'y') {
          redo();
          return true;
        }
        return false;
      }
      if (ev.alt) return false;
      {
        ToolId tool = toolForShortcut(ev.ch);
        if (tool == ToolId::Select) return false;
        setTool(tool);
        return true;
      }

    case KeyCode::Left:
    case KeyCode::Right:
    case KeyCode::Up:
    case KeyCode::Down:
    case KeyCode::Home:
    case KeyCode::End:
      if (!viewport_ || mode_ != InteractionMode::Idle) return false;
      if (keyboardNav_.processKey(ev.code, *viewport_)) {
        requestRender();
        return true;
      }
      return false;

    case KeyCode::Enter:
    case KeyCode::None:
      return false;
  }
  return false;
}

bool DrawingEngine::escape() {
  if (hasDraft_) {
    cancelDraft();
    return true;
  }
  if (mode_ == InteractionMode::Editing || mode_ == InteractionMode::Resizing) revertGesture();
  mode_ = InteractionMode::Idle;

  if (!selectedId_.empty()) {
    clearSelection();
    return true;
  }
  if (tool_ != ToolId::Select) {
    setTool(ToolId::Select);
    return true;
  }
  return false;
}

// ---- Drafting ----

SnapResult DrawingEngine::snapPoint(const WorldPoint& w, const CoordinateTransform& xf) {
  lastSnap_ = Snapper::snap(w, xf, config_.snap, store_.objects(), std::string(), paneId_);
  if (lastSnap_.snapped()) ++stats_.snapsApplied;
  return lastSnap_;
}

bool DrawingEngine::beginDraft(const WorldPoint& w, const CoordinateTransform& xf) {
  const DrawingTool* tool = toolFor(tool_);
  if (!tool) return false;
  if (store_.count() >= config_.maxObjects) {
    log(LogLevel::Warn, "scene is full (" + std::to_string(config_.maxObjects) + " objects)");
    return false;
  }

  SnapResult snap = snapPoint(w, xf);
  draft_ = tool->onStart(snap.point, config_.defaultStyle);
  if (draft_.paneId != PaneId::Full) draft_.paneId = paneId_;
  hasDraft_ = true;
  mode_ = InteractionMode::Drawing;
  requestRender();
  return true;
}

void DrawingEngine::updateDraft(const WorldPoint& w, const CoordinateTransform& xf) {
  if (!hasDraft_) return;
  SnapResult snap = snapPoint(w, xf);
  toolFor(draft_.type).onUpdate(draft_, snap.point);
  requestRender();
}

bool DrawingEngine::finishDraft() {
  if (!hasDraft_) {
    mode_ = InteractionMode::Idle;
    return false;
  }
  const DrawingTool& tool = toolFor(draft_.type);
  std::size_t n = draft_.points.size();
  std::size_t minPts = static_cast<std::size_t>(tool.minPoints());

  if (n < minPts) {
    if (n >= 2) {
      // Multi-click tool: pin this point and start the next one
      draft_.points.push_back(draft_.points.back());
      requestRender();
      return true;
    }
    cancelDraft();
    return true;
  }

  DrawingObject obj = std::move(draft_);
  hasDraft_ = false;
  draft_ = DrawingObject();
  mode_ = InteractionMode::Idle;
  lastSnap_ = SnapResult();

  tool.onComplete(obj);
  std::string id = insertObject(std::move(obj), std::string("Add ") + tool.id());
  if (id.empty()) {
    requestRender();
    return true;
  }

  const DrawingObject* created = store_.get(id);
  if (created && created->type == DrawingType::Text) events_.textEditRequested.emit(*created);
  if (tool.autoResetToSelect()) setTool(ToolId::Select);
  return true;
}

void DrawingEngine::cancelDraft() {
  hasDraft_ = false;
  draft_ = DrawingObject();
  lastSnap_ = SnapResult();
  mode_ = InteractionMode::Idle;
  requestRender();
}

void DrawingEngine::commitGesture() {
  const DrawingObject* now = store_.get(gestureOriginal_.id);
  if (now && *now != gestureOriginal_) {
    pushHistory(mode_ == InteractionMode::Resizing ? "Resize" : "Move", std::move(gestureBefore_));
    events_.objectUpdated.emit(*now);
    requestRender();
  }
  gestureBefore_.clear();
  handleIndex_ = -1;
}

void DrawingEngine::revertGesture() {
  if (store_.contains(gestureOriginal_.id)) store_.replace(gestureOriginal_);
  gestureBefore_.clear();
  handleIndex_ = -1;
  requestRender();
}

// ---- Objects ----

bool DrawingEngine::normalizeObject(DrawingObject& obj, const char* context) const {
  const DrawingTool& tool = toolFor(obj.type);
  std::size_t minPts = static_cast<std::size_t>(tool.minPoints());
  std::size_t maxPts = static_cast<std::size_t>(tool.maxPoints());

  if (obj.points.size() < minPts) {
    char buf[160];
    std::snprintf(buf, sizeof(buf), "%s: %s needs %zu points, got %zu; dropped",
                  context, tool.id(), minPts, obj.points.size());
    log(LogLevel::Warn, buf);
    return false;
  }
  if (obj.points.size() > maxPts) obj.points.resize(maxPts);

  for (auto& p : obj.points) {
    if (std::isfinite(p.t) && std::isfinite(p.p)) continue;
    p = sanitizePoint(p);
    log(LogLevel::Warn, std::string(context) + ": non-finite point in " +
                        (obj.id.empty() ? std::string(tool.id()) : obj.id) + " replaced");
  }

  if (obj.type == DrawingType::VolumeProfile) {
    auto it = obj.meta.find("bins");
    if (it != obj.meta.end()) {
      int bins = VolumeProfileTool::binCount(obj);
      if (it->second.kind != MetaValue::Kind::Number || it->second.number != bins) {
        it->second = MetaValue::ofNumber(bins);
        log(LogLevel::Warn, std::string(context) + ": bins of " +
                            (obj.id.empty() ? std::string(tool.id()) : obj.id) + " set to " +
                            std::to_string(bins));
      }
    }
  }
  return true;
}

std::string DrawingEngine::insertObject(DrawingObject obj, const std::string& description) {
  if (store_.count() >= config_.maxObjects) {
    log(LogLevel::Warn, "scene is full (" + std::to_string(config_.maxObjects) + " objects)");
    return std::string();
  }
  if (!normalizeObject(obj, "add")) return std::string();
  if (obj.zIndex == 0) obj.zIndex = store_.empty() ? 1 : store_.maxZIndex() + 1;

  ObjectList before = store_.snapshot();
  std::string id = store_.add(std::move(obj));
  pushHistory(description, std::move(before));

  events_.objectCreated.emit(*store_.get(id));
  requestRender();
  return id;
}

std::string DrawingEngine::addObject(DrawingObject obj) {
  std::string description = std::string("Add ") + drawingTypeId(obj.type);
  return insertObject(std::move(obj), description);
}

bool DrawingEngine::updateObject(const DrawingObject& obj) {
  const DrawingObject* existing = store_.get(obj.id);
  if (!existing) {
    log(LogLevel::Warn, "update ignored: no object '" + obj.id + "'");
    return false;
  }
  DrawingObject next = obj;
  if (!normalizeObject(next, "update")) return false;
  if (next == *existing) return true;

  ObjectList before = store_.snapshot();
  store_.replace(next);
  pushHistory("Update", std::move(before));

  if (!next.visible && hoveredId_ == next.id) hoveredId_.clear();
  events_.objectUpdated.emit(*store_.get(next.id));
  requestRender();
  return true;
}

bool DrawingEngine::setObjectText(const std::string& id, const std::string& text) {
  const DrawingObject* obj = store_.get(id);
  if (!obj) return false;
  DrawingObject next = *obj;
  next.meta["text"] = MetaValue::ofText(text);
  return updateObject(next);
}

bool DrawingEngine::deleteObject(const std::string& id) {
  if (!store_.contains(id)) return false;
  ObjectList before = store_.snapshot();
  store_.remove(id);
  pushHistory("Delete", std::move(before));

  if (hoveredId_ == id) hoveredId_.clear();
  if (selectedId_ == id) clearSelection();
  events_.objectDeleted.emit(id);
  requestRender();
  return true;
}

bool DrawingEngine::deleteSelected() {
  if (selectedId_.empty()) return false;
  std::string id = selectedId_;
  return deleteObject(id);
}

bool DrawingEngine::clearAll() {
  if (store_.empty()) return false;
  std::vector<std::string> ids;
  for (const auto& h : store_.objects()) ids.push_back(h->id);

  ObjectList before = store_.snapshot();
  store_.clear();
  pushHistory("Clear all", std::move(before));

  hoveredId_.clear();
  clearSelection();
  for (const auto& id : ids) events_.objectDeleted.emit(id);
  requestRender();
  return true;
}

bool DrawingEngine::selectObject(const std::string& id) {
  if (id.empty()) {
    clearSelection();
    return true;
  }
  if (!store_.contains(id)) return false;
  if (selectedId_ == id) return true;
  selectedId_ = id;
  events_.objectSelected.emit(selectedId_);
  requestRender();
  return true;
}

void DrawingEngine::clearSelection() {
  if (selectedId_.empty()) return;
  selectedId_.clear();
  events_.objectSelected.emit(selectedId_);
  requestRender();
}

bool DrawingEngine::setObjectLocked(const std::string& id, bool locked) {
  const DrawingObject* obj = store_.get(id);
  if (!obj) return false;
  DrawingObject next = *obj;
  next.locked = locked;
  return updateObject(next);
}

bool DrawingEngine::setObjectVisible(const std::string& id, bool visible) {
  const DrawingObject* obj = store_.get(id);
  if (!obj) return false;
  DrawingObject next = *obj;
  next.visible = visible;
  if (!updateObject(next)) return false;
  if (!visible && selectedId_ == id) clearSelection();
  return true;
}

bool DrawingEngine::bringToFront(const std::string& id) {
  const DrawingObject* obj = store_.get(id);
  if (!obj) return false;
  int top = store_.maxZIndex();
  bool alone = true;
  for (const auto& h : store_.objects()) {
    if (h->id != id && h->zIndex == top) alone = false;
  }
  if (obj->zIndex == top && alone) return true;
  DrawingObject next = *obj;
  next.zIndex = top + 1;
  return updateObject(next);
}

bool DrawingEngine::sendToBack(const std::string& id) {
  const DrawingObject* obj = store_.get(id);
  if (!obj) return false;
  int bottom = store_.minZIndex();
  bool alone = true;
  for (const auto& h : store_.objects()) {
    if (h->id != id && h->zIndex == bottom) alone = false;
  }
  if (obj->zIndex == bottom && alone) return true;
  DrawingObject next = *obj;
  next.zIndex = bottom - 1;
  return updateObject(next);
}

// ---- History ----

void DrawingEngine::pushHistory(const std::string& description, ObjectList before) {
  HistorySnapshot snap;
  snap.description = description;
  snap.timestampMs = nowMs();
  snap.objects = std::move(before);
  history_.push(std::move(snap));
  ++stats_.historyPushes;
  log(LogLevel::Debug, "history: " + description);
}

void DrawingEngine::afterHistoryJump(const char* verb, const std::string& description) {
  if (mode_ == InteractionMode::Editing || mode_ == InteractionMode::Resizing ||
      mode_ == InteractionMode::Panning) {
    gestureBefore_.clear();
    mode_ = InteractionMode::Idle;
  }
  if (!hoveredId_.empty() && !store_.contains(hoveredId_)) hoveredId_.clear();
  if (!selectedId_.empty() && !store_.contains(selectedId_)) clearSelection();
  log(LogLevel::Info, std::string(verb) + ": " + description);
  requestRender();
}

bool DrawingEngine::undo() {
  ObjectList live = store_.snapshot();
  std::string description;
  if (!history_.undo(live, &description)) return false;
  store_.restore(std::move(live));
  afterHistoryJump("undo", description);
  return true;
}

bool DrawingEngine::redo() {
  ObjectList live = store_.snapshot();
  std::string description;
  if (!history_.redo(live, &description)) return false;
  store_.restore(std::move(live));
  afterHistoryJump("redo", description);
  return true;
}

// ---- Persistence ----

std::string DrawingEngine::exportObjects() const {
  return writeDrawingDocument(store_.objects(), nowMs());
}

bool DrawingEngine::importObjects(const std::string& json) {
  DrawingDocument doc;
  if (!parseDrawingDocument(json, doc)) {
    log(LogLevel::Warn, "import rejected: expected an object with an 'objects' array");
    return false;
  }
  for (const auto& reason : doc.skipped) log(LogLevel::Warn, "import dropped " + reason);

  DrawingStore incoming;
  for (auto& obj : doc.objects) {
    if (incoming.count() >= config_.maxObjects) {
      log(LogLevel::Warn, "import truncated at " + std::to_string(config_.maxObjects) + " objects");
      break;
    }
    if (!normalizeObject(obj, "import")) continue;
    incoming.add(std::move(obj));
  }

  ObjectList before = store_.snapshot();
  store_.restore(incoming.snapshot());
  pushHistory("Import", std::move(before));

  hoveredId_.clear();
  clearSelection();
  requestRender();
  return true;
}

// ---- Rendering ----

void DrawingEngine::render(RenderSink& sink) {
  if (!viewport_) return;
  auto t0 = std::chrono::steady_clock::now();
  CoordinateTransform xf = viewport_->transform();

  const ObjectList& objs = store_.objects();
  std::vector<std::size_t> order(objs.size());
  for (std::size_t i = 0; i < order.size(); ++i) order[i] = i;
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
    return objs[a]->zIndex < objs[b]->zIndex;
  });

  std::uint32_t drawn = 0;
  for (std::size_t i : order) {
    const DrawingObject& obj = *objs[i];
    if (!obj.visible) continue;
    if (!onPane(obj, paneId_)) continue;
    RenderContext rc{sink, xf};
    rc.selected = obj.id == selectedId_;
    rc.hovered = obj.id == hoveredId_;
    toolFor(obj.type).render(obj, rc);
    ++drawn;
  }

  if (hasDraft_) {
    RenderContext rc{sink, xf};
    rc.alpha = config_.draftOpacity;
    toolFor(draft_.type).render(draft_, rc);
  }

  if (!selectedId_.empty()) {
    const DrawingObject* sel = store_.get(selectedId_);
    if (sel && sel->visible && !sel->locked) renderHandles(sink, xf, *sel);
  }

  if (hasDraft_ && lastSnap_.snapped()) renderSnapIndicator(sink, xf);

  stats_.objectsRendered = drawn;
  ++stats_.framesRendered;
  if (config_.performanceMetrics) {
    auto t1 = std::chrono::steady_clock::now();
    stats_.lastRenderMs = std::chrono::duration<double, std::milli>(t1 - t0).count();
    diag_.metric("drawing.render", stats_.lastRenderMs);
  }
}

void DrawingEngine::renderHandles(RenderSink& sink, const CoordinateTransform& xf,
                                  const DrawingObject& obj) {
  static const float kFallback[4] = {0.055f, 0.647f, 0.914f, 1.0f};
  static const float kWhite[4] = {1.0f, 1.0f, 1.0f, 1.0f};
  float fill[4];
  parseColorOr(obj.style.color, kFallback, fill);

  sink.save();
  sink.setGlobalAlpha(1.0);
  sink.setLineDash({});
  sink.setFillColor(fill);
  sink.setStrokeColor(kWhite);
  sink.setLineWidth(2.0);
  for (const auto& p : obj.points) {
    ScreenPoint s = xf.worldToScreen(p);
    sink.beginPath();
    sink.arc(s.x, s.y, config_.handleRadiusPx, 0.0, kTwoPi);
    sink.fill();
    sink.stroke();
  }
  sink.restore();
}

void DrawingEngine::renderSnapIndicator(RenderSink& sink, const CoordinateTransform& xf) {
  // time blue, price green, object amber
  const char* hex = lastSnap_.object ? "#F59E0B" : (lastSnap_.price ? "#10B981" : "#3B82F6");
  static const float kGrey[4] = {0.5f, 0.5f, 0.5f, 1.0f};
  float rgba[4];
  parseColorOr(hex, kGrey, rgba);

  ScreenPoint s = xf.worldToScreen(lastSnap_.point);
  sink.save();
  sink.setStrokeColor(rgba);
  sink.setLineWidth(2.0);
  sink.setLineDash({});
  sink.setGlobalAlpha(0.8);
  if (lastSnap_.time || lastSnap_.price) {
    sink.beginPath();
    sink.moveTo(s.x - 8.0, s.y);
    sink.lineTo(s.x + 8.0, s.y);
    sink.moveTo(s.x, s.y - 8.0);
    sink.lineTo(s.x, s.y + 8.0);
    sink.stroke();
  }
  sink.beginPath();
  sink.arc(s.x, s.y, 4.0, 0.0, kTwoPi);
  sink.stroke();
  sink.restore();
}

} // namespace tc
