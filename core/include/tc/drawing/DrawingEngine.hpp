#pragma once
#include "tc/config/EngineConfig.hpp"
#include "tc/debug/Diagnostics.hpp"
#include "tc/debug/Stats.hpp"
#include "tc/drawing/DrawingEvents.hpp"
#include "tc/drawing/DrawingHistory.hpp"
#include "tc/drawing/DrawingStore.hpp"
#include "tc/drawing/Snapper.hpp"
#include "tc/drawing/ToolRegistry.hpp"
#include "tc/render/RenderSink.hpp"
#include "tc/viewport/InputState.hpp"
#include "tc/viewport/KeyboardNav.hpp"
#include "tc/viewport/ViewportManager.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace tc {

// Interactive annotation layer over a chart viewport.
//
// Pointer input drives a small state machine:
//   idle -> drawing   pointer-down with a drawing tool (onStart)
//   drawing           pointer-move updates the draft (onUpdate)
//   drawing -> idle   pointer-up completes or discards the draft
//   idle -> editing   pointer-down on an object body (select tool)
//   idle -> resizing  pointer-down on a handle of the selected object
//   idle -> panning   pointer-down on empty space (select tool)
//
// Every committed mutation pushes the previous scene graph onto the undo
// history. All work happens synchronously on the caller's thread.
class DrawingEngine {
public:
  explicit DrawingEngine(Diagnostics& diag = nullDiagnostics());
  DrawingEngine(const EngineConfig& cfg, Diagnostics& diag);

  void setConfig(const EngineConfig& cfg);
  const EngineConfig& config() const { return config_; }
  void setSnapConfig(const SnapConfig& snap) { config_.snap = snap; }
  void setDefaultStyle(const DrawingStyle& style) { config_.defaultStyle = style; }
  void setKeyboardNavConfig(const KeyboardNavConfig& cfg) { keyboardNav_.setConfig(cfg); }

  // The engine reads coordinates through the viewport and drives it for
  // drag-to-pan and keyboard navigation. Not owned.
  void attachViewport(ViewportManager* viewport) { viewport_ = viewport; }
  ViewportManager* viewport() const { return viewport_; }

  // Pane the host is rendering; objects on other panes (except `full`) are
  // skipped and new drafts are created on it.
  void setPaneId(PaneId pane) { paneId_ = pane; }
  PaneId paneId() const { return paneId_; }

  // ---- Tools ----
  void setTool(ToolId tool);
  ToolId setTool(const std::string& id);   // unknown ids fall back to select
  ToolId tool() const { return tool_; }
  InteractionMode mode() const { return mode_; }

  // ---- Input ----
  // Screen-space handlers. Return true when the engine claimed the input,
  // in which case the host must not pan or zoom in response to it.
  bool onPointerDown(double x, double y);
  bool onPointerMove(double x, double y);
  bool onPointerUp(double x, double y);

  // Same, for hosts that already hold world coordinates.
  bool pointerDownAt(const WorldPoint& w);
  bool pointerMoveAt(const WorldPoint& w);
  bool pointerUpAt(const WorldPoint& w);

  bool onKey(const KeyEvent& ev);

  // Cancel the draft, else clear the selection, else return to select.
  bool escape();

  // ---- Objects ----
  // Validates point count, repairs non-finite points, assigns id and
  // zIndex. Returns the stored id, or empty when rejected.
  std::string addObject(DrawingObject obj);
  bool updateObject(const DrawingObject& obj);
  bool setObjectText(const std::string& id, const std::string& text);
  bool deleteObject(const std::string& id);
  bool deleteSelected();
  bool clearAll();

  bool selectObject(const std::string& id);
  void clearSelection();
  const std::string& selectedId() const { return selectedId_; }
  const std::string& hoveredId() const { return hoveredId_; }

  bool setObjectLocked(const std::string& id, bool locked);
  bool setObjectVisible(const std::string& id, bool visible);
  bool bringToFront(const std::string& id);
  bool sendToBack(const std::string& id);

  const DrawingObject* getObject(const std::string& id) const { return store_.get(id); }
  const ObjectList& objects() const { return store_.objects(); }
  std::size_t objectCount() const { return store_.count(); }

  // Object under construction, or nullptr.
  const DrawingObject* draft() const { return hasDraft_ ? &draft_ : nullptr; }

  // ---- History ----
  bool undo();
  bool redo();
  bool canUndo() const { return history_.canUndo(); }
  bool canRedo() const { return history_.canRedo(); }
  const std::string& undoDescription() const { return history_.undoDescription(); }
  const std::string& redoDescription() const { return history_.redoDescription(); }
  void clearHistory() { history_.clear(); }

  // ---- Persistence ----
  std::string exportObjects() const;
  bool importObjects(const std::string& json);

  // ---- Rendering ----
  void render(RenderSink& sink);
  const SnapResult& lastSnap() const { return lastSnap_; }

  DrawingEvents& events() { return events_; }
  const Stats& stats() const { return stats_; }
  void resetStats() { stats_ = Stats{}; }

  // Non-finite time -> last bar timestamp (or now); non-finite price ->
  // middle of the visible price range.
  WorldPoint sanitizePoint(const WorldPoint& w) const;

private:
  bool requireViewport(const char* what);

  bool handleDown(const WorldPoint& w, const ScreenPoint& s, const CoordinateTransform& xf);
  bool handleMove(const WorldPoint& w, const ScreenPoint& s, const CoordinateTransform& xf);
  bool handleUp(const CoordinateTransform& xf);

  bool beginDraft(const WorldPoint& w, const CoordinateTransform& xf);
  void updateDraft(const WorldPoint& w, const CoordinateTransform& xf);
  bool finishDraft();
  void cancelDraft();

  void commitGesture();
  void revertGesture();
  void updateHover(const WorldPoint& w, const CoordinateTransform& xf);

  SnapResult snapPoint(const WorldPoint& w, const CoordinateTransform& xf);

  // Shared by addObject, draft completion and import: repairs points and
  // fits the point count. False when the object cannot be kept.
  bool normalizeObject(DrawingObject& obj, const char* context) const;
  std::string insertObject(DrawingObject obj, const std::string& description);

  void pushHistory(const std::string& description, ObjectList before);
  void afterHistoryJump(const char* verb, const std::string& description);
  void renderHandles(RenderSink& sink, const CoordinateTransform& xf, const DrawingObject& obj);
  void renderSnapIndicator(RenderSink& sink, const CoordinateTransform& xf);
  void requestRender() { events_.needsRender.emit(); }

  std::int64_t nowMs() const;
  void log(LogLevel level, const std::string& message) const;

  EngineConfig config_;
  Diagnostics& diag_;
  ViewportManager* viewport_{nullptr};
  KeyboardNav keyboardNav_;
  PaneId paneId_{PaneId::Price};

  DrawingStore store_;
  DrawingHistory history_;
  DrawingEvents events_;
  Stats stats_;

  ToolId tool_{ToolId::Select};
  InteractionMode mode_{InteractionMode::Idle};

  bool hasDraft_{false};
  DrawingObject draft_;

  std::string selectedId_;
  std::string hoveredId_;

  // Active drag/resize gesture
  ObjectList gestureBefore_;
  DrawingObject gestureOriginal_;
  WorldPoint dragStartWorld_;
  int handleIndex_{-1};
  double lastPanX_{0};

  SnapResult lastSnap_;
};

} // namespace tc
