// T5.4: Typed callback lists used for engine notifications

#include "tc/drawing/DrawingEvents.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

int main() {
  // ---- Test 1: subscribe, emit, unsubscribe ----
  {
    tc::CallbackList<const std::string&> list;
    std::vector<std::string> got;
    tc::SubscriptionId a = list.subscribe([&](const std::string& s) { got.push_back("a:" + s); });
    tc::SubscriptionId b = list.subscribe([&](const std::string& s) { got.push_back("b:" + s); });
    requireTrue(a != b && list.size() == 2, "distinct tokens");

    list.emit("x");
    requireTrue(got.size() == 2 && got[0] == "a:x" && got[1] == "b:x", "subscription order");

    requireTrue(list.unsubscribe(a), "unsubscribe a");
    requireTrue(!list.unsubscribe(a), "second unsubscribe fails");
    list.emit("y");
    requireTrue(got.size() == 3 && got[2] == "b:y", "only b remains");
    std::printf("  Test 1 (subscribe/emit): PASS\n");
  }

  // ---- Test 2: a callback may unsubscribe itself during emission ----
  {
    tc::CallbackList<> list;
    int once = 0, always = 0;
    tc::SubscriptionId self = 0;
    self = list.subscribe([&]() {
      once++;
      list.unsubscribe(self);
    });
    list.subscribe([&]() { always++; });

    list.emit();
    list.emit();
    requireTrue(once == 1, "self-removing listener ran once");
    requireTrue(always == 2, "other listener unaffected");
    requireTrue(list.size() == 1, "one left");
    std::printf("  Test 2 (unsubscribe while emitting): PASS\n");
  }

  // ---- Test 3: engine event set ----
  {
    tc::DrawingEvents events;
    tc::ToolId lastTool = tc::ToolId::Select;
    std::string selected = "unset";
    int created = 0;

    events.toolChanged.subscribe([&](tc::ToolId t) { lastTool = t; });
    events.objectSelected.subscribe([&](const std::string& id) { selected = id; });
    events.objectCreated.subscribe([&](const tc::DrawingObject&) { created++; });

    tc::DrawingObject obj;
    obj.id = "drawing_1";
    events.toolChanged.emit(tc::ToolId::Ray);
    events.objectCreated.emit(obj);
    events.objectSelected.emit(std::string());
    requireTrue(lastTool == tc::ToolId::Ray, "tool changed");
    requireTrue(created == 1, "created");
    requireTrue(selected.empty(), "empty id means cleared");

    events.clear();
    requireTrue(events.toolChanged.empty() && events.objectCreated.empty(), "cleared");
    events.toolChanged.emit(tc::ToolId::Text);
    requireTrue(lastTool == tc::ToolId::Ray, "no listeners after clear");
    std::printf("  Test 3 (drawing events): PASS\n");
  }

  std::printf("T5.4 events: ALL PASS\n");
  return 0;
}
