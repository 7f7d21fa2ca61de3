// C2.3 — EditSession: recorded mutations, undo/redo, duplicate, refusal of unknown ids

#include "cf/commands/EditSession.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

int main() {
  // ---- Test 1: create + move + undo + redo ----
  {
    cf::EditSession s;
    requireTrue(s.create(cf::makeAssetElement("a", "img", 0, 0, 100, 100)), "create");
    requireTrue(s.move("a", 40, 50), "move");
    requireTrue(s.find("a")->x == 40 && s.find("a")->y == 50, "moved");
    requireTrue(s.history().actions.size() == 2, "two actions recorded");
    requireTrue(s.undoLabel() == "move", "undo label");

    requireTrue(s.undo(), "undo move");
    requireTrue(s.find("a")->x == 0, "back to origin");
    requireTrue(s.redoLabel() == "move", "redo label");
    requireTrue(s.undo(), "undo create");
    requireTrue(s.elements().empty(), "element gone");
    requireTrue(!s.undo(), "nothing more to undo");

    requireTrue(s.redo(), "redo create");
    requireTrue(s.redo(), "redo move");
    requireTrue(s.find("a")->x == 40, "move replayed");
    requireTrue(!s.redo(), "nothing more to redo");
    requireTrue(s.redoLabel().empty(), "no redo label");
    std::printf("  Test 1 (create/move/undo/redo): PASS\n");
  }

  // ---- Test 2: unknown ids and duplicate ids are refused ----
  {
    cf::EditSession s;
    requireTrue(s.create(cf::makeTextElement("t", "Hi", 0, 0, 10, 10)), "create");
    requireTrue(!s.create(cf::makeTextElement("t", "Again", 0, 0, 10, 10)), "duplicate id");
    requireTrue(!s.move("ghost", 1, 1), "move unknown");
    requireTrue(!s.rotate("ghost", 10), "rotate unknown");
    requireTrue(!s.resize("ghost", 1, 1), "resize unknown");
    requireTrue(!s.remove("ghost"), "remove unknown");
    requireTrue(!s.update("t", cf::ElementPatch{}), "empty update");
    requireTrue(!s.duplicate("t", "t"), "duplicate onto existing id");
    requireTrue(s.history().actions.size() == 1, "nothing else recorded");
    std::printf("  Test 2 (refusals): PASS\n");
  }

  // ---- Test 3: update, rotate, resize, remove all undo exactly ----
  {
    cf::EditSession s;
    cf::Element t = cf::makeTextElement("t", "Hi", 10, 10, 100, 40, 2);
    s.create(t);
    cf::ElementList start = s.elements();

    cf::ElementPatch p;
    p.text = std::string("Hello");
    p.fontWeight = cf::FontWeight::Bold;
    p.opacity = 0.5;
    requireTrue(s.update("t", p), "update");
    requireTrue(s.rotate("t", 30), "rotate");
    requireTrue(s.resize("t", 60, 20), "resize");
    requireTrue(s.remove("t"), "remove");
    requireTrue(s.elements().empty(), "removed");

    for (int i = 0; i < 4; i++) requireTrue(s.undo(), "undo step");
    requireTrue(s.elements() == start, "state restored exactly");
    std::printf("  Test 3 (inverse of every edit): PASS\n");
  }

  // ---- Test 4: duplicate ----
  {
    cf::EditSession s;
    s.create(cf::makeAssetElement("a", "img", 10, 10, 50, 50, 1));
    s.create(cf::makeAssetElement("b", "img", 0, 0, 50, 50, 7));
    requireTrue(s.duplicate("a", "a-copy"), "duplicate");
    const cf::Element* c = s.find("a-copy");
    requireTrue(c != nullptr, "copy exists");
    requireTrue(c->x == 30 && c->y == 30, "offset by 20,20");
    requireTrue(c->zIndex == 8, "stacked on top");
    requireTrue(cf::assetContent(*c)->assetId == "img", "same asset");
    requireTrue(s.undoLabel() == "copy", "copy label");
    requireTrue(s.undo(), "undo copy");
    requireTrue(s.find("a-copy") == nullptr, "copy removed");
    std::printf("  Test 4 (duplicate): PASS\n");
  }

  // ---- Test 5: capacity, restore and clear ----
  {
    cf::EditSession s(3);
    s.create(cf::makeAssetElement("a", "img", 0, 0, 50, 50));
    for (int i = 1; i <= 5; i++) s.move("a", i, i);
    requireTrue(s.history().actions.size() == 3, "bounded history");
    int undone = 0;
    while (s.undo()) undone++;
    requireTrue(undone == 3, "only 3 undo steps");
    requireTrue(s.find("a") && s.find("a")->x == 2, "oldest reachable state");

    cf::EditSession other;
    other.restore(s.elements(), s.history());
    requireTrue(other.elements() == s.elements(), "restored elements");
    requireTrue(other.canRedo(), "restored history");

    other.clear();
    requireTrue(other.elements().empty(), "cleared elements");
    requireTrue(!other.canUndo() && !other.canRedo(), "cleared history");
    requireTrue(other.history().maxActions == cf::kDefaultMaxActions, "capacity kept");
    std::printf("  Test 5 (capacity/restore/clear): PASS\n");
  }

  std::printf("C2.3 edit_session: ALL PASS\n");
  return 0;
}
