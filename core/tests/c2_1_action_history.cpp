// C2.1 — ActionHistory: bounded linear log, pruning, purity

#include "cf/history/ActionHistory.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <cstdlib>
#include <set>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static cf::ActionDraft moveDraft(const char* id) {
  return cf::createMoveAction(id, 0, 0, 10, 10);
}

int main() {
  // ---- Test 1: empty history ----
  {
    cf::ActionHistory h = cf::createActionHistory();
    requireTrue(h.maxActions == 50, "default capacity 50");
    requireTrue(h.currentIndex == -1, "before first");
    requireTrue(!cf::canUndo(h), "cannot undo");
    requireTrue(!cf::canRedo(h), "cannot redo");

    cf::HistoryStep u = cf::undo(h);
    requireTrue(!u.action, "undo on empty yields no action");
    requireTrue(u.history.currentIndex == -1, "undo on empty unchanged");
    cf::HistoryStep r = cf::redo(h);
    requireTrue(!r.action, "redo on empty yields no action");
    std::printf("  Test 1 (empty history): PASS\n");
  }

  // ---- Test 2: capacity 2, push A B C -> [B, C] ----
  {
    cf::ActionHistory h = cf::createActionHistory(2);
    h = cf::addAction(h, moveDraft("A"));
    h = cf::addAction(h, moveDraft("B"));
    h = cf::addAction(h, moveDraft("C"));
    requireTrue(h.actions.size() == 2, "bounded to 2");
    requireTrue(h.actions[0].elementId == "B", "oldest evicted");
    requireTrue(h.actions[1].elementId == "C", "newest last");
    requireTrue(h.currentIndex == 1, "index on newest");
    std::printf("  Test 2 (FIFO eviction): PASS\n");
  }

  // ---- Test 3: push after undo prunes the redo branch ----
  {
    cf::ActionHistory h = cf::createActionHistory();
    h = cf::addAction(h, moveDraft("A"));
    h = cf::addAction(h, moveDraft("B"));
    h = cf::addAction(h, moveDraft("C"));

    cf::HistoryStep s = cf::undo(h);
    requireTrue(s.action && s.action->elementId == "C", "undo returns C");
    s = cf::undo(s.history);
    requireTrue(s.action && s.action->elementId == "B", "undo returns B");
    requireTrue(s.history.currentIndex == 0, "index at A");
    requireTrue(cf::canRedo(s.history), "can redo");

    cf::ActionHistory pushed = cf::addAction(s.history, moveDraft("D"));
    requireTrue(pushed.actions.size() == 2, "B and C pruned");
    requireTrue(pushed.actions[0].elementId == "A", "A kept");
    requireTrue(pushed.actions[1].elementId == "D", "D appended");
    requireTrue(pushed.currentIndex == 1, "index on D");
    requireTrue(!cf::canRedo(pushed), "no redo after push");
    std::printf("  Test 3 (redo pruning): PASS\n");
  }

  // ---- Test 4: undo/redo walk ----
  {
    cf::ActionHistory h = cf::createActionHistory();
    h = cf::addAction(h, moveDraft("A"));
    h = cf::addAction(h, moveDraft("B"));

    cf::HistoryStep s = cf::undo(h);
    s = cf::undo(s.history);
    requireTrue(s.history.currentIndex == -1, "fully undone");
    requireTrue(!cf::canUndo(s.history), "nothing left to undo");

    cf::HistoryStep r = cf::redo(s.history);
    requireTrue(r.action && r.action->elementId == "A", "redo returns A");
    r = cf::redo(r.history);
    requireTrue(r.action && r.action->elementId == "B", "redo returns B");
    requireTrue(!cf::canRedo(r.history), "nothing left to redo");
    cf::HistoryStep none = cf::redo(r.history);
    requireTrue(!none.action && none.history.currentIndex == 1, "redo past end no-op");
    std::printf("  Test 4 (undo/redo walk): PASS\n");
  }

  // ---- Test 5: inputs are never mutated ----
  {
    cf::ActionHistory h = cf::createActionHistory();
    h = cf::addAction(h, moveDraft("A"));
    cf::ActionHistory before = h;

    cf::ActionHistory after = cf::addAction(h, moveDraft("B"));
    requireTrue(h.actions.size() == 1, "addAction leaves input");
    requireTrue(h.currentIndex == 0, "addAction leaves index");
    requireTrue(after.actions.size() == 2, "result grew");

    cf::HistoryStep s = cf::undo(h);
    requireTrue(h.currentIndex == before.currentIndex, "undo leaves input");
    requireTrue(s.history.currentIndex == -1, "undo result moved");
    std::printf("  Test 5 (purity): PASS\n");
  }

  // ---- Test 6: stamping ----
  {
    cf::ActionHistory h = cf::createActionHistory();
    for (int i = 0; i < 10; i++) h = cf::addAction(h, moveDraft("X"));
    std::set<std::string> ids;
    for (const auto& a : h.actions) {
      requireTrue(!a.id.empty(), "action id assigned");
      requireTrue(a.timestamp > 0, "timestamp assigned");
      ids.insert(a.id);
    }
    requireTrue(ids.size() == 10, "action ids unique");
    requireTrue(h.actions[0].type == cf::ActionType::Move, "type kept");
    requireTrue(h.actions[0].previousState && h.actions[0].previousState->x, "prev state kept");
    std::printf("  Test 6 (id + timestamp): PASS\n");
  }

  // ---- Test 7: capacity 0 behaves as 1 ----
  {
    cf::ActionHistory h = cf::createActionHistory(0);
    h = cf::addAction(h, moveDraft("A"));
    h = cf::addAction(h, moveDraft("B"));
    requireTrue(h.actions.size() == 1, "one action kept");
    requireTrue(h.actions[0].elementId == "B", "newest kept");
    requireTrue(h.currentIndex == 0, "index on it");
    std::printf("  Test 7 (zero capacity): PASS\n");
  }

  // ---- Test 8: type names ----
  {
    requireTrue(std::strcmp(cf::actionTypeName(cf::ActionType::Create), "create") == 0, "create");
    requireTrue(std::strcmp(cf::actionTypeName(cf::ActionType::Resize), "resize") == 0, "resize");
    requireTrue(std::strcmp(cf::actionTypeName(cf::ActionType::Copy), "copy") == 0, "copy");
    std::printf("  Test 8 (type names): PASS\n");
  }

  // ---- Test 9: long push sequence stays bounded, evicting oldest first ----
  {
    cf::ActionHistory h = cf::createActionHistory(50);
    for (int i = 0; i < 120; i++) {
      h = cf::addAction(h, moveDraft(("e" + std::to_string(i)).c_str()));
      std::size_t expected = static_cast<std::size_t>(std::min(i + 1, 50));
      requireTrue(h.actions.size() == expected, "size is min(pushes, capacity)");
      requireTrue(h.currentIndex == static_cast<int>(h.actions.size()) - 1, "index on newest");
      int oldest = std::max(0, i - 49);
      requireTrue(h.actions.front().elementId == "e" + std::to_string(oldest), "front is oldest kept");
      requireTrue(h.actions.back().elementId == "e" + std::to_string(i), "back is newest");
    }
    for (std::size_t k = 0; k < h.actions.size(); k++) {
      requireTrue(h.actions[k].elementId == "e" + std::to_string(70 + k), "order preserved");
    }
    std::printf("  Test 9 (bounded FIFO over 120 pushes): PASS\n");
  }

  std::printf("C2.1 action_history: ALL PASS\n");
  return 0;
}
