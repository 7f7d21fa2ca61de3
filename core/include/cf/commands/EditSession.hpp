#pragma once
#include "cf/canvas/Element.hpp"
#include "cf/history/ActionHistory.hpp"

#include <cstddef>
#include <string>

namespace cf {

// C2.3: The mutable "current elements + current history" pair of one editing
// session. Every mutator records exactly one Action and applies it through
// applyActionToElements(), so undo/redo replay the same code path.
//
// Mutators return false and record nothing when the target id is unknown
// (or, for create/duplicate, when the new id is already taken).
// Not thread-safe: one logical editing session at a time.
class EditSession {
public:
  explicit EditSession(std::size_t maxActions = kDefaultMaxActions);

  bool create(const Element& element);
  bool remove(const ElementId& id);
  bool update(const ElementId& id, const ElementPatch& patch);
  bool move(const ElementId& id, double x, double y);
  bool rotate(const ElementId& id, double degrees);
  bool resize(const ElementId& id, double width, double height);

  // Copy of `id` under `newId`, offset by (dx, dy) and stacked on top.
  bool duplicate(const ElementId& id, const ElementId& newId,
                 double dx = 20.0, double dy = 20.0);

  // Returns true if an action was reverted / re-applied.
  bool undo();
  bool redo();

  bool canUndo() const;
  bool canRedo() const;

  // e.g. "move", "" when nothing to undo/redo.
  std::string undoLabel() const;
  std::string redoLabel() const;

  const Element* find(const ElementId& id) const;
  const ElementList& elements() const { return elements_; }
  const ActionHistory& history() const { return history_; }

  // Replace the whole state, e.g. from a saved snapshot.
  void restore(ElementList elements, ActionHistory history);

  // Drop all elements and history, keeping the capacity.
  void clear();

private:
  void record(ActionDraft draft);

  ElementList elements_;
  ActionHistory history_;
};

} // namespace cf
