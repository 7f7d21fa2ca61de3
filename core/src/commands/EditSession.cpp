#include "cf/commands/EditSession.hpp"

#include <algorithm>
#include <utility>

namespace cf {

EditSession::EditSession(std::size_t maxActions)
  : history_(createActionHistory(maxActions)) {}

void EditSession::record(ActionDraft draft) {
  history_ = addAction(history_, std::move(draft));
  elements_ = applyActionToElements(elements_, history_.actions.back(), false);
}

bool EditSession::create(const Element& element) {
  if (find(element.id)) return false;
  record(createCreateAction(element));
  return true;
}

bool EditSession::remove(const ElementId& id) {
  const Element* el = find(id);
  if (!el) return false;
  record(createDeleteAction(*el));
  return true;
}

bool EditSession::update(const ElementId& id, const ElementPatch& patch) {
  const Element* el = find(id);
  if (!el || patch.empty()) return false;
  record(createUpdateAction(id, snapshotPatch(*el, patch), patch));
  return true;
}

bool EditSession::move(const ElementId& id, double x, double y) {
  const Element* el = find(id);
  if (!el) return false;
  record(createMoveAction(id, el->x, el->y, x, y));
  return true;
}

bool EditSession::rotate(const ElementId& id, double degrees) {
  const Element* el = find(id);
  if (!el) return false;
  record(createRotateAction(id, el->rotation, degrees));
  return true;
}

bool EditSession::resize(const ElementId& id, double width, double height) {
  const Element* el = find(id);
  if (!el) return false;
  record(createResizeAction(id, el->width, el->height, width, height));
  return true;
}

bool EditSession::duplicate(const ElementId& id, const ElementId& newId,
                            double dx, double dy) {
  const Element* el = find(id);
  if (!el || find(newId)) return false;

  int topZ = el->zIndex;
  for (const auto& e : elements_) topZ = std::max(topZ, e.zIndex);

  Element copy = *el;
  copy.id = newId;
  copy.x += dx;
  copy.y += dy;
  copy.zIndex = topZ + 1;
  record(createCopyAction(*el, copy));
  return true;
}

bool EditSession::undo() {
  auto step = cf::undo(history_);
  if (!step.action) return false;
  elements_ = applyActionToElements(elements_, *step.action, true);
  history_ = std::move(step.history);
  return true;
}

bool EditSession::redo() {
  auto step = cf::redo(history_);
  if (!step.action) return false;
  elements_ = applyActionToElements(elements_, *step.action, false);
  history_ = std::move(step.history);
  return true;
}

bool EditSession::canUndo() const { return cf::canUndo(history_); }
bool EditSession::canRedo() const { return cf::canRedo(history_); }

std::string EditSession::undoLabel() const {
  if (!canUndo()) return {};
  return actionTypeName(history_.actions[static_cast<std::size_t>(history_.currentIndex)].type);
}

std::string EditSession::redoLabel() const {
  if (!canRedo()) return {};
  return actionTypeName(history_.actions[static_cast<std::size_t>(history_.currentIndex + 1)].type);
}

const Element* EditSession::find(const ElementId& id) const {
  for (const auto& el : elements_) {
    if (el.id == id) return &el;
  }
  return nullptr;
}

void EditSession::restore(ElementList elements, ActionHistory history) {
  elements_ = std::move(elements);
  history_ = std::move(history);
}

void EditSession::clear() {
  elements_.clear();
  history_ = createActionHistory(history_.maxActions);
}

} // namespace cf
