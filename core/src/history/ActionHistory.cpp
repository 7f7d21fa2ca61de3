#include "cf/history/ActionHistory.hpp"

#include <algorithm>
#include <utility>

namespace cf {

namespace {

ElementList withoutElement(const ElementList& elements, const ElementId& id) {
  ElementList out;
  out.reserve(elements.size());
  for (const auto& el : elements) {
    if (el.id != id) out.push_back(el);
  }
  return out;
}

ElementList withElement(const ElementList& elements, const Element& el) {
  ElementList out = elements;
  out.push_back(el);
  return out;
}

} // anonymous namespace

ActionHistory createActionHistory(std::size_t maxActions) {
  ActionHistory h;
  h.maxActions = maxActions;
  return h;
}

ActionHistory addAction(const ActionHistory& history, ActionDraft draft) {
  Action action;
  action.id = generateUuid();
  action.timestamp = nowMillis();
  action.type = draft.type;
  action.elementId = std::move(draft.elementId);
  action.previousState = std::move(draft.previousState);
  action.newState = std::move(draft.newState);
  action.elementData = std::move(draft.elementData);

  ActionHistory out;
  out.maxActions = history.maxActions;

  // Keep [0, currentIndex]; anything past it was the redo branch.
  auto keep = static_cast<std::size_t>(history.currentIndex + 1);
  keep = std::min(keep, history.actions.size());
  out.actions.assign(history.actions.begin(),
                     history.actions.begin() + static_cast<std::ptrdiff_t>(keep));
  out.actions.push_back(std::move(action));

  const std::size_t cap = std::max<std::size_t>(history.maxActions, 1);
  if (out.actions.size() > cap) {
    out.actions.erase(out.actions.begin(),
                      out.actions.begin() +
                          static_cast<std::ptrdiff_t>(out.actions.size() - cap));
  }

  out.currentIndex = static_cast<int>(out.actions.size()) - 1;
  return out;
}

bool canUndo(const ActionHistory& history) {
  return history.currentIndex >= 0;
}

bool canRedo(const ActionHistory& history) {
  return history.currentIndex < static_cast<int>(history.actions.size()) - 1;
}

HistoryStep undo(const ActionHistory& history) {
  HistoryStep step{history, std::nullopt};
  if (!canUndo(history)) return step;

  step.action = history.actions[static_cast<std::size_t>(history.currentIndex)];
  step.history.currentIndex = history.currentIndex - 1;
  return step;
}

HistoryStep redo(const ActionHistory& history) {
  HistoryStep step{history, std::nullopt};
  if (!canRedo(history)) return step;

  int newIndex = history.currentIndex + 1;
  step.action = history.actions[static_cast<std::size_t>(newIndex)];
  step.history.currentIndex = newIndex;
  return step;
}

ElementList applyActionToElements(const ElementList& elements,
                                  const Action& action,
                                  bool isUndo) {
  switch (action.type) {
    case ActionType::Create:
    case ActionType::Copy:
      if (isUndo) return withoutElement(elements, action.elementId);
      if (action.elementData) return withElement(elements, *action.elementData);
      break;

    case ActionType::Delete:
      if (!isUndo) return withoutElement(elements, action.elementId);
      if (action.elementData) return withElement(elements, *action.elementData);
      break;

    case ActionType::Update:
    case ActionType::Move:
    case ActionType::Rotate:
    case ActionType::Resize: {
      const auto& state = isUndo ? action.previousState : action.newState;
      if (!state) break;
      ElementList out = elements;
      for (auto& el : out) {
        if (el.id == action.elementId) applyPatch(el, *state);
      }
      return out;
    }
  }
  return elements;
}

ActionDraft createMoveAction(const ElementId& elementId,
                             double prevX, double prevY,
                             double newX, double newY) {
  ActionDraft d;
  d.type = ActionType::Move;
  d.elementId = elementId;
  d.previousState = ElementPatch{};
  d.previousState->x = prevX;
  d.previousState->y = prevY;
  d.newState = ElementPatch{};
  d.newState->x = newX;
  d.newState->y = newY;
  return d;
}

ActionDraft createRotateAction(const ElementId& elementId,
                               double prevRotation, double newRotation) {
  ActionDraft d;
  d.type = ActionType::Rotate;
  d.elementId = elementId;
  d.previousState = ElementPatch{};
  d.previousState->rotation = prevRotation;
  d.newState = ElementPatch{};
  d.newState->rotation = newRotation;
  return d;
}

ActionDraft createResizeAction(const ElementId& elementId,
                               double prevWidth, double prevHeight,
                               double newWidth, double newHeight) {
  ActionDraft d;
  d.type = ActionType::Resize;
  d.elementId = elementId;
  d.previousState = ElementPatch{};
  d.previousState->width = prevWidth;
  d.previousState->height = prevHeight;
  d.newState = ElementPatch{};
  d.newState->width = newWidth;
  d.newState->height = newHeight;
  return d;
}

ActionDraft createUpdateAction(const ElementId& elementId,
                               ElementPatch previousState,
                               ElementPatch newState) {
  ActionDraft d;
  d.type = ActionType::Update;
  d.elementId = elementId;
  d.previousState = std::move(previousState);
  d.newState = std::move(newState);
  return d;
}

ActionDraft createDeleteAction(const Element& element) {
  ActionDraft d;
  d.type = ActionType::Delete;
  d.elementId = element.id;
  d.elementData = element;
  return d;
}

ActionDraft createCreateAction(const Element& element) {
  ActionDraft d;
  d.type = ActionType::Create;
  d.elementId = element.id;
  d.elementData = element;
  return d;
}

ActionDraft createCopyAction(const Element& /*original*/, const Element& copy) {
  ActionDraft d;
  d.type = ActionType::Copy;
  d.elementId = copy.id;
  d.elementData = copy;
  return d;
}

const char* actionTypeName(ActionType type) {
  switch (type) {
    case ActionType::Create: return "create";
    case ActionType::Update: return "update";
    case ActionType::Delete: return "delete";
    case ActionType::Move:   return "move";
    case ActionType::Rotate: return "rotate";
    case ActionType::Resize: return "resize";
    case ActionType::Copy:   return "copy";
  }
  return "unknown";
}

} // namespace cf
