#pragma once
#include "cf/canvas/Element.hpp"
#include "cf/ids/Id.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace cf {

// C2.1: Bounded linear undo/redo log over the element model.
//
// History is a value: every operation takes a history and returns a new one,
// so callers can snapshot it by copying. Nothing here fails; out-of-range
// undo/redo and edits of unknown element ids are no-ops.

enum class ActionType : std::uint8_t {
  Create = 1,
  Update,
  Delete,
  Move,
  Rotate,
  Resize,
  Copy
};

// One atomic mutation. elementData is required for Create, Delete and Copy.
struct Action {
  ActionId id;
  std::int64_t timestamp{0}; // ms since Unix epoch
  ActionType type{ActionType::Update};
  ElementId elementId;
  std::optional<ElementPatch> previousState;
  std::optional<ElementPatch> newState;
  std::optional<Element> elementData;
};

// An Action before addAction() stamps it with an id and a timestamp.
struct ActionDraft {
  ActionType type{ActionType::Update};
  ElementId elementId;
  std::optional<ElementPatch> previousState;
  std::optional<ElementPatch> newState;
  std::optional<Element> elementData;
};

inline constexpr std::size_t kDefaultMaxActions = 50;

struct ActionHistory {
  std::vector<Action> actions;
  int currentIndex{-1}; // most recently applied action, -1 = before the first
  std::size_t maxActions{kDefaultMaxActions};
};

struct HistoryStep {
  ActionHistory history;
  std::optional<Action> action; // empty when the step was a no-op
};

ActionHistory createActionHistory(std::size_t maxActions = kDefaultMaxActions);

// Stamps the draft, drops the redo branch, appends, and evicts the oldest
// entry when over capacity. currentIndex ends on the new action.
ActionHistory addAction(const ActionHistory& history, ActionDraft draft);

bool canUndo(const ActionHistory& history);
bool canRedo(const ActionHistory& history);

// The returned action is the one the caller must revert
// (applyActionToElements with isUndo = true).
HistoryStep undo(const ActionHistory& history);

// The returned action is the one the caller must re-apply forward.
HistoryStep redo(const ActionHistory& history);

ElementList applyActionToElements(const ElementList& elements,
                                  const Action& action,
                                  bool isUndo = false);

// Draft builders for the common mutations.
ActionDraft createMoveAction(const ElementId& elementId,
                             double prevX, double prevY,
                             double newX, double newY);
ActionDraft createRotateAction(const ElementId& elementId,
                               double prevRotation, double newRotation);
ActionDraft createResizeAction(const ElementId& elementId,
                               double prevWidth, double prevHeight,
                               double newWidth, double newHeight);
ActionDraft createUpdateAction(const ElementId& elementId,
                               ElementPatch previousState,
                               ElementPatch newState);
ActionDraft createDeleteAction(const Element& element);
ActionDraft createCreateAction(const Element& element);
ActionDraft createCopyAction(const Element& original, const Element& copy);

const char* actionTypeName(ActionType type);

} // namespace cf
