#include "tl/selection/SelectionManager.hpp"
#include <algorithm>
#include <string>
#include <utility>

namespace tl {

SelectionManager::SelectionManager(const std::vector<ItemId>& itemIds)
  : itemIds_(itemIds) {}

std::vector<Position> SelectionManager::selected() const {
  switch (selection_.kind) {
    case SelectionKind::None:
      return {};
    case SelectionKind::Range:
      return rangeToList(selection_.range);
    case SelectionKind::Separate:
      return selection_.separate.indexes;
  }
  return {};
}

bool SelectionManager::contains(Position position) const {
  return containsPosition(selection_, position);
}

Position SelectionManager::itemIdToIndex(ItemId itemId) const {
  auto it = std::find(itemIds_.begin(), itemIds_.end(), itemId);
  if (it == itemIds_.end()) {
    throw SelectionError(SelectionErrorCode::NotFound,
                         "item id " + std::to_string(itemId) + " is not in the list");
  }
  return static_cast<Position>(it - itemIds_.begin());
}

std::size_t SelectionManager::count() const {
  return selectionSize(selection_);
}

void SelectionManager::forEachSelected(const std::function<void(Position)>& fn) const {
  forEachPosition(selection_, fn);
}

void SelectionManager::isolate(Position position) {
  selection_ = Selection::makeSeparate({position}, position);
}

void SelectionManager::add(Position position) {
  if (selection_.isNone()) {
    isolate(position);
    return;
  }
  if (contains(position)) {
    throw SelectionError(SelectionErrorCode::AlreadySelected,
                         "position " + std::to_string(position) + " is already selected");
  }

  std::vector<Position> indexes = selected();
  indexes.push_back(position);
  selection_ = Selection::makeSeparate(std::move(indexes), position);
}

void SelectionManager::addTo(Position position) {
  switch (selection_.kind) {
    case SelectionKind::None:
      selection_ = Selection::makeRange(0, position);
      return;

    case SelectionKind::Range: {
      auto [small, large] = rangeMinMax(selection_.range);
      std::vector<Position> indexes = rangeToList(selection_.range);
      if (position < small) {
        for (Position i = position; i < small; ++i) indexes.push_back(i);
      } else if (position > large) {
        for (Position i = large;;) {
          ++i;
          indexes.push_back(i);
          if (i == position) break;
        }
      }
      // Inside the span: only the representation changes.
      selection_ = Selection::makeSeparate(std::move(indexes), position);
      return;
    }

    case SelectionKind::Separate: {
      auto& sep = selection_.separate;
      Position small = std::min(sep.lastToggledIndex, position);
      Position large = std::max(sep.lastToggledIndex, position);
      for (Position i = small;; ++i) {
        if (std::find(sep.indexes.begin(), sep.indexes.end(), i) == sep.indexes.end()) {
          sep.indexes.push_back(i);
        }
        if (i == large) break;
      }
      sep.lastToggledIndex = position;
      return;
    }
  }
}

void SelectionManager::remove(Position position) {
  switch (selection_.kind) {
    case SelectionKind::None:
      throw SelectionError(SelectionErrorCode::NoActiveSelection, "no active selection");

    case SelectionKind::Range: {
      auto [small, large] = rangeMinMax(selection_.range);
      if (position < small || position > large) {
        throw SelectionError(SelectionErrorCode::NotInSelection,
                             "position " + std::to_string(position) + " is not selected");
      }
      std::vector<Position> indexes;
      indexes.reserve(static_cast<std::size_t>(rangeSpan(selection_.range)));
      for (Position i = small;; ++i) {
        if (i != position) indexes.push_back(i);
        if (i == large) break;
      }
      // Anchor stays on the removed row so a later shift-click extends from it.
      selection_ = Selection::makeSeparate(std::move(indexes), position);
      return;
    }

    case SelectionKind::Separate: {
      auto& indexes = selection_.separate.indexes;
      auto it = std::find(indexes.begin(), indexes.end(), position);
      if (it == indexes.end()) {
        throw SelectionError(SelectionErrorCode::NotInSelection,
                             "position " + std::to_string(position) + " is not selected");
      }
      indexes.erase(it);
      return;
    }
  }
}

void SelectionManager::extendTo(Position position) {
  switch (selection_.kind) {
    case SelectionKind::None:
      selection_ = Selection::makeRange(0, position);
      return;
    case SelectionKind::Range:
      selection_.range.extendToIndex = position;
      return;
    case SelectionKind::Separate:
      selection_ = Selection::makeRange(selection_.separate.lastToggledIndex, position);
      return;
  }
}

void SelectionManager::clear() {
  selection_ = Selection::none();
}

} // namespace tl
