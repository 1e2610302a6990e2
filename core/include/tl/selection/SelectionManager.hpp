#pragma once
#include "tl/ids/Id.hpp"
#include "tl/selection/Selection.hpp"
#include "tl/selection/SelectionError.hpp"

#include <cstddef>
#include <functional>
#include <vector>

namespace tl {

// Row selection over an externally owned list of item ids, with list-box
// semantics:
//   click             -> isolate(p)
//   ctrl/cmd-click    -> add(p) / remove(p)
//   shift-click       -> extendTo(p)
//   ctrl+shift-click  -> addTo(p)
//
// The selection stores positions, not ids. Any refresh of the item list may
// invalidate it; the owner is expected to clear() around refreshes.
// Mutations take positions as given and never check them against the list.
class SelectionManager {
public:
  explicit SelectionManager(const std::vector<ItemId>& itemIds);

  // ---- queries ----
  std::vector<Position> selected() const;
  bool contains(Position position) const;
  Position itemIdToIndex(ItemId itemId) const; // throws NotFound

  const Selection& selection() const { return selection_; }
  const std::vector<ItemId>& itemIds() const { return itemIds_; }
  bool hasSelection() const { return !selection_.isNone(); }
  std::size_t count() const;
  void forEachSelected(const std::function<void(Position)>& fn) const;

  // ---- mutations ----
  void isolate(Position position);
  void add(Position position);       // throws AlreadySelected
  void addTo(Position position);
  void remove(Position position);    // throws NoActiveSelection / NotInSelection
  void extendTo(Position position);
  void clear();

private:
  const std::vector<ItemId>& itemIds_;
  Selection selection_;
};

} // namespace tl
