#include "tl/selection/Selection.hpp"
#include <algorithm>
#include <limits>

namespace tl {

std::pair<Position, Position> rangeMinMax(const RangeSelection& r) {
  if (r.rootIndex < r.extendToIndex) {
    return {r.rootIndex, r.extendToIndex};
  }
  return {r.extendToIndex, r.rootIndex};
}

std::uint64_t rangeSpan(const RangeSelection& r) {
  auto [small, large] = rangeMinMax(r);
  return static_cast<std::uint64_t>(large) - static_cast<std::uint64_t>(small);
}

std::vector<Position> rangeToList(const RangeSelection& r) {
  auto [small, large] = rangeMinMax(r);
  std::vector<Position> out;
  out.reserve(static_cast<std::size_t>(rangeSpan(r)) + 1);
  for (Position i = small;; ++i) {
    out.push_back(i);
    if (i == large) break;
  }
  return out;
}

bool containsPosition(const Selection& sel, Position position) {
  switch (sel.kind) {
    case SelectionKind::None:
      return false;
    case SelectionKind::Range: {
      auto [small, large] = rangeMinMax(sel.range);
      return small <= position && position <= large;
    }
    case SelectionKind::Separate:
      return std::find(sel.separate.indexes.begin(), sel.separate.indexes.end(),
                       position) != sel.separate.indexes.end();
  }
  return false;
}

void forEachPosition(const Selection& sel, const std::function<void(Position)>& fn) {
  switch (sel.kind) {
    case SelectionKind::None:
      return;
    case SelectionKind::Range: {
      auto [small, large] = rangeMinMax(sel.range);
      for (Position i = small;; ++i) {
        fn(i);
        if (i == large) break;
      }
      return;
    }
    case SelectionKind::Separate:
      for (Position p : sel.separate.indexes) fn(p);
      return;
  }
}

std::size_t selectionSize(const Selection& sel) {
  switch (sel.kind) {
    case SelectionKind::None:
      return 0;
    case SelectionKind::Range: {
      std::uint64_t span = rangeSpan(sel.range);
      if (span >= std::numeric_limits<std::size_t>::max()) {
        return std::numeric_limits<std::size_t>::max();
      }
      return static_cast<std::size_t>(span) + 1;
    }
    case SelectionKind::Separate:
      return sel.separate.indexes.size();
  }
  return 0;
}

const char* selectionKindName(SelectionKind kind) {
  switch (kind) {
    case SelectionKind::None:     return "none";
    case SelectionKind::Range:    return "range";
    case SelectionKind::Separate: return "separate";
  }
  return "none";
}

} // namespace tl
