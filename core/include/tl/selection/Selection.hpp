#pragma once
#include "tl/ids/Id.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace tl {

enum class SelectionKind : std::uint8_t { None, Range, Separate };

// Inclusive contiguous span. Either order allowed; rootIndex is the anchor.
struct RangeSelection {
  Position rootIndex{0};
  Position extendToIndex{0};
};

// Arbitrary set of positions. Order in `indexes` carries no meaning.
struct SeparateSelection {
  std::vector<Position> indexes;
  Position lastToggledIndex{0}; // anchor when converted back to a range
};

// Tagged value: only the payload named by `kind` is meaningful.
struct Selection {
  SelectionKind kind{SelectionKind::None};
  RangeSelection range;
  SeparateSelection separate;

  static Selection none() { return {}; }

  static Selection makeRange(Position root, Position extendTo) {
    Selection s;
    s.kind = SelectionKind::Range;
    s.range.rootIndex = root;
    s.range.extendToIndex = extendTo;
    return s;
  }

  static Selection makeSeparate(std::vector<Position> indexes, Position lastToggled) {
    Selection s;
    s.kind = SelectionKind::Separate;
    s.separate.indexes = std::move(indexes);
    s.separate.lastToggledIndex = lastToggled;
    return s;
  }

  bool isNone() const { return kind == SelectionKind::None; }
  bool isRange() const { return kind == SelectionKind::Range; }
  bool isSeparate() const { return kind == SelectionKind::Separate; }
};

// (small, large) with small <= large.
std::pair<Position, Position> rangeMinMax(const RangeSelection& r);

// large - small, computed without signed overflow.
std::uint64_t rangeSpan(const RangeSelection& r);

// Every position in [small, large], ascending.
std::vector<Position> rangeToList(const RangeSelection& r);

bool containsPosition(const Selection& sel, Position position);

// Visits positions in the same order selected() would return them,
// without materializing a range.
void forEachPosition(const Selection& sel, const std::function<void(Position)>& fn);

// Saturates at SIZE_MAX for a Range spanning every Position.
std::size_t selectionSize(const Selection& sel);

const char* selectionKindName(SelectionKind kind);

} // namespace tl
