#pragma once
#include <cstdint>
#include <limits>
#include <string>
#include <stdexcept>

namespace tl {

// Stable, caller-meaningful identity of a list entry.
using ItemId = std::int64_t;

// Offset into the current item-id list. Not stable across refreshes.
using Position = std::int64_t;

inline constexpr ItemId kInvalidItemId = 0;

// Accept an item id written as signed decimal text (JSON hosts sometimes quote ids).
inline ItemId parseItemIdString(const std::string& s) {
  if (s.empty()) return kInvalidItemId;
  std::size_t i = 0;
  bool negative = false;
  if (s[0] == '-') {
    negative = true;
    i = 1;
    if (s.size() == 1) throw std::runtime_error("ItemId must be decimal digits");
  }
  // Magnitude limit: INT64_MAX, or one more for a negative id.
  const std::uint64_t limit =
      static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) + (negative ? 1u : 0u);
  std::uint64_t v = 0;
  for (; i < s.size(); ++i) {
    char c = s[i];
    if (c < '0' || c > '9') throw std::runtime_error("ItemId must be decimal digits");
    const auto digit = static_cast<std::uint64_t>(c - '0');
    if (v > (limit - digit) / 10) throw std::overflow_error("ItemId out of range");
    v = v * 10 + digit;
  }
  if (negative) {
    // Two's-complement negation; v == limit yields INT64_MIN.
    return static_cast<ItemId>(~v + 1u);
  }
  return static_cast<ItemId>(v);
}

} // namespace tl
