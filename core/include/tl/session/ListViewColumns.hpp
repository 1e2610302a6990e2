#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace tl {

enum class ColumnType : std::uint8_t { Name, Extension, Path, Tags };

struct ListViewColumn {
  ColumnType type{ColumnType::Name};
  int width{100}; // pixels
};

// "name", "extension", "path", "tags"
const char* columnTypeName(ColumnType type);
bool parseColumnType(const std::string& s, ColumnType& out);

// name 300, extension 60, path 500, tags 200
std::vector<ListViewColumn> defaultListViewColumns();

// [{"type":"name","width":300}, ...]
std::string serializeColumns(const std::vector<ListViewColumn>& columns);

// Returns false (and leaves `out` untouched) on malformed JSON, an unknown
// column type or a negative width.
bool deserializeColumns(const std::string& json, std::vector<ListViewColumn>& out);

} // namespace tl
