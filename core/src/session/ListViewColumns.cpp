#include "tl/session/ListViewColumns.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

#include <utility>

namespace tl {

const char* columnTypeName(ColumnType type) {
  switch (type) {
    case ColumnType::Name:      return "name";
    case ColumnType::Extension: return "extension";
    case ColumnType::Path:      return "path";
    case ColumnType::Tags:      return "tags";
  }
  return "name";
}

bool parseColumnType(const std::string& s, ColumnType& out) {
  if (s == "name")      { out = ColumnType::Name; return true; }
  if (s == "extension") { out = ColumnType::Extension; return true; }
  if (s == "path")      { out = ColumnType::Path; return true; }
  if (s == "tags")      { out = ColumnType::Tags; return true; }
  return false;
}

std::vector<ListViewColumn> defaultListViewColumns() {
  return {
    {ColumnType::Name, 300},
    {ColumnType::Extension, 60},
    {ColumnType::Path, 500},
    {ColumnType::Tags, 200},
  };
}

std::string serializeColumns(const std::vector<ListViewColumn>& columns) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartArray();
  for (const auto& c : columns) {
    w.StartObject();
    w.Key("type");  w.String(columnTypeName(c.type));
    w.Key("width"); w.Int(c.width);
    w.EndObject();
  }
  w.EndArray();

  return sb.GetString();
}

bool deserializeColumns(const std::string& json, std::vector<ListViewColumn>& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsArray()) return false;

  std::vector<ListViewColumn> loaded;
  loaded.reserve(doc.Size());

  for (const auto& v : doc.GetArray()) {
    if (!v.IsObject()) return false;
    ListViewColumn c;

    if (!v.HasMember("type") || !v["type"].IsString()) return false;
    if (!parseColumnType(v["type"].GetString(), c.type)) return false;

    if (v.HasMember("width")) {
      if (!v["width"].IsInt() || v["width"].GetInt() < 0) return false;
      c.width = v["width"].GetInt();
    }

    loaded.push_back(c);
  }

  out = std::move(loaded);
  return true;
}

} // namespace tl
