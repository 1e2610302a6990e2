#include "tl/commands/SelectionCommands.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <stdexcept>
#include <string>

namespace tl {

SelectionCommands::SelectionCommands(SelectionManager& manager)
  : manager_(manager) {}

CmdResult SelectionCommands::fail(const std::string& code,
                                  const std::string& message,
                                  const std::string& detailsJson) {
  CmdResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  r.err.details = detailsJson.empty() ? "{}" : detailsJson;
  r.position = 0;
  return r;
}

const rapidjson::Value* SelectionCommands::getMember(const rapidjson::Value& obj, const char* key) {
  if (!obj.IsObject()) return nullptr;
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return nullptr;
  return &it->value;
}

CmdResult SelectionCommands::applyJsonText(const std::string& jsonText) {
  rapidjson::Document d;
  d.Parse(jsonText.c_str());

  if (d.HasParseError() || !d.IsObject()) {
    return fail("BAD_COMMAND", "SelectionCommands: invalid JSON object");
  }

  return applyJson(d);
}

CmdResult SelectionCommands::applyJson(const rapidjson::Value& obj) {
  const auto* cmdV = getMember(obj, "cmd");
  if (!cmdV || !cmdV->IsString()) {
    return fail("BAD_COMMAND", "Missing string field: cmd");
  }

  const std::string cmd = cmdV->GetString();

  if (cmd == "hello") return CmdResult{};

  // click
  if (cmd == "isolate") return cmdGesture(cmd, Gesture::Isolate, obj);
  // ctrl/cmd-click
  if (cmd == "add") return cmdGesture(cmd, Gesture::Add, obj);
  if (cmd == "remove") return cmdGesture(cmd, Gesture::Remove, obj);
  // shift-click
  if (cmd == "extendTo") return cmdGesture(cmd, Gesture::ExtendTo, obj);
  // ctrl+shift-click
  if (cmd == "addTo") return cmdGesture(cmd, Gesture::AddTo, obj);

  if (cmd == "clear") return cmdClear(obj);

  return fail("UNKNOWN_COMMAND",
              "Unknown cmd",
              std::string(R"({"cmd":")") + cmd + R"("})");
}

CmdResult SelectionCommands::cmdGesture(const std::string& cmd, Gesture g,
                                        const rapidjson::Value& obj) {
  Position position = 0;

  try {
    if (const auto* idV = getMember(obj, "itemId")) {
      ItemId itemId = kInvalidItemId;
      if (idV->IsInt64()) {
        itemId = static_cast<ItemId>(idV->GetInt64());
      } else if (idV->IsString()) {
        itemId = parseItemIdString(idV->GetString());
      } else {
        return fail("BAD_COMMAND", cmd + ": itemId must be an integer");
      }
      position = manager_.itemIdToIndex(itemId);
    } else if (const auto* posV = getMember(obj, "position")) {
      if (!posV->IsInt64()) {
        return fail("BAD_COMMAND", cmd + ": position must be an integer");
      }
      position = static_cast<Position>(posV->GetInt64());
    } else {
      return fail("BAD_COMMAND", cmd + ": missing itemId or position");
    }

    switch (g) {
      case Gesture::Isolate:  manager_.isolate(position); break;
      case Gesture::Add:      manager_.add(position); break;
      case Gesture::AddTo:    manager_.addTo(position); break;
      case Gesture::Remove:   manager_.remove(position); break;
      case Gesture::ExtendTo: manager_.extendTo(position); break;
    }
  } catch (const SelectionError& e) {
    return fail(errorCodeName(e.code()),
                cmd + ": " + e.what(),
                std::string(R"({"cmd":")") + cmd + R"(","position":)" +
                  std::to_string(position) + "}");
  } catch (const std::runtime_error& e) {
    // parseItemIdString rejects non-decimal or out-of-range text
    return fail("BAD_COMMAND", cmd + ": " + e.what());
  }

  CmdResult r;
  r.ok = true;
  r.position = position;
  return r;
}

CmdResult SelectionCommands::cmdClear(const rapidjson::Value&) {
  manager_.clear();
  CmdResult r;
  r.ok = true;
  return r;
}

std::string SelectionCommands::selectionJson() const {
  const Selection& sel = manager_.selection();
  const auto& ids = manager_.itemIds();

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartObject();
  w.Key("kind");
  w.String(selectionKindName(sel.kind));

  if (sel.isRange()) {
    w.Key("rootIndex");     w.Int64(sel.range.rootIndex);
    w.Key("extendToIndex"); w.Int64(sel.range.extendToIndex);
  } else if (sel.isSeparate()) {
    w.Key("lastToggledIndex"); w.Int64(sel.separate.lastToggledIndex);
  }

  w.Key("selected");
  w.StartArray();
  manager_.forEachSelected([&](Position p) { w.Int64(p); });
  w.EndArray();

  // Positions past either end of the list have no item: written as null.
  w.Key("itemIds");
  w.StartArray();
  manager_.forEachSelected([&](Position p) {
    if (p >= 0 && static_cast<std::size_t>(p) < ids.size()) {
      w.Int64(ids[static_cast<std::size_t>(p)]);
    } else {
      w.Null();
    }
  });
  w.EndArray();

  w.EndObject();
  return sb.GetString();
}

} // namespace tl
