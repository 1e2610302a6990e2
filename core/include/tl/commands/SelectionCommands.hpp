#pragma once
#include "tl/ids/Id.hpp"
#include "tl/selection/SelectionManager.hpp"

#include <string>

#include <rapidjson/document.h>

namespace tl {

struct CmdError {
  std::string code;     // e.g. "NOT_IN_SELECTION"
  std::string message;  // human text
  std::string details;  // small JSON object with the offending fields
};

struct CmdResult {
  bool ok{true};
  CmdError err{};
  Position position{0}; // position the gesture resolved to (0 for clear/hello)
};

// Applies UI gestures expressed as JSON objects:
//   {"cmd":"isolate","itemId":42}
//   {"cmd":"extendTo","position":7}
//   {"cmd":"clear"}
// Item ids are resolved against the manager's live list before mutating.
class SelectionCommands {
public:
  explicit SelectionCommands(SelectionManager& manager);

  CmdResult applyJson(const rapidjson::Value& obj);
  CmdResult applyJsonText(const std::string& jsonText);

  // Current selection, for hosts and logs:
  // {"kind":"range","rootIndex":0,"extendToIndex":3,"selected":[0,1,2,3],"itemIds":[...]}
  std::string selectionJson() const;

  static CmdResult fail(const std::string& code,
                        const std::string& message,
                        const std::string& detailsJson = "{}");

private:
  SelectionManager& manager_;

  enum class Gesture { Isolate, Add, AddTo, Remove, ExtendTo };

  CmdResult cmdGesture(const std::string& cmd, Gesture g, const rapidjson::Value& obj);
  CmdResult cmdClear(const rapidjson::Value& obj);

  static const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key);
};

} // namespace tl
