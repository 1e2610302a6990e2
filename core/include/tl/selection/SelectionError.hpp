#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace tl {

// Contract violations raised by SelectionManager. State is untouched when thrown.
enum class SelectionErrorCode : std::uint8_t {
  NotFound,          // itemIdToIndex: id not in the current list
  AlreadySelected,   // add: position already contained
  NoActiveSelection, // remove: nothing selected
  NotInSelection     // remove: position not contained
};

// "NOT_FOUND", "ALREADY_SELECTED", ...
const char* errorCodeName(SelectionErrorCode code);

class SelectionError : public std::runtime_error {
public:
  SelectionError(SelectionErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

  SelectionErrorCode code() const { return code_; }

private:
  SelectionErrorCode code_;
};

} // namespace tl
