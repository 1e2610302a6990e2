#include "tl/selection/SelectionError.hpp"

namespace tl {

const char* errorCodeName(SelectionErrorCode code) {
  switch (code) {
    case SelectionErrorCode::NotFound:          return "NOT_FOUND";
    case SelectionErrorCode::AlreadySelected:   return "ALREADY_SELECTED";
    case SelectionErrorCode::NoActiveSelection: return "NO_ACTIVE_SELECTION";
    case SelectionErrorCode::NotInSelection:    return "NOT_IN_SELECTION";
  }
  return "UNKNOWN";
}

} // namespace tl
