#pragma once
#include "tl/data/PendingOperation.hpp"
#include "tl/ids/Id.hpp"

#include <memory>
#include <string>
#include <vector>

namespace tl {

// Owns the open repository and produces the item-id lists the UI indexes into.
class Backend {
public:
  virtual ~Backend() = default;

  // "closed", "opening", "open" or "error"
  virtual std::string status() = 0;

  // Empty when no repository is open.
  virtual std::string repoPath() = 0;

  virtual std::unique_ptr<PendingOperation> openRepo(const std::string& path) = 0;
  virtual void closeRepo() = 0;

  // Ids matching `query` (see tl/query/Query.hpp; blank = all), in display
  // order. Malformed queries match nothing.
  virtual std::vector<ItemId> fetchItemIds(const std::string& query) = 0;
};

} // namespace tl
