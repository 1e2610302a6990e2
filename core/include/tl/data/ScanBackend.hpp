#pragma once
#include "tl/data/Backend.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace tl {

struct ScanBackendConfig {
  bool followDirectorySymlinks{false};
  std::size_t maxItems{0}; // 0 = unlimited
};

// Backend whose "repository" is a directory tree. Opening it scans the tree
// for files on a worker thread; each file becomes an item, ids 1..N in
// sorted relative-path order.
class ScanBackend : public Backend {
public:
  explicit ScanBackend(const ScanBackendConfig& config = {});
  ~ScanBackend() override;

  std::string status() override;
  std::string repoPath() override;
  std::unique_ptr<PendingOperation> openRepo(const std::string& path) override;
  void closeRepo() override;
  std::vector<ItemId> fetchItemIds(const std::string& query) override;

  // Path relative to the repository root, or empty for an unknown id.
  std::string itemPath(ItemId id);
  std::size_t itemCount();

  // State shared between the worker and the pending operation.
  struct ScanJob {
    std::string root;
    std::atomic<int> status{static_cast<int>(OpStatus::Pending)};
    std::atomic<bool> cancelled{false};
    std::mutex mtx;
    std::string error;
    std::vector<std::string> paths; // sorted, relative to root
  };

private:
  void scanLoop(std::shared_ptr<ScanJob> job);

  ScanBackendConfig config_;
  std::shared_ptr<ScanJob> job_;
  std::thread thread_;
  bool lastOpenFailed_{false};
};

} // namespace tl
