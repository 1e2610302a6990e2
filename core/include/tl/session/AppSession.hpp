#pragma once
#include "tl/data/Backend.hpp"
#include "tl/data/PendingOperation.hpp"
#include "tl/ids/Id.hpp"
#include "tl/selection/SelectionManager.hpp"
#include "tl/session/ListViewColumns.hpp"

#include <functional>
#include <string>
#include <vector>

namespace tl {

// Application state the list view renders from. Empty path/status = none yet.
struct AppState {
  std::string path;
  std::string status;
  std::string query;
  std::vector<ItemId> itemIds;
  std::vector<ListViewColumn> listViewColumns = defaultListViewColumns();
};

struct AppSessionConfig {
  PollConfig openPoll;
};

// Single owner of AppState and of the selection over state().itemIds.
// All calls are made from the UI thread.
class AppSession {
public:
  explicit AppSession(Backend& backend, const AppSessionConfig& cfg = {});
  AppSession(const AppSession&) = delete;
  AppSession& operator=(const AppSession&) = delete;

  const AppState& state() const { return state_; }
  SelectionManager& selection() { return selection_; }
  const SelectionManager& selection() const { return selection_; }

  void refreshStatus();
  void refreshPath();
  void refreshAll();

  // Replaces itemIds with the backend's ids for the current query.
  // The selection is cleared: its positions refer to the old list.
  void refreshItems();
  void setQuery(const std::string& query);

  void setListViewColumns(std::vector<ListViewColumn> columns);

  // Blocks until the backend finishes, refreshing status on every poll.
  // Returns false (path cleared, reason in lastError()) on failure.
  bool openRepo(const std::string& path);
  void closeRepo();

  const std::string& lastError() const { return lastError_; }

private:
  Backend& backend_;
  AppSessionConfig config_;
  AppState state_;
  SelectionManager selection_;
  std::vector<std::function<void()>> refreshFuncs_;
  std::string lastError_;
};

} // namespace tl
