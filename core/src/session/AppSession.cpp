#include "tl/session/AppSession.hpp"

#include <cstdio>
#include <utility>

namespace tl {

AppSession::AppSession(Backend& backend, const AppSessionConfig& cfg)
  : backend_(backend), config_(cfg), selection_(state_.itemIds) {
  refreshFuncs_.push_back([this]() { refreshStatus(); });
  refreshFuncs_.push_back([this]() { refreshPath(); });
}

void AppSession::refreshStatus() {
  std::string s = backend_.status();
  if (s != state_.status) state_.status = std::move(s);
}

void AppSession::refreshPath() {
  std::string p = backend_.repoPath();
  if (p != state_.path) state_.path = std::move(p);
}

void AppSession::refreshAll() {
  for (auto& fn : refreshFuncs_) fn();
}

void AppSession::refreshItems() {
  selection_.clear();
  state_.itemIds = backend_.fetchItemIds(state_.query);
}

void AppSession::setQuery(const std::string& query) {
  state_.query = query;
  refreshItems();
}

void AppSession::setListViewColumns(std::vector<ListViewColumn> columns) {
  state_.listViewColumns = std::move(columns);
}

bool AppSession::openRepo(const std::string& path) {
  lastError_.clear();
  selection_.clear();
  state_.itemIds.clear();

  auto op = backend_.openRepo(path);
  OpStatus st = pollUntilComplete(*op, [this]() { refreshStatus(); },
                                  config_.openPoll, &lastError_);
  refreshStatus();

  if (st != OpStatus::Complete) {
    std::fprintf(stderr, "AppSession: openRepo('%s') failed: %s\n",
                 path.c_str(), lastError_.c_str());
    state_.path.clear();
    return false;
  }

  refreshPath();
  refreshItems();
  return true;
}

void AppSession::closeRepo() {
  backend_.closeRepo();
  selection_.clear();
  state_.itemIds.clear();
  state_.path.clear();
  refreshStatus();
}

} // namespace tl
