#include "tl/data/ScanBackend.hpp"
#include "tl/query/Query.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace tl {

namespace {

class ScanOperation : public PendingOperation {
public:
  explicit ScanOperation(std::shared_ptr<ScanBackend::ScanJob> job)
    : job_(std::move(job)) {}

  OpStatus poll() override {
    auto st = static_cast<OpStatus>(job_->status.load());
    if (st == OpStatus::Failed) {
      std::lock_guard<std::mutex> lock(job_->mtx);
      error_ = job_->error;
    }
    return st;
  }

  const std::string& error() const override { return error_; }

private:
  std::shared_ptr<ScanBackend::ScanJob> job_;
  std::string error_;
};

// Split one directory's entries into files (items) and directories still to scan.
void classifyEntries(fs::directory_iterator it, bool followSymlinks,
                     std::vector<fs::path>& items,
                     std::vector<fs::path>& unscanned) {
  std::error_code ec;
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) break;
    const auto& entry = *it;
    // Classify the link itself first so a dangling symlink is still an item.
    std::error_code sec;
    fs::file_status st = entry.symlink_status(sec);
    if (sec) continue;
    bool isDir = fs::is_directory(st);
    if (fs::is_symlink(st) && followSymlinks) {
      std::error_code tec;
      fs::file_status target = entry.status(tec);
      isDir = !tec && fs::is_directory(target);
    }
    if (isDir) {
      unscanned.push_back(entry.path());
    } else {
      items.push_back(entry.path());
    }
  }
}

} // namespace

ScanBackend::ScanBackend(const ScanBackendConfig& config) : config_(config) {}

ScanBackend::~ScanBackend() { closeRepo(); }

std::string ScanBackend::status() {
  if (!job_) return lastOpenFailed_ ? "error" : "closed";
  switch (static_cast<OpStatus>(job_->status.load())) {
    case OpStatus::Pending:  return "opening";
    case OpStatus::Complete: return "open";
    case OpStatus::Failed:   return "error";
  }
  return "error";
}

std::string ScanBackend::repoPath() {
  if (!job_) return {};
  if (static_cast<OpStatus>(job_->status.load()) != OpStatus::Complete) return {};
  return job_->root;
}

std::unique_ptr<PendingOperation> ScanBackend::openRepo(const std::string& path) {
  closeRepo();

  std::error_code ec;
  bool isDir = fs::is_directory(path, ec);
  if (ec || !isDir) {
    lastOpenFailed_ = true;
    std::string msg = ec ? ec.message() : std::string("not a directory");
    std::fprintf(stderr, "ScanBackend: cannot open '%s': %s\n", path.c_str(), msg.c_str());
    return std::make_unique<FinishedOperation>(OpStatus::Failed, msg);
  }

  lastOpenFailed_ = false;
  job_ = std::make_shared<ScanJob>();
  job_->root = path;
  thread_ = std::thread(&ScanBackend::scanLoop, this, job_);
  return std::make_unique<ScanOperation>(job_);
}

void ScanBackend::closeRepo() {
  if (job_) job_->cancelled.store(true);
  if (thread_.joinable()) thread_.join();
  job_.reset();
  lastOpenFailed_ = false;
}

std::vector<ItemId> ScanBackend::fetchItemIds(const std::string& query) {
  std::vector<ItemId> out;
  if (!job_ || static_cast<OpStatus>(job_->status.load()) != OpStatus::Complete) return out;

  std::unique_ptr<Expr> expr;
  std::string err;
  if (!parseQuery(query, expr, &err)) {
    std::fprintf(stderr, "ScanBackend: bad query '%s': %s\n", query.c_str(), err.c_str());
    return out;
  }

  std::lock_guard<std::mutex> lock(job_->mtx);
  out.reserve(job_->paths.size());
  for (std::size_t i = 0; i < job_->paths.size(); ++i) {
    if (matchesPath(expr.get(), job_->paths[i])) {
      out.push_back(static_cast<ItemId>(i + 1));
    }
  }
  return out;
}

std::string ScanBackend::itemPath(ItemId id) {
  if (!job_ || static_cast<OpStatus>(job_->status.load()) != OpStatus::Complete) return {};
  std::lock_guard<std::mutex> lock(job_->mtx);
  if (id < 1 || static_cast<std::size_t>(id) > job_->paths.size()) return {};
  return job_->paths[static_cast<std::size_t>(id - 1)];
}

std::size_t ScanBackend::itemCount() {
  if (!job_ || static_cast<OpStatus>(job_->status.load()) != OpStatus::Complete) return 0;
  std::lock_guard<std::mutex> lock(job_->mtx);
  return job_->paths.size();
}

void ScanBackend::scanLoop(std::shared_ptr<ScanJob> job) {
  auto failJob = [&job](const std::string& msg) {
    {
      std::lock_guard<std::mutex> lock(job->mtx);
      job->error = msg;
    }
    job->status.store(static_cast<int>(OpStatus::Failed));
  };

  std::vector<fs::path> items;
  std::vector<fs::path> unscanned;

  std::error_code ec;
  fs::directory_iterator rootIt(job->root, ec);
  if (ec) {
    std::fprintf(stderr, "ScanBackend: scan of '%s' failed: %s\n",
                 job->root.c_str(), ec.message().c_str());
    failJob(ec.message());
    return;
  }
  classifyEntries(rootIt, config_.followDirectorySymlinks, items, unscanned);

  // Unreadable subdirectories are skipped.
  while (!unscanned.empty()) {
    if (job->cancelled.load()) {
      failJob("cancelled");
      return;
    }
    fs::path dir = std::move(unscanned.back());
    unscanned.pop_back();
    std::error_code dirEc;
    fs::directory_iterator it(dir, dirEc);
    if (dirEc) continue;
    classifyEntries(it, config_.followDirectorySymlinks, items, unscanned);
  }

  std::vector<std::string> rel;
  rel.reserve(items.size());
  const fs::path root(job->root);
  for (const auto& p : items) {
    rel.push_back(p.lexically_relative(root).generic_string());
  }
  std::sort(rel.begin(), rel.end());
  if (config_.maxItems > 0 && rel.size() > config_.maxItems) {
    rel.resize(config_.maxItems);
  }

  {
    std::lock_guard<std::mutex> lock(job->mtx);
    job->paths = std::move(rel);
  }
  job->status.store(static_cast<int>(OpStatus::Complete));
}

} // namespace tl
