#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace tl {

enum class OpStatus : std::uint8_t { Pending, Complete, Failed };

// One asynchronous backend call in flight. Polled from the UI thread.
class PendingOperation {
public:
  virtual ~PendingOperation() = default;
  virtual OpStatus poll() = 0;
  virtual const std::string& error() const = 0;
};

struct PollConfig {
  int intervalMs{50};
  int timeoutMs{0}; // 0 = wait forever
};

// Polls `op` until it leaves Pending, calling onTick after every poll.
// On timeout returns Failed and writes the reason to `errorOut` (if non-null).
OpStatus pollUntilComplete(PendingOperation& op,
                           const std::function<void()>& onTick,
                           const PollConfig& config = {},
                           std::string* errorOut = nullptr);

// Operation that has already finished (synchronous backends, early failures).
class FinishedOperation : public PendingOperation {
public:
  explicit FinishedOperation(OpStatus status, std::string error = {})
    : status_(status), error_(std::move(error)) {}

  OpStatus poll() override { return status_; }
  const std::string& error() const override { return error_; }

private:
  OpStatus status_;
  std::string error_;
};

} // namespace tl
