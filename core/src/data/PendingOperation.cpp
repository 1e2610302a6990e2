#include "tl/data/PendingOperation.hpp"

#include <chrono>
#include <string>
#include <thread>

namespace tl {

OpStatus pollUntilComplete(PendingOperation& op,
                           const std::function<void()>& onTick,
                           const PollConfig& config,
                           std::string* errorOut) {
  using Clock = std::chrono::steady_clock;
  const auto start = Clock::now();

  for (;;) {
    OpStatus st = op.poll();
    if (onTick) onTick();

    if (st != OpStatus::Pending) {
      if (st == OpStatus::Failed && errorOut) *errorOut = op.error();
      return st;
    }

    if (config.timeoutMs > 0 &&
        Clock::now() - start >= std::chrono::milliseconds(config.timeoutMs)) {
      if (errorOut) *errorOut = "timed out after " + std::to_string(config.timeoutMs) + " ms";
      return OpStatus::Failed;
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(config.intervalMs));
  }
}

} // namespace tl
