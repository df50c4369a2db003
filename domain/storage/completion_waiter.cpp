#include "completion_waiter.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>
#include <thread>

namespace streamfs::storage {

bool PollingCompletionWaiter::waitForCompletion(const std::string &path) {
  using Clock = std::chrono::steady_clock;
  const auto deadline = Clock::now() + timeout_;

  while (true) {
    auto status = client_.getStatus(path);
    if (!status.is_ok()) {
      spdlog::warn("Stopped waiting for {}: status lookup failed: {}", path,
                   status.error().what());
      return false;
    }
    if (!status.value().has_value()) {
      spdlog::warn("Stopped waiting for {}: file no longer exists", path);
      return false;
    }
    if (status.value()->completed) {
      return true;
    }

    const auto now = Clock::now();
    if (now >= deadline) {
      spdlog::warn("Timed out after {} ms waiting for {} to complete",
                   timeout_.count(), path);
      return false;
    }
    std::this_thread::sleep_for(
        std::min<Clock::duration>(poll_interval_, deadline - now));
  }
}

} // namespace streamfs::storage
