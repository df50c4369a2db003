#ifndef STREAMFS_STORAGE_COMPLETION_WAITER
#define STREAMFS_STORAGE_COMPLETION_WAITER

#include <chrono>
#include <string>

#include "storage_client.hpp"

namespace streamfs::storage {

class CompletionWaiter {
public:
  virtual ~CompletionWaiter() = default;

  // Blocks until the file is complete. False means the wait gave up.
  virtual bool waitForCompletion(const std::string &path) = 0;
};

class PollingCompletionWaiter final : public CompletionWaiter {
public:
  static constexpr std::chrono::milliseconds kDefaultTimeout{5000};
  static constexpr std::chrono::milliseconds kDefaultPollInterval{50};

  explicit PollingCompletionWaiter(
      StorageClient &client,
      std::chrono::milliseconds timeout = kDefaultTimeout,
      std::chrono::milliseconds poll_interval = kDefaultPollInterval)
      : client_(client), timeout_(timeout), poll_interval_(poll_interval) {}

  bool waitForCompletion(const std::string &path) override;

private:
  StorageClient &client_;
  std::chrono::milliseconds timeout_;
  std::chrono::milliseconds poll_interval_;
};

} // namespace streamfs::storage

#endif // STREAMFS_STORAGE_COMPLETION_WAITER
