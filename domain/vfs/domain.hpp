#ifndef STREAMFS_VFS_DOMAIN
#define STREAMFS_VFS_DOMAIN

#include <memory>

#include "config/config.hpp"
#include "storage/completion_waiter.hpp"
#include "storage/local/local_storage_client.hpp"
#include "storage/storage_client.hpp"
#include "vfs/stream/handle_table.hpp"

namespace streamfs {

struct State {
  explicit State(Config config)
      : config_(std::move(config)),
        client_(std::make_unique<storage::LocalStorageClient>(
            config_.storage.root, config_.storage.incomplete_suffix)),
        waiter_(std::make_unique<storage::PollingCompletionWaiter>(
            *client_, config_.completion_wait.timeout,
            config_.completion_wait.poll_interval)) {}

  State(Config config, std::unique_ptr<storage::StorageClient> client,
        std::unique_ptr<storage::CompletionWaiter> waiter)
      : config_(std::move(config)), client_(std::move(client)),
        waiter_(std::move(waiter)) {}

  Config config_;
  std::unique_ptr<storage::StorageClient> client_;
  std::unique_ptr<storage::CompletionWaiter> waiter_;
  HandleTable handles_;
};

} // namespace streamfs

#endif // STREAMFS_VFS_DOMAIN
