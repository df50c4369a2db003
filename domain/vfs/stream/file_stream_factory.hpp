#ifndef STREAMFS_VFS_STREAM_FILE_STREAM_FACTORY
#define STREAMFS_VFS_STREAM_FILE_STREAM_FACTORY

#include <memory>
#include <optional>

#include "file_stream.hpp"
#include "storage/completion_waiter.hpp"
#include "storage/file_status.hpp"
#include "storage/storage_client.hpp"

namespace streamfs {

// Picks the stream variant for an open or create request. Only read-only
// access is served; write access is rejected as unsupported.
Result<std::unique_ptr<FileStream>>
createFileStream(storage::StorageClient *client,
                 storage::CompletionWaiter &waiter, const char *path,
                 int flags, const std::optional<storage::FileStatus> &status);

} // namespace streamfs

#endif // STREAMFS_VFS_STREAM_FILE_STREAM_FACTORY
