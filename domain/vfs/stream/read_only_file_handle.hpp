#ifndef STREAMFS_VFS_STREAM_READ_ONLY_FILE_HANDLE
#define STREAMFS_VFS_STREAM_READ_ONLY_FILE_HANDLE

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "file_stream.hpp"
#include "storage/completion_waiter.hpp"
#include "storage/file_status.hpp"
#include "storage/storage_client.hpp"

namespace streamfs {

// Read-only stream over one backend file. Every operation takes mutex_ and
// fails as a contract violation once the stream is closed. Reads hold it for
// the whole seek and fill sequence since the backend has a single cursor.
// The length comes from the status passed to create() and is never refreshed.
class ReadOnlyFileHandle final : public FileStream {
public:
  // Checks run in order and stop at the first failure: client and path,
  // O_TRUNC, existence, completion (blocking on the waiter). The backend
  // reader is opened last.
  static Result<std::unique_ptr<ReadOnlyFileHandle>>
  create(storage::StorageClient *client, const char *path, int flags,
         const std::optional<storage::FileStatus> &status,
         storage::CompletionWaiter &waiter);

  ReadOnlyFileHandle(const ReadOnlyFileHandle &) = delete;
  ReadOnlyFileHandle &operator=(const ReadOnlyFileHandle &) = delete;

  ~ReadOnlyFileHandle() override;

  Result<size_t> read(std::span<char> buffer, int64_t size,
                      int64_t offset) override;

  Result<void> write(std::span<const char> buffer, int64_t size,
                     int64_t offset) override;

  Result<void> flush() override;

  Result<void> truncate(int64_t size) override;

  uint64_t getLength() const override { return length_; }

  Result<void> close() override;

  const std::string &path() const { return path_; }

private:
  ReadOnlyFileHandle(std::unique_ptr<storage::SequentialReader> reader,
                     uint64_t length, std::string path)
      : reader_(std::move(reader)), length_(length), path_(std::move(path)) {}

  // Caller holds mutex_.
  Error closedError(const char *operation) const;

  std::mutex mutex_;
  std::unique_ptr<storage::SequentialReader> reader_;
  const uint64_t length_;
  const std::string path_;
};

} // namespace streamfs

#endif // STREAMFS_VFS_STREAM_READ_ONLY_FILE_HANDLE
