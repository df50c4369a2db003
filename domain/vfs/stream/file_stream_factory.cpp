#include "file_stream_factory.hpp"

#include <fmt/format.h>

#include "read_only_file_handle.hpp"
#include "storage/open_flags.hpp"

namespace streamfs {

Result<std::unique_ptr<FileStream>>
createFileStream(storage::StorageClient *client,
                 storage::CompletionWaiter &waiter, const char *path,
                 int flags, const std::optional<storage::FileStatus> &status) {
  using StreamResult = Result<std::unique_ptr<FileStream>>;

  if (path == nullptr) {
    return StreamResult::Error(Error::contract("file stream requires a path"));
  }

  if (!storage::isReadOnly(flags)) {
    return StreamResult::Error(Error::unsupported(
        fmt::format("Failed to create stream for {}: flags {:#x} request "
                    "write access",
                    path, flags)));
  }

  auto handle =
      ReadOnlyFileHandle::create(client, path, flags, status, waiter);
  if (!handle.is_ok()) {
    return StreamResult::Error(std::move(handle).error());
  }
  return StreamResult::Ok(std::move(handle).value());
}

} // namespace streamfs
