#include "read_only_file_handle.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "storage/open_flags.hpp"

namespace streamfs {

namespace {

Error backendFailure(const std::string &operation, const std::string &path,
                     const std::exception &cause) {
  return Error::backend(
      fmt::format("{} failed for {}: {}", operation, path, cause.what()));
}

} // namespace

Result<std::unique_ptr<ReadOnlyFileHandle>> ReadOnlyFileHandle::create(
    storage::StorageClient *client, const char *path, int flags,
    const std::optional<storage::FileStatus> &status,
    storage::CompletionWaiter &waiter) {
  using HandleResult = Result<std::unique_ptr<ReadOnlyFileHandle>>;

  if (client == nullptr || path == nullptr) {
    return HandleResult::Error(Error::contract(
        "read-only stream requires a storage client and a path"));
  }

  if (storage::containsTruncate(flags)) {
    return HandleResult::Error(Error::unsupported(fmt::format(
        "Failed to create read-only stream for path {}: flags {:#x} contains "
        "truncate",
        path, flags)));
  }

  if (!status.has_value()) {
    return HandleResult::Error(Error::unsupported(fmt::format(
        "Failed to create read-only stream for {}: file does not exist",
        path)));
  }

  if (!status->completed) {
    spdlog::info("Waiting for {} to be completed before reading", path);
    if (!waiter.waitForCompletion(path)) {
      return HandleResult::Error(Error::unsupported(fmt::format(
          "Failed to create read-only stream for {}: incomplete file", path)));
    }
  }

  try {
    auto opened = client->openSequentialReader(path);
    if (!opened.is_ok()) {
      return HandleResult::Error(
          backendFailure("openSequentialReader", path, opened.error()));
    }

    spdlog::debug("Opened read-only stream for {} ({} bytes)", path,
                  status->length);
    return HandleResult::Ok(std::unique_ptr<ReadOnlyFileHandle>(
        new ReadOnlyFileHandle(std::move(opened).value(), status->length,
                               path)));
  } catch (const std::exception &e) {
    return HandleResult::Error(backendFailure("openSequentialReader", path, e));
  }
}

ReadOnlyFileHandle::~ReadOnlyFileHandle() {
  if (reader_) {
    auto closed = close();
    if (!closed.is_ok()) {
      core::utils::error_notification(closed.error());
    }
  }
}

Result<size_t> ReadOnlyFileHandle::read(std::span<char> buffer, int64_t size,
                                        int64_t offset) {
  if (size < 0 || offset < 0 || static_cast<uint64_t>(size) > buffer.size()) {
    return Result<size_t>::Error(Error::contract(fmt::format(
        "Buffer length: {}, offset: {}, size: {}", buffer.size(), offset,
        size)));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (!reader_) {
    return Result<size_t>::Error(closedError("read"));
  }
  if (size == 0) {
    return Result<size_t>::Ok(0);
  }
  if (static_cast<uint64_t>(offset) >= length_) {
    return Result<size_t>::Ok(0);
  }

  // Bytes appended after open stay invisible.
  const auto wanted = static_cast<size_t>(std::min<uint64_t>(
      static_cast<uint64_t>(size), length_ - static_cast<uint64_t>(offset)));
  size_t total = 0;

  try {
    auto seeked = reader_->seek(static_cast<uint64_t>(offset));
    if (!seeked.is_ok()) {
      return Result<size_t>::Error(backendFailure("seek", path_, seeked.error()));
    }

    while (total < wanted) {
      auto filled = reader_->read(buffer.subspan(total, wanted - total));
      if (!filled.is_ok()) {
        return Result<size_t>::Error(
            backendFailure("read", path_, filled.error()));
      }

      const int64_t count = filled.value();
      if (count <= 0) {
        break;
      }
      if (static_cast<uint64_t>(count) > wanted - total) {
        return Result<size_t>::Error(Error::backend(fmt::format(
            "read of {} returned {} bytes for a {} byte request", path_, count,
            wanted - total)));
      }
      total += static_cast<size_t>(count);
    }
  } catch (const std::exception &e) {
    return Result<size_t>::Error(backendFailure("read", path_, e));
  }

  spdlog::debug("Read {} of {} bytes at offset {} from {}", total, wanted,
                offset, path_);
  return Result<size_t>::Ok(total);
}

Result<void> ReadOnlyFileHandle::write(std::span<const char>, int64_t,
                                       int64_t) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!reader_) {
    return Result<void>::Error(closedError("write"));
  }
  return Result<void>::Error(Error::unsupported(
      "Cannot write to read-only stream of path " + path_));
}

Result<void> ReadOnlyFileHandle::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!reader_) {
    return Result<void>::Error(closedError("flush"));
  }
  return Result<void>::Ok();
}

Result<void> ReadOnlyFileHandle::truncate(int64_t) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!reader_) {
    return Result<void>::Error(closedError("truncate"));
  }
  return Result<void>::Error(Error::unsupported(
      "Cannot truncate read-only stream of path " + path_));
}

Error ReadOnlyFileHandle::closedError(const char *operation) const {
  return Error::contract(
      fmt::format("{} on closed stream of path {}", operation, path_));
}

Result<void> ReadOnlyFileHandle::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!reader_) {
    return Result<void>::Error(
        Error::contract("read-only stream already closed: " + path_));
  }

  // The reader is released even when its close fails.
  auto reader = std::move(reader_);
  try {
    auto closed = reader->close();
    if (!closed.is_ok()) {
      return Result<void>::Error(
          backendFailure("close", path_, closed.error()));
    }
  } catch (const std::exception &e) {
    return Result<void>::Error(backendFailure("close", path_, e));
  }

  spdlog::debug("Closed read-only stream of {}", path_);
  return Result<void>::Ok();
}

} // namespace streamfs
