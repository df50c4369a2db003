#include "file.hpp"

#include <cerrno>
#include <climits>
#include <cstring>
#include <spdlog/spdlog.h>
#include <unistd.h>

#include "vfs/fs/errno.hpp"
#include "vfs/stream/file_stream_factory.hpp"

namespace streamfs {

namespace {

int reject(const Error &error) {
  core::utils::error_notification(error);
  return toErrno(error);
}

} // namespace

void fillStat(const storage::FileStatus &status, struct stat *stbuf) {
  std::memset(stbuf, 0, sizeof(struct stat));

  if (status.directory) {
    stbuf->st_mode = S_IFDIR | 0555;
    stbuf->st_nlink = 2;
  } else {
    stbuf->st_mode = S_IFREG | 0444;
    stbuf->st_nlink = 1;
    stbuf->st_size = static_cast<off_t>(status.length);
  }
  stbuf->st_uid = getuid();
  stbuf->st_gid = getgid();
  stbuf->st_atime = stbuf->st_mtime = stbuf->st_ctime = status.last_modified;
}

int FileOperations::getattr(const char *path, struct stat *stbuf) const {
  auto status = state_.client_->getStatus(path);
  if (!status.is_ok()) {
    spdlog::error("getattr {}: {}", path, status.error().what());
    return -EIO;
  }
  if (!status.value().has_value()) {
    return -ENOENT;
  }

  fillStat(*status.value(), stbuf);
  return 0;
}

int FileOperations::listDirectory(
    const char *path, std::vector<storage::FileStatus> &entries) const {
  auto status = state_.client_->getStatus(path);
  if (!status.is_ok()) {
    spdlog::error("readdir {}: {}", path, status.error().what());
    return -EIO;
  }
  if (!status.value().has_value()) {
    return -ENOENT;
  }
  if (!status.value()->directory) {
    return -ENOTDIR;
  }

  auto listed = state_.client_->listStatus(path);
  if (!listed.is_ok()) {
    spdlog::error("readdir {}: {}", path, listed.error().what());
    return -EIO;
  }

  entries = std::move(listed).value();
  return 0;
}

int FileOperations::open(const char *path, int flags, uint64_t &fh) {
  auto status = state_.client_->getStatus(path);
  if (!status.is_ok()) {
    spdlog::error("open {}: {}", path, status.error().what());
    return -EIO;
  }

  auto stream = createFileStream(state_.client_.get(), *state_.waiter_, path,
                                 flags, status.value());
  if (!stream.is_ok()) {
    return reject(stream.error());
  }

  fh = state_.handles_.insert(std::move(stream).value());
  spdlog::info("Opened {} as handle {}", path, fh);
  return 0;
}

int FileOperations::read(uint64_t fh, std::span<char> buffer, size_t size,
                         off_t offset) {
  auto stream = state_.handles_.find(fh);
  if (!stream) {
    return -EBADF;
  }
  if (size > static_cast<size_t>(INT_MAX)) {
    size = static_cast<size_t>(INT_MAX);
  }

  auto result = stream->read(buffer, static_cast<int64_t>(size), offset);
  if (!result.is_ok()) {
    return reject(result.error());
  }
  return static_cast<int>(result.value());
}

int FileOperations::write(uint64_t fh, std::span<const char> buffer,
                          size_t size, off_t offset) {
  auto stream = state_.handles_.find(fh);
  if (!stream) {
    return -EBADF;
  }

  auto result = stream->write(buffer, static_cast<int64_t>(size), offset);
  if (!result.is_ok()) {
    return reject(result.error());
  }
  return static_cast<int>(size);
}

int FileOperations::flush(uint64_t fh) {
  auto stream = state_.handles_.find(fh);
  if (!stream) {
    return -EBADF;
  }

  auto result = stream->flush();
  return result.is_ok() ? 0 : reject(result.error());
}

int FileOperations::truncate(const char *path, off_t size,
                             std::optional<uint64_t> fh) {
  if (!fh) {
    spdlog::warn("Rejected truncate of {} to {} bytes: read-only filesystem",
                 path, size);
    return -EPERM;
  }

  auto stream = state_.handles_.find(*fh);
  if (!stream) {
    return -EBADF;
  }

  auto result = stream->truncate(size);
  return result.is_ok() ? 0 : reject(result.error());
}

int FileOperations::release(uint64_t fh) {
  auto stream = state_.handles_.erase(fh);
  if (!stream) {
    return -EBADF;
  }

  auto result = stream->close();
  if (!result.is_ok()) {
    return reject(result.error());
  }
  spdlog::info("Released handle {}", fh);
  return 0;
}

} // namespace streamfs
