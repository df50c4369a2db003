#include "local_storage_client.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <unistd.h>

namespace streamfs::storage {

namespace {

std::runtime_error systemError(const std::string &what,
                               const std::string &path, int error) {
  return std::runtime_error(
      fmt::format("{} {}: {}", what, path, std::strerror(error)));
}

std::string joinVirtual(const std::string &dir, const std::string &name) {
  if (dir.empty() || dir.back() == '/') {
    return dir + name;
  }
  return dir + "/" + name;
}

} // namespace

LocalSequentialReader::~LocalSequentialReader() {
  if (fd_ >= 0) {
    if (::close(fd_) != 0) {
      spdlog::error("Failed to close {} on destruction: {}", path_,
                    std::strerror(errno));
    }
  }
}

core::Result<void> LocalSequentialReader::seek(uint64_t offset) {
  if (fd_ < 0) {
    return core::Result<void>::Error(
        std::runtime_error("seek on closed reader: " + path_));
  }
  if (::lseek(fd_, static_cast<off_t>(offset), SEEK_SET) < 0) {
    return core::Result<void>::Error(systemError("lseek", path_, errno));
  }
  return core::Result<void>::Ok();
}

core::Result<int64_t> LocalSequentialReader::read(std::span<char> destination) {
  if (fd_ < 0) {
    return core::Result<int64_t>::Error(
        std::runtime_error("read on closed reader: " + path_));
  }

  while (true) {
    const ssize_t count = ::read(fd_, destination.data(), destination.size());
    if (count >= 0) {
      return core::Result<int64_t>::Ok(static_cast<int64_t>(count));
    }
    if (errno != EINTR) {
      return core::Result<int64_t>::Error(systemError("read", path_, errno));
    }
  }
}

core::Result<void> LocalSequentialReader::close() {
  if (fd_ < 0) {
    return core::Result<void>::Error(
        std::runtime_error("reader already closed: " + path_));
  }
  const int fd = fd_;
  fd_ = -1;
  if (::close(fd) != 0) {
    return core::Result<void>::Error(systemError("close", path_, errno));
  }
  return core::Result<void>::Ok();
}

fs::path LocalStorageClient::resolve(const std::string &path) const {
  fs::path relative(path);
  if (relative.has_root_path()) {
    relative = relative.relative_path();
  }
  return (root_ / relative).lexically_normal();
}

bool LocalStorageClient::isMarker(const fs::path &native) const {
  const std::string name = native.filename().string();
  return name.size() > incomplete_suffix_.size() &&
         name.ends_with(incomplete_suffix_);
}

core::Result<std::unique_ptr<SequentialReader>>
LocalStorageClient::openSequentialReader(const std::string &path) {
  const auto native = resolve(path);
  const int fd = ::open(native.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return core::Result<std::unique_ptr<SequentialReader>>::Error(
        systemError("open", native.string(), errno));
  }

  spdlog::debug("Opened {} as {}", path, native.string());
  return core::Result<std::unique_ptr<SequentialReader>>::Ok(
      std::make_unique<LocalSequentialReader>(fd, native.string()));
}

core::Result<std::optional<FileStatus>>
LocalStorageClient::getStatus(const std::string &path) {
  const auto native = resolve(path);
  if (isMarker(native)) {
    return core::Result<std::optional<FileStatus>>::Ok(std::nullopt);
  }
  return statNative(native, path);
}

core::Result<std::optional<FileStatus>>
LocalStorageClient::statNative(const fs::path &native,
                               const std::string &path) const {
  struct stat st {};
  if (::stat(native.c_str(), &st) != 0) {
    if (errno == ENOENT || errno == ENOTDIR) {
      return core::Result<std::optional<FileStatus>>::Ok(std::nullopt);
    }
    return core::Result<std::optional<FileStatus>>::Error(
        systemError("stat", native.string(), errno));
  }

  FileStatus status;
  status.path = path;
  status.directory = S_ISDIR(st.st_mode);
  status.length = status.directory ? 0 : static_cast<uint64_t>(st.st_size);
  status.mode = st.st_mode;
  status.last_modified = st.st_mtime;

  if (!status.directory) {
    std::error_code ec;
    const bool marked = fs::exists(
        fs::path(native.string() + incomplete_suffix_), ec);
    if (ec) {
      return core::Result<std::optional<FileStatus>>::Error(
          std::runtime_error(fmt::format("marker lookup for {}: {}",
                                         native.string(), ec.message())));
    }
    status.completed = !marked;
  }

  return core::Result<std::optional<FileStatus>>::Ok(std::move(status));
}

core::Result<std::vector<FileStatus>>
LocalStorageClient::listStatus(const std::string &path) {
  const auto native = resolve(path);
  std::vector<FileStatus> entries;

  try {
    for (const auto &entry : fs::directory_iterator(native)) {
      if (isMarker(entry.path())) {
        continue;
      }

      const auto name = entry.path().filename().string();
      auto status = statNative(entry.path(), joinVirtual(path, name));
      if (!status.is_ok()) {
        return core::Result<std::vector<FileStatus>>::Error(
            std::move(status).error());
      }
      // Entry removed between listing and stat.
      if (status.value().has_value()) {
        entries.push_back(std::move(*status.value()));
      }
    }
  } catch (const fs::filesystem_error &e) {
    return core::Result<std::vector<FileStatus>>::Error(
        std::runtime_error(fmt::format("listStatus {}: {}", path, e.what())));
  }

  return core::Result<std::vector<FileStatus>>::Ok(std::move(entries));
}

} // namespace streamfs::storage
