#ifndef STREAMFS_STORAGE_LOCAL_LOCAL_STORAGE_CLIENT
#define STREAMFS_STORAGE_LOCAL_LOCAL_STORAGE_CLIENT

#include <filesystem>
#include <string>

#include "storage/storage_client.hpp"

namespace streamfs::storage {

namespace fs = std::filesystem;

class LocalSequentialReader final : public SequentialReader {
public:
  LocalSequentialReader(int fd, std::string path)
      : fd_(fd), path_(std::move(path)) {}

  LocalSequentialReader(const LocalSequentialReader &) = delete;
  LocalSequentialReader &operator=(const LocalSequentialReader &) = delete;

  ~LocalSequentialReader() override;

  core::Result<void> seek(uint64_t offset) override;
  core::Result<int64_t> read(std::span<char> destination) override;
  core::Result<void> close() override;

private:
  int fd_;
  std::string path_;
};

// Serves the files below a root directory. A regular file counts as
// incomplete while "<file><incomplete_suffix>" exists beside it.
class LocalStorageClient final : public StorageClient {
public:
  static constexpr const char *kDefaultIncompleteSuffix = ".inprogress";

  explicit LocalStorageClient(
      fs::path root, std::string incomplete_suffix = kDefaultIncompleteSuffix)
      : root_(std::move(root)),
        incomplete_suffix_(std::move(incomplete_suffix)) {}

  core::Result<std::unique_ptr<SequentialReader>>
  openSequentialReader(const std::string &path) override;

  core::Result<std::optional<FileStatus>>
  getStatus(const std::string &path) override;

  core::Result<std::vector<FileStatus>>
  listStatus(const std::string &path) override;

  const fs::path &root() const { return root_; }

private:
  fs::path root_;
  std::string incomplete_suffix_;

  fs::path resolve(const std::string &path) const;
  bool isMarker(const fs::path &native) const;
  core::Result<std::optional<FileStatus>>
  statNative(const fs::path &native, const std::string &path) const;
};

} // namespace streamfs::storage

#endif // STREAMFS_STORAGE_LOCAL_LOCAL_STORAGE_CLIENT
