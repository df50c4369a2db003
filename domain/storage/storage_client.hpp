#ifndef STREAMFS_STORAGE_STORAGE_CLIENT
#define STREAMFS_STORAGE_STORAGE_CLIENT

#include <infrastructure/result.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "file_status.hpp"
#include "sequential_reader.hpp"

namespace streamfs::storage {

class StorageClient {
public:
  virtual ~StorageClient() = default;

  virtual core::Result<std::unique_ptr<SequentialReader>>
  openSequentialReader(const std::string &path) = 0;

  // An empty optional means the path does not exist.
  virtual core::Result<std::optional<FileStatus>>
  getStatus(const std::string &path) = 0;

  virtual core::Result<std::vector<FileStatus>>
  listStatus(const std::string &path) = 0;
};

} // namespace streamfs::storage

#endif // STREAMFS_STORAGE_STORAGE_CLIENT
