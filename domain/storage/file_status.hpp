#ifndef STREAMFS_STORAGE_FILE_STATUS
#define STREAMFS_STORAGE_FILE_STATUS

#include <cstdint>
#include <ctime>
#include <string>
#include <sys/types.h>

namespace streamfs::storage {

struct FileStatus {
  std::string path;
  uint64_t length{0};
  bool completed{true};
  bool directory{false};
  mode_t mode{0};
  time_t last_modified{0};
};

} // namespace streamfs::storage

#endif // STREAMFS_STORAGE_FILE_STATUS
