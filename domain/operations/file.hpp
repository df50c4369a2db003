#ifndef STREAMFS_OPERATIONS_FILE
#define STREAMFS_OPERATIONS_FILE

#include <cstdint>
#include <optional>
#include <span>
#include <sys/stat.h>
#include <vector>

#include "storage/file_status.hpp"
#include "vfs/domain.hpp"

namespace streamfs {

// Per-request file logic behind the FUSE handlers. Every method returns 0 or
// a byte count on success and a negative errno on failure.
class FileOperations {
public:
  explicit FileOperations(State &state) : state_(state) {}

  int getattr(const char *path, struct stat *stbuf) const;

  int listDirectory(const char *path,
                    std::vector<storage::FileStatus> &entries) const;

  int open(const char *path, int flags, uint64_t &fh);

  int read(uint64_t fh, std::span<char> buffer, size_t size, off_t offset);

  int write(uint64_t fh, std::span<const char> buffer, size_t size,
            off_t offset);

  int flush(uint64_t fh);

  int truncate(const char *path, off_t size, std::optional<uint64_t> fh);

  int release(uint64_t fh);

private:
  State &state_;
};

void fillStat(const storage::FileStatus &status, struct stat *stbuf);

} // namespace streamfs

#endif // STREAMFS_OPERATIONS_FILE
