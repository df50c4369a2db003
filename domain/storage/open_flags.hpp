#ifndef STREAMFS_STORAGE_OPEN_FLAGS
#define STREAMFS_STORAGE_OPEN_FLAGS

#include <fcntl.h>

namespace streamfs::storage {

inline bool containsTruncate(int flags) { return (flags & O_TRUNC) != 0; }

inline bool isReadOnly(int flags) { return (flags & O_ACCMODE) == O_RDONLY; }

} // namespace streamfs::storage

#endif // STREAMFS_STORAGE_OPEN_FLAGS
