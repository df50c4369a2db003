#ifndef STREAMFS_VFS_FS_ERRNO
#define STREAMFS_VFS_FS_ERRNO

#include <cerrno>

#include "vfs/stream/file_stream.hpp"

namespace streamfs {

// Negative errno handed back to libfuse.
inline int toErrno(const Error &error) {
  switch (error.kind()) {
  case ErrorKind::kContractViolation:
    return -EINVAL;
  case ErrorKind::kUnsupportedOperation:
    return -EPERM;
  case ErrorKind::kBackendIo:
    return -EIO;
  }
  return -EIO;
}

} // namespace streamfs

#endif // STREAMFS_VFS_FS_ERRNO
