#ifndef STREAMFS_VFS_FS_HANDLER_CREATE
#define STREAMFS_VFS_FS_HANDLER_CREATE

#include "handler.hpp"

namespace streamfs {

// Goes through the same validation as open, so creating a file that does
// not exist yet is rejected.
struct Create final : public Handler<Create> {
  using Handler::Handler;

  int operator()(const char *path, mode_t mode,
                 struct fuse_file_info *fi) const {
    spdlog::debug("Create handler called for path: {} (mode {:o})", path,
                  mode);

    uint64_t fh = 0;
    const int rc = operations().open(path, fi->flags, fh);
    if (rc == 0) {
      fi->fh = fh;
    }
    return rc;
  }
};

} // namespace streamfs

#endif // STREAMFS_VFS_FS_HANDLER_CREATE
