#ifndef STREAMFS_VFS_FS_HANDLER_OPEN
#define STREAMFS_VFS_FS_HANDLER_OPEN

#include "handler.hpp"

namespace streamfs {

struct Open final : public Handler<Open> {
  using Handler::Handler;

  int operator()(const char *path, struct fuse_file_info *fi) const {
    spdlog::info("Open handler called for path: {} (flags {:#x})", path,
                 fi->flags);

    uint64_t fh = 0;
    const int rc = operations().open(path, fi->flags, fh);
    if (rc == 0) {
      fi->fh = fh;
    }
    return rc;
  }
};

} // namespace streamfs

#endif // STREAMFS_VFS_FS_HANDLER_OPEN
