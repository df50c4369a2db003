#ifndef STREAMFS_VFS_FS_HANDLER_RELEASE
#define STREAMFS_VFS_FS_HANDLER_RELEASE

#include "handler.hpp"

namespace streamfs {

struct Release final : public Handler<Release> {
  using Handler::Handler;

  int operator()(const char *path, struct fuse_file_info *fi) const {
    spdlog::debug("Release handler called for path: {}", path);
    return operations().release(fi->fh);
  }
};

} // namespace streamfs

#endif // STREAMFS_VFS_FS_HANDLER_RELEASE
