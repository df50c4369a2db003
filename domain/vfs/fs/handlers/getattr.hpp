#ifndef STREAMFS_VFS_FS_HANDLER_GETATTR
#define STREAMFS_VFS_FS_HANDLER_GETATTR

#include "handler.hpp"
#include <sys/stat.h>

namespace streamfs {

struct Getattr final : public Handler<Getattr> {
  using Handler::Handler;

  int operator()(const char *path, struct stat *stbuf,
                 struct fuse_file_info *) const {
    spdlog::debug("Getattr handler called for path: {}", path);
    return operations().getattr(path, stbuf);
  }
};

} // namespace streamfs

#endif // STREAMFS_VFS_FS_HANDLER_GETATTR
