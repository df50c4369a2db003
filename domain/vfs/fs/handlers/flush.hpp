#ifndef STREAMFS_VFS_FS_HANDLER_FLUSH
#define STREAMFS_VFS_FS_HANDLER_FLUSH

#include "handler.hpp"

namespace streamfs {

struct Flush final : public Handler<Flush> {
  using Handler::Handler;

  int operator()(const char *path, struct fuse_file_info *fi) const {
    spdlog::debug("Flush handler called for path: {}", path);
    return operations().flush(fi->fh);
  }
};

} // namespace streamfs

#endif // STREAMFS_VFS_FS_HANDLER_FLUSH
