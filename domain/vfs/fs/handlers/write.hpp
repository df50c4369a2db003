#ifndef STREAMFS_VFS_FS_HANDLER_WRITE
#define STREAMFS_VFS_FS_HANDLER_WRITE

#include "handler.hpp"
#include <span>

namespace streamfs {

struct Write final : public Handler<Write> {
  using Handler::Handler;

  int operator()(const char *path, const char *buf, size_t size, off_t offset,
                 struct fuse_file_info *fi) const {
    spdlog::debug("Write handler called for path: {}", path);
    return operations().write(fi->fh, std::span<const char>(buf, size), size,
                              offset);
  }
};

} // namespace streamfs

#endif // STREAMFS_VFS_FS_HANDLER_WRITE
