#ifndef STREAMFS_VFS_FS_HANDLER_READ
#define STREAMFS_VFS_FS_HANDLER_READ

#include "handler.hpp"
#include <span>

namespace streamfs {

struct Read final : public Handler<Read> {
  using Handler::Handler;

  int operator()(const char *path, char *buf, size_t size, off_t offset,
                 struct fuse_file_info *fi) const {
    spdlog::debug("Read handler called for path: {} ({} bytes at {})", path,
                  size, offset);
    return operations().read(fi->fh, std::span<char>(buf, size), size,
                             offset);
  }
};

} // namespace streamfs

#endif // STREAMFS_VFS_FS_HANDLER_READ
