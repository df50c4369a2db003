#ifndef STREAMFS_VFS_FS_HANDLER_TRUNCATE
#define STREAMFS_VFS_FS_HANDLER_TRUNCATE

#include "handler.hpp"
#include <optional>

namespace streamfs {

struct Truncate final : public Handler<Truncate> {
  using Handler::Handler;

  int operator()(const char *path, off_t size,
                 struct fuse_file_info *fi) const {
    spdlog::debug("Truncate handler called for path: {}", path);
    return operations().truncate(
        path, size, fi ? std::optional<uint64_t>(fi->fh) : std::nullopt);
  }
};

} // namespace streamfs

#endif // STREAMFS_VFS_FS_HANDLER_TRUNCATE
