#ifndef STREAMFS_VFS_FS_HANDLER_READDIR
#define STREAMFS_VFS_FS_HANDLER_READDIR

#include "handler.hpp"
#include <sys/stat.h>
#include <vector>

namespace streamfs {

struct Readdir final : public Handler<Readdir> {
  using Handler::Handler;

  int operator()(const char *path, void *buf, fuse_fill_dir_t filler, off_t,
                 struct fuse_file_info *, enum fuse_readdir_flags) const {
    spdlog::debug("Readdir handler called for path: {}", path);

    std::vector<storage::FileStatus> entries;
    if (int rc = operations().listDirectory(path, entries); rc != 0) {
      return rc;
    }

    filler(buf, ".", nullptr, 0, static_cast<fuse_fill_dir_flags>(0));
    filler(buf, "..", nullptr, 0, static_cast<fuse_fill_dir_flags>(0));

    for (const auto &entry : entries) {
      struct stat st;
      fillStat(entry, &st);

      const auto slash = entry.path.find_last_of('/');
      const std::string name = slash == std::string::npos
                                   ? entry.path
                                   : entry.path.substr(slash + 1);
      if (filler(buf, name.c_str(), &st, 0,
                 static_cast<fuse_fill_dir_flags>(0)) != 0) {
        break;
      }
    }

    return 0;
  }
};

} // namespace streamfs

#endif // STREAMFS_VFS_FS_HANDLER_READDIR
