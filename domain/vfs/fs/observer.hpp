#ifndef STREAMFS_VFS_FS_OBSERVER
#define STREAMFS_VFS_FS_OBSERVER

#define FUSE_USE_VERSION 31

#include "handlers/create.hpp"
#include "handlers/flush.hpp"
#include "handlers/getattr.hpp"
#include "handlers/open.hpp"
#include "handlers/read.hpp"
#include "handlers/readdir.hpp"
#include "handlers/release.hpp"
#include "handlers/truncate.hpp"
#include "handlers/write.hpp"
#include <fuse3/fuse.h>

namespace streamfs {

class FileSystemObserver {
public:
  explicit FileSystemObserver(State &state) : state_(state) {}

  int run(struct fuse_args &args) {
    return fuse_main(args.argc, args.argv, &ops_, &state_);
  }

private:
  State &state_;

  static void *init(struct fuse_conn_info *, struct fuse_config *cfg) {
    // Attributes are fetched from the backend on every lookup.
    cfg->attr_timeout = 0;
    cfg->entry_timeout = 0;
    return fuse_get_context()->private_data;
  }

  static int getattr(const char *path, struct stat *stbuf,
                     struct fuse_file_info *fi) {
    return Handler<Getattr>::callback(path, stbuf, fi);
  }

  static int truncate(const char *path, off_t size,
                      struct fuse_file_info *fi) {
    return Handler<Truncate>::callback(path, size, fi);
  }

  static int open(const char *path, struct fuse_file_info *fi) {
    return Handler<Open>::callback(path, fi);
  }

  static int read(const char *path, char *buf, size_t size, off_t offset,
                  struct fuse_file_info *fi) {
    return Handler<Read>::callback(path, buf, size, offset, fi);
  }

  static int write(const char *path, const char *buf, size_t size, off_t offset,
                   struct fuse_file_info *fi) {
    return Handler<Write>::callback(path, buf, size, offset, fi);
  }

  static int flush(const char *path, struct fuse_file_info *fi) {
    return Handler<Flush>::callback(path, fi);
  }

  static int release(const char *path, struct fuse_file_info *fi) {
    return Handler<Release>::callback(path, fi);
  }

  static int readdir(const char *path, void *buf, fuse_fill_dir_t filler,
                     off_t offset, struct fuse_file_info *fi,
                     enum fuse_readdir_flags flags) {
    return Handler<Readdir>::callback(path, buf, filler, offset, fi, flags);
  }

  static int create(const char *path, mode_t mode, struct fuse_file_info *fi) {
    return Handler<Create>::callback(path, mode, fi);
  }

  static inline struct fuse_operations ops_ = {
      .getattr = getattr,
      .truncate = truncate,
      .open = open,
      .read = read,
      .write = write,
      .flush = flush,
      .release = release,
      .readdir = readdir,
      .init = init,
      .create = create,
  };
};

} // namespace streamfs

#endif // STREAMFS_VFS_FS_OBSERVER
