#ifndef STREAMFS_VFS_FS_HANDLER
#define STREAMFS_VFS_FS_HANDLER

#define FUSE_USE_VERSION 31

#include <cerrno>
#include <fuse3/fuse.h>
#include <spdlog/spdlog.h>
#include <type_traits>

#include "operations/file.hpp"
#include "vfs/domain.hpp"

namespace streamfs {

template <typename Derived> class Handler {
protected:
  State &state_;

  FileOperations operations() const { return FileOperations(state_); }

public:
  Handler() = delete;
  ~Handler() = default;

  explicit Handler(State &state) : state_(state) {}

  template <typename... Args> static int callback(Args &&...args) {
    static_assert(std::is_invocable_r_v<int, const Derived &, Args...>,
                  "Derived class must have appropriate operator()");

    struct fuse_context *ctx = fuse_get_context();

    if (ctx && ctx->private_data) {
      const Derived handler(*static_cast<State *>(ctx->private_data));
      return handler(std::forward<Args>(args)...);
    }

    spdlog::warn("No private_data in fuse_context, rejecting request");

    return -ENOSYS;
  }
};

} // namespace streamfs

#endif // STREAMFS_VFS_FS_HANDLER
