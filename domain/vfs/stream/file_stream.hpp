#ifndef STREAMFS_VFS_STREAM_FILE_STREAM
#define STREAMFS_VFS_STREAM_FILE_STREAM

#include <cstddef>
#include <cstdint>
#include <infrastructure/result.hpp>
#include <span>
#include <utils/error.hpp>

namespace streamfs {

using Error = core::utils::Error;
using ErrorKind = core::utils::ErrorKind;

template <typename T> using Result = core::Result<T, Error>;

// Per-open-file stream behind one FUSE file handle.
class FileStream {
public:
  virtual ~FileStream() = default;

  virtual Result<size_t> read(std::span<char> buffer, int64_t size,
                              int64_t offset) = 0;

  virtual Result<void> write(std::span<const char> buffer, int64_t size,
                             int64_t offset) = 0;

  virtual Result<void> flush() = 0;

  virtual Result<void> truncate(int64_t size) = 0;

  virtual uint64_t getLength() const = 0;

  virtual Result<void> close() = 0;
};

} // namespace streamfs

#endif // STREAMFS_VFS_STREAM_FILE_STREAM
