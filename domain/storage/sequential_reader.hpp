#ifndef STREAMFS_STORAGE_SEQUENTIAL_READER
#define STREAMFS_STORAGE_SEQUENTIAL_READER

#include <cstdint>
#include <infrastructure/result.hpp>
#include <span>

namespace streamfs::storage {

// Single-cursor stream over one backend file. Not safe for concurrent use.
class SequentialReader {
public:
  virtual ~SequentialReader() = default;

  virtual core::Result<void> seek(uint64_t offset) = 0;

  // Fills at most destination.size() bytes from the cursor and advances it.
  // A non-positive count means end of stream.
  virtual core::Result<int64_t> read(std::span<char> destination) = 0;

  virtual core::Result<void> close() = 0;
};

} // namespace streamfs::storage

#endif // STREAMFS_STORAGE_SEQUENTIAL_READER
