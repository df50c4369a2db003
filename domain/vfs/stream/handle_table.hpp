#ifndef STREAMFS_VFS_STREAM_HANDLE_TABLE
#define STREAMFS_VFS_STREAM_HANDLE_TABLE

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>

#include "file_stream.hpp"

namespace streamfs {

// Maps fuse_file_info::fh values to open streams. Ids start at 1.
class HandleTable {
public:
  uint64_t insert(std::shared_ptr<FileStream> stream) {
    std::unique_lock lock(mutex_);
    const uint64_t id = next_id_++;
    streams_.emplace(id, std::move(stream));
    return id;
  }

  std::shared_ptr<FileStream> find(uint64_t id) const {
    std::shared_lock lock(mutex_);
    auto it = streams_.find(id);
    return it == streams_.end() ? nullptr : it->second;
  }

  std::shared_ptr<FileStream> erase(uint64_t id) {
    std::unique_lock lock(mutex_);
    auto it = streams_.find(id);
    if (it == streams_.end()) {
      return nullptr;
    }
    auto stream = std::move(it->second);
    streams_.erase(it);
    return stream;
  }

  size_t size() const {
    std::shared_lock lock(mutex_);
    return streams_.size();
  }

private:
  mutable std::shared_mutex mutex_;
  std::map<uint64_t, std::shared_ptr<FileStream>> streams_;
  uint64_t next_id_{1};
};

} // namespace streamfs

#endif // STREAMFS_VFS_STREAM_HANDLE_TABLE
