#ifndef CHUNKFS_DOWNLOAD_CHUNK_BUFFER_HPP
#define CHUNKFS_DOWNLOAD_CHUNK_BUFFER_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace chunkfs {
namespace download {

// The single chunk a download stream keeps resident
struct ChunkBuffer {
  std::optional<uint32_t> index;
  std::shared_ptr<const std::vector<uint8_t>> bytes;
  // Logical file position of bytes[0]
  uint64_t start{0};

  bool holds(uint32_t n) const { return index && *index == n; }
  bool empty() const { return !index; }
  std::size_t size() const { return bytes ? bytes->size() : 0; }
  uint64_t end() const { return start + size(); }

  void clear() {
    index.reset();
    bytes.reset();
    start = 0;
  }
};

} // namespace download
} // namespace chunkfs

#endif // CHUNKFS_DOWNLOAD_CHUNK_BUFFER_HPP
