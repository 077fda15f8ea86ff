#include "download/file_info.hpp"

namespace chunkfs {
namespace download {

uint64_t FileInfo::chunk_count() const {
  if (length == 0 || chunk_size_bytes == 0) {
    return 0;
  }
  return (length + chunk_size_bytes - 1) / chunk_size_bytes;
}

uint32_t FileInfo::expected_chunk_size(uint32_t n) const {
  const uint64_t count = chunk_count();
  if (n >= count) {
    return 0;
  }
  if (n < count - 1) {
    return chunk_size_bytes;
  }
  // Terminal chunk holds the remainder
  return static_cast<uint32_t>(length - static_cast<uint64_t>(n) * chunk_size_bytes);
}

bool operator==(const FileInfo& lhs, const FileInfo& rhs) {
  return lhs.id == rhs.id
    && lhs.length == rhs.length
    && lhs.chunk_size_bytes == rhs.chunk_size_bytes
    && lhs.upload_date == rhs.upload_date
    && lhs.content_hash == rhs.content_hash
    && lhs.filename == rhs.filename
    && lhs.metadata == rhs.metadata;
}

bool operator!=(const FileInfo& lhs, const FileInfo& rhs) {
  return !(lhs == rhs);
}

} // namespace download
} // namespace chunkfs
