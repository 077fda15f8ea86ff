#ifndef CHUNKFS_DOWNLOAD_FILE_INFO_HPP
#define CHUNKFS_DOWNLOAD_FILE_INFO_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace chunkfs {
namespace download {

// Metadata document of one stored file
struct FileInfo {
  std::string id;
  uint64_t length{0};
  uint32_t chunk_size_bytes{0};
  std::chrono::system_clock::time_point upload_date{};
  // Lowercase hex MD5 of the whole content, if the uploader recorded one
  std::optional<std::string> content_hash;
  std::string filename;
  std::map<std::string, std::string> metadata;

  // ceil(length / chunk_size_bytes), 0 for an empty file
  uint64_t chunk_count() const;
  // Byte length chunk n must have
  uint32_t expected_chunk_size(uint32_t n) const;
};

bool operator==(const FileInfo& lhs, const FileInfo& rhs);
bool operator!=(const FileInfo& lhs, const FileInfo& rhs);

// One chunk record as returned by the read binding
struct Chunk {
  std::string files_id;
  uint32_t n{0};
  std::vector<uint8_t> data;
};

} // namespace download
} // namespace chunkfs

#endif // CHUNKFS_DOWNLOAD_FILE_INFO_HPP
