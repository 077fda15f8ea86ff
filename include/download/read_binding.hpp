#ifndef CHUNKFS_DOWNLOAD_READ_BINDING_HPP
#define CHUNKFS_DOWNLOAD_READ_BINDING_HPP

#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <boost/asio.hpp>
#include "download/cancellation.hpp"
#include "download/file_info.hpp"

namespace chunkfs {
namespace download {

// Scoped data-access session used by download streams. The binding is owned
// by the caller; streams hold a reference and call release() once when they
// are disposed.
class ReadBinding {
public:
  // An empty optional means the record does not exist
  using ChunkHandler = std::function<void(std::exception_ptr, std::optional<Chunk>)>;
  using FileInfoHandler = std::function<void(std::exception_ptr, std::optional<FileInfo>)>;

  virtual ~ReadBinding() = default;

  // Context on which every completion handler is invoked
  virtual boost::asio::io_context& io_context() = 0;

  // Point lookup of chunk n of the given file. The handler must not be
  // invoked from within this call.
  virtual void async_fetch_chunk(const std::string& files_id, uint32_t n,
    const CancellationToken& token, ChunkHandler handler) = 0;

  // Lookup of the metadata document of the given file
  virtual void async_find_file(const std::string& files_id,
    const CancellationToken& token, FileInfoHandler handler) = 0;

  // Drops one stream's claim on the session
  virtual void release() = 0;
};

} // namespace download
} // namespace chunkfs

#endif // CHUNKFS_DOWNLOAD_READ_BINDING_HPP
