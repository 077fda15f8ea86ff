#ifndef CHUNKFS_DOWNLOAD_STREAM_BASE_HPP
#define CHUNKFS_DOWNLOAD_STREAM_BASE_HPP

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <boost/asio.hpp>
#include "crypto/content_hasher.hpp"
#include "download/cancellation.hpp"
#include "download/chunk_buffer.hpp"
#include "download/download_error.hpp"
#include "download/file_info.hpp"
#include "download/read_binding.hpp"

namespace chunkfs {
namespace download {

enum class SeekOrigin {
  Begin,
  Current,
  End
};

/**
 * Read-only stream over the chunks of one stored file.
 *
 * Writing, flushing and resizing are always rejected. Every operation that
 * may fetch a chunk exists in an asynchronous form whose handler is posted
 * to the binding's io_context, and in a synchronous form that runs that
 * io_context on the calling thread until the asynchronous form completes.
 * A stream serves one reader at a time and must outlive its pending
 * operations.
 */
class DownloadStreamBase {
public:
  using ReadHandler = std::function<void(std::exception_ptr, std::size_t)>;
  using CompletionHandler = std::function<void(std::exception_ptr)>;

  static constexpr std::size_t DEFAULT_COPY_BUFFER_SIZE = 81920;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  DownloadStreamBase(ReadBinding& binding, FileInfo file_info);
  virtual ~DownloadStreamBase();

  DownloadStreamBase(const DownloadStreamBase&) = delete;
  DownloadStreamBase& operator=(const DownloadStreamBase&) = delete;


  // ---- CAPABILITIES ----
  bool can_read() const { return true; }
  bool can_write() const { return false; }
  virtual bool can_seek() const = 0;


  // ---- FILE PROPERTIES ----
  uint64_t length() const { return file_info_.length; }
  const FileInfo& file_info() const { return file_info_; }


  // ---- READ OPERATIONS ----
  // Reads up to count bytes, returns 0 at end of file
  std::size_t read(uint8_t* buffer, std::size_t count);
  void async_read(uint8_t* buffer, std::size_t count, ReadHandler handler,
    CancellationToken token = {});

  // Copies the rest of the stream into sink. Only the asynchronous form is
  // supported, copy_to always throws UnsupportedOperationError.
  void copy_to(std::ostream& sink, std::size_t buffer_size = DEFAULT_COPY_BUFFER_SIZE);
  void async_copy_to(std::ostream& sink, CompletionHandler handler,
    std::size_t buffer_size = DEFAULT_COPY_BUFFER_SIZE, CancellationToken token = {});


  // ---- POSITIONING ----
  uint64_t position() const;
  void set_position(int64_t value);
  uint64_t seek(int64_t offset, SeekOrigin origin);


  // ---- REJECTED OPERATIONS ----
  void write(const uint8_t* buffer, std::size_t count);
  void async_write(const uint8_t* buffer, std::size_t count, CompletionHandler handler,
    CancellationToken token = {});
  void flush();
  void async_flush(CompletionHandler handler, CancellationToken token = {});
  void set_length(uint64_t value);


  // ---- DISPOSAL ----
  // close() and dispose() are synonyms and may be called any number of times
  void close();
  void async_close(CompletionHandler handler, CancellationToken token = {});
  void dispose();
  void async_dispose(CompletionHandler handler);

protected:
  // Snapshot of the mutable stream state a read works on. It is committed
  // back to the stream only when the read completes.
  struct ReadState {
    uint64_t position{0};
    ChunkBuffer chunk;
    // Sum of the sizes of all chunks loaded so far, in order
    uint64_t bytes_fetched{0};
    std::optional<crypto::ContentHasher> hasher;
  };

  // ---- VARIANT HOOKS ----
  // Makes state.chunk hold chunk n
  virtual void async_load_chunk(uint32_t n, ReadState& state,
    const CancellationToken& token, CompletionHandler handler) = 0;
  virtual uint64_t do_seek(int64_t offset, SeekOrigin origin) = 0;
  virtual ReadState begin_read() const;
  virtual void commit_read(ReadState&& state);
  // Runs after a read has been committed, may throw to fail the read
  virtual void verify_read() {}


  // ---- CHUNK FETCH AND VERIFY PROTOCOL ----
  using ChunkBufferHandler = std::function<void(std::exception_ptr, ChunkBuffer)>;
  // Fetches chunk n through the binding and checks it against the file info
  void async_fetch_chunk(uint32_t n, const CancellationToken& token, ChunkBufferHandler handler);
  ChunkBuffer verify_chunk(uint32_t n, std::optional<Chunk> chunk) const;
  uint32_t chunk_index_for(uint64_t position) const;


  // ---- UTILITY METHODS ----
  void throw_if_disposed(const char* operation) const;
  bool is_disposed() const { return disposed_; }
  boost::asio::io_context& io_context() { return io_context_; }

  uint64_t position_{0};
  ChunkBuffer chunk_;

private:
  class ReadOperation;
  class CopyOperation;

  // ---- PARAMETERS ----
  ReadBinding* binding_;
  boost::asio::io_context& io_context_;
  const FileInfo file_info_;
  bool disposed_{false};


  // ---- COMPLETION ----
  void post_completion(CompletionHandler handler, std::exception_ptr error);
  void post_completion(ReadHandler handler, std::exception_ptr error, std::size_t bytes);
  // Runs the io_context on this thread until done is set
  void run_until(const std::atomic<bool>& done);
};

} // namespace download
} // namespace chunkfs

#endif // CHUNKFS_DOWNLOAD_STREAM_BASE_HPP
