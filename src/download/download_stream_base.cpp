#include "download/download_stream_base.hpp"
#include <algorithm>
#include <cstring>
#include <limits>
#include <memory>
#include <stdexcept>
#include <vector>
#include <boost/log/trivial.hpp>

namespace chunkfs {
namespace download {

//==============================================
// READ OPERATION
//==============================================

// Drives one read request across as many chunks as it needs. Works on a
// ReadState copy so a failed or cancelled read leaves the stream untouched.
class DownloadStreamBase::ReadOperation
  : public std::enable_shared_from_this<DownloadStreamBase::ReadOperation> {
public:
  ReadOperation(DownloadStreamBase& stream, uint8_t* buffer, std::size_t count,
                CancellationToken token, ReadHandler handler)
    : stream_(stream)
    , buffer_(buffer)
    , count_(count)
    , token_(std::move(token))
    , handler_(std::move(handler)) {}

  void start() {
    state_ = stream_.begin_read();
    step();
  }

private:
  DownloadStreamBase& stream_;
  uint8_t* buffer_;
  std::size_t count_;
  std::size_t transferred_{0};
  CancellationToken token_;
  ReadHandler handler_;
  ReadState state_;

  void step() {
    try {
      while (transferred_ < count_ && state_.position < stream_.length()) {
        const uint32_t n = stream_.chunk_index_for(state_.position);

        if (!state_.chunk.holds(n)) {
          if (token_.is_cancelled()) {
            throw OperationCancelledError("Read cancelled before fetching chunk " + std::to_string(n));
          }
          stream_.throw_if_disposed("read");

          auto self = shared_from_this();
          stream_.async_load_chunk(n, state_, token_, [self](std::exception_ptr error) {
            self->on_chunk_loaded(error);
          });
          return;
        }

        const uint64_t offset = state_.position - state_.chunk.start;
        const std::size_t available = static_cast<std::size_t>(state_.chunk.size() - offset);
        const std::size_t copy_count = std::min(count_ - transferred_, available);
        std::memcpy(buffer_ + transferred_, state_.chunk.bytes->data() + offset, copy_count);

        transferred_ += copy_count;
        state_.position += copy_count;
      }
    }
    catch (...) {
      fail(std::current_exception());
      return;
    }

    finish();
  }

  void on_chunk_loaded(std::exception_ptr error) {
    if (error) {
      fail(error);
      return;
    }
    // The fetch raced with close() or with the caller giving up
    if (stream_.is_disposed()) {
      fail(std::make_exception_ptr(DisposedStreamError("stream was closed during read")));
      return;
    }
    if (token_.is_cancelled()) {
      fail(std::make_exception_ptr(OperationCancelledError("Read cancelled while fetching chunk")));
      return;
    }
    step();
  }

  void finish() {
    stream_.commit_read(std::move(state_));
    try {
      stream_.verify_read();
    }
    catch (...) {
      fail(std::current_exception());
      return;
    }
    BOOST_LOG_TRIVIAL(trace) << "Download stream: Read " << transferred_ << " bytes, position now "
                             << stream_.position_;
    stream_.post_completion(std::move(handler_), nullptr, transferred_);
  }

  void fail(std::exception_ptr error) {
    stream_.post_completion(std::move(handler_), error, 0);
  }
};

//==============================================
// COPY OPERATION
//==============================================

// Repeatedly reads into a bounded buffer and appends to the sink
class DownloadStreamBase::CopyOperation
  : public std::enable_shared_from_this<DownloadStreamBase::CopyOperation> {
public:
  CopyOperation(DownloadStreamBase& stream, std::ostream& sink, std::size_t buffer_size,
                CancellationToken token, CompletionHandler handler)
    : stream_(stream)
    , sink_(sink)
    , buffer_(buffer_size)
    , token_(std::move(token))
    , handler_(std::move(handler)) {}

  void start() { read_next(); }

private:
  DownloadStreamBase& stream_;
  std::ostream& sink_;
  std::vector<uint8_t> buffer_;
  uint64_t total_copied_{0};
  CancellationToken token_;
  CompletionHandler handler_;

  void read_next() {
    auto self = shared_from_this();
    stream_.async_read(buffer_.data(), buffer_.size(),
      [self](std::exception_ptr error, std::size_t bytes_read) {
        self->on_read(error, bytes_read);
      },
      token_);
  }

  void on_read(std::exception_ptr error, std::size_t bytes_read) {
    if (error) {
      handler_(error);
      return;
    }
    if (bytes_read == 0) {
      BOOST_LOG_TRIVIAL(debug) << "Download stream: Copied " << total_copied_ << " bytes to sink";
      handler_(nullptr);
      return;
    }

    sink_.write(reinterpret_cast<const char*>(buffer_.data()), static_cast<std::streamsize>(bytes_read));
    if (!sink_.good()) {
      BOOST_LOG_TRIVIAL(error) << "Download stream: Failed to write " << bytes_read << " bytes to sink";
      handler_(std::make_exception_ptr(std::runtime_error("Download stream: Failed to write to sink")));
      return;
    }
    total_copied_ += bytes_read;
    read_next();
  }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

DownloadStreamBase::DownloadStreamBase(ReadBinding& binding, FileInfo file_info)
  : binding_(&binding)
  , io_context_(binding.io_context())
  , file_info_(std::move(file_info)) {

  if (file_info_.length > 0 && file_info_.chunk_size_bytes == 0) {
    BOOST_LOG_TRIVIAL(error) << "Download stream: File " << file_info_.id
                             << " has length " << file_info_.length << " but chunk size 0";
    throw std::invalid_argument("Download stream: Chunk size must be positive");
  }
  if (file_info_.chunk_count() > static_cast<uint64_t>(std::numeric_limits<uint32_t>::max()) + 1) {
    BOOST_LOG_TRIVIAL(error) << "Download stream: File " << file_info_.id
                             << " needs " << file_info_.chunk_count() << " chunks";
    throw std::invalid_argument("Download stream: Too many chunks for file");
  }

  BOOST_LOG_TRIVIAL(debug) << "Download stream: Opened file " << file_info_.id
                           << " (" << file_info_.length << " bytes in "
                           << file_info_.chunk_count() << " chunks)";
}

DownloadStreamBase::~DownloadStreamBase() {
  try {
    dispose();
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Download stream: Failed to release binding on destruction: " << e.what();
  }
}

//==============================================
// READ OPERATIONS
//==============================================

std::size_t DownloadStreamBase::read(uint8_t* buffer, std::size_t count) {
  std::atomic<bool> done{false};
  std::exception_ptr error;
  std::size_t bytes_read = 0;

  async_read(buffer, count, [&](std::exception_ptr e, std::size_t n) {
    error = e;
    bytes_read = n;
    done = true;
  });
  run_until(done);

  if (error) {
    std::rethrow_exception(error);
  }
  return bytes_read;
}

void DownloadStreamBase::async_read(uint8_t* buffer, std::size_t count, ReadHandler handler,
                                    CancellationToken token) {
  if (disposed_) {
    post_completion(std::move(handler),
      std::make_exception_ptr(DisposedStreamError("read")), 0);
    return;
  }
  if (!buffer && count > 0) {
    post_completion(std::move(handler),
      std::make_exception_ptr(std::invalid_argument("Download stream: Null read buffer")), 0);
    return;
  }

  auto operation = std::make_shared<ReadOperation>(*this, buffer, count, std::move(token), std::move(handler));
  operation->start();
}

void DownloadStreamBase::copy_to(std::ostream& /*sink*/, std::size_t /*buffer_size*/) {
  throw_if_disposed("copy_to");
  throw UnsupportedOperationError("synchronous copy_to, use async_copy_to");
}

void DownloadStreamBase::async_copy_to(std::ostream& sink, CompletionHandler handler,
                                       std::size_t buffer_size, CancellationToken token) {
  if (disposed_) {
    post_completion(std::move(handler), std::make_exception_ptr(DisposedStreamError("copy_to")));
    return;
  }
  if (buffer_size == 0) {
    post_completion(std::move(handler),
      std::make_exception_ptr(std::invalid_argument("Download stream: Copy buffer size must be positive")));
    return;
  }

  auto operation = std::make_shared<CopyOperation>(*this, sink, buffer_size, std::move(token), std::move(handler));
  operation->start();
}

//==============================================
// POSITIONING
//==============================================

uint64_t DownloadStreamBase::position() const {
  throw_if_disposed("position");
  return position_;
}

void DownloadStreamBase::set_position(int64_t value) {
  throw_if_disposed("set_position");
  do_seek(value, SeekOrigin::Begin);
}

uint64_t DownloadStreamBase::seek(int64_t offset, SeekOrigin origin) {
  throw_if_disposed("seek");
  return do_seek(offset, origin);
}

//==============================================
// REJECTED OPERATIONS
//==============================================

void DownloadStreamBase::write(const uint8_t* /*buffer*/, std::size_t /*count*/) {
  throw_if_disposed("write");
  throw UnsupportedOperationError("write");
}

void DownloadStreamBase::async_write(const uint8_t* /*buffer*/, std::size_t /*count*/,
                                     CompletionHandler handler, CancellationToken /*token*/) {
  if (disposed_) {
    post_completion(std::move(handler), std::make_exception_ptr(DisposedStreamError("write")));
    return;
  }
  post_completion(std::move(handler), std::make_exception_ptr(UnsupportedOperationError("write")));
}

void DownloadStreamBase::flush() {
  throw_if_disposed("flush");
  throw UnsupportedOperationError("flush");
}

void DownloadStreamBase::async_flush(CompletionHandler handler, CancellationToken /*token*/) {
  if (disposed_) {
    post_completion(std::move(handler), std::make_exception_ptr(DisposedStreamError("flush")));
    return;
  }
  post_completion(std::move(handler), std::make_exception_ptr(UnsupportedOperationError("flush")));
}

void DownloadStreamBase::set_length(uint64_t /*value*/) {
  throw_if_disposed("set_length");
  throw UnsupportedOperationError("set_length");
}

//==============================================
// DISPOSAL
//==============================================

void DownloadStreamBase::close() {
  dispose();
}

void DownloadStreamBase::async_close(CompletionHandler handler, CancellationToken /*token*/) {
  async_dispose(std::move(handler));
}

void DownloadStreamBase::dispose() {
  if (disposed_) {
    return;
  }

  disposed_ = true;
  chunk_.clear();

  // Release exactly once, the binding itself stays alive
  ReadBinding* binding = binding_;
  binding_ = nullptr;
  if (binding) {
    binding->release();
  }
  BOOST_LOG_TRIVIAL(debug) << "Download stream: Disposed stream for file " << file_info_.id;
}

void DownloadStreamBase::async_dispose(CompletionHandler handler) {
  std::exception_ptr error;
  try {
    dispose();
  }
  catch (...) {
    error = std::current_exception();
  }
  post_completion(std::move(handler), error);
}

//==============================================
// VARIANT HOOKS
//==============================================

DownloadStreamBase::ReadState DownloadStreamBase::begin_read() const {
  ReadState state;
  state.position = position_;
  state.chunk = chunk_;
  return state;
}

void DownloadStreamBase::commit_read(ReadState&& state) {
  position_ = state.position;
  chunk_ = std::move(state.chunk);
}

//==============================================
// CHUNK FETCH AND VERIFY PROTOCOL
//==============================================

void DownloadStreamBase::async_fetch_chunk(uint32_t n, const CancellationToken& token,
                                           ChunkBufferHandler handler) {
  if (!binding_) {
    throw DisposedStreamError("fetch chunk");
  }

  BOOST_LOG_TRIVIAL(debug) << "Download stream: Fetching chunk " << n << " of file " << file_info_.id;

  binding_->async_fetch_chunk(file_info_.id, n, token,
    [this, n, handler = std::move(handler)](std::exception_ptr error, std::optional<Chunk> chunk) {
      if (error) {
        // Binding failures reach the caller unchanged
        handler(error, ChunkBuffer{});
        return;
      }

      ChunkBuffer buffer;
      try {
        buffer = verify_chunk(n, std::move(chunk));
      }
      catch (...) {
        error = std::current_exception();
      }
      handler(error, std::move(buffer));
    });
}

ChunkBuffer DownloadStreamBase::verify_chunk(uint32_t n, std::optional<Chunk> chunk) const {
  if (!chunk) {
    BOOST_LOG_TRIVIAL(error) << "Download stream: Chunk " << n << " of file " << file_info_.id << " not found";
    throw MissingChunkError("chunk " + std::to_string(n) + " of file " + file_info_.id);
  }
  if (chunk->n != n || chunk->files_id != file_info_.id) {
    BOOST_LOG_TRIVIAL(error) << "Download stream: Requested chunk " << n << " of file " << file_info_.id
                             << " but got chunk " << chunk->n << " of file " << chunk->files_id;
    throw MissingChunkError("chunk " + std::to_string(n) + " of file " + file_info_.id);
  }

  const uint32_t expected_size = file_info_.expected_chunk_size(n);
  if (chunk->data.size() != expected_size) {
    BOOST_LOG_TRIVIAL(error) << "Download stream: Chunk " << n << " of file " << file_info_.id
                             << " has " << chunk->data.size() << " bytes, expected " << expected_size;
    throw CorruptChunkError("chunk " + std::to_string(n) + " of file " + file_info_.id
                            + " has " + std::to_string(chunk->data.size())
                            + " bytes, expected " + std::to_string(expected_size));
  }

  ChunkBuffer buffer;
  buffer.index = n;
  buffer.start = static_cast<uint64_t>(n) * file_info_.chunk_size_bytes;
  buffer.bytes = std::make_shared<const std::vector<uint8_t>>(std::move(chunk->data));
  return buffer;
}

uint32_t DownloadStreamBase::chunk_index_for(uint64_t position) const {
  return static_cast<uint32_t>(position / file_info_.chunk_size_bytes);
}

//==============================================
// UTILITY METHODS
//==============================================

void DownloadStreamBase::throw_if_disposed(const char* operation) const {
  if (disposed_) {
    BOOST_LOG_TRIVIAL(error) << "Download stream: " << operation << " called on disposed stream for file "
                             << file_info_.id;
    throw DisposedStreamError(operation);
  }
}

void DownloadStreamBase::post_completion(CompletionHandler handler, std::exception_ptr error) {
  boost::asio::post(io_context_, [handler = std::move(handler), error]() {
    handler(error);
  });
}

void DownloadStreamBase::post_completion(ReadHandler handler, std::exception_ptr error, std::size_t bytes) {
  boost::asio::post(io_context_, [handler = std::move(handler), error, bytes]() {
    handler(error, bytes);
  });
}

void DownloadStreamBase::run_until(const std::atomic<bool>& done) {
  while (!done) {
    if (io_context_.stopped()) {
      io_context_.restart();
    }
    io_context_.run_one();
  }
  // Later asynchronous calls must still be able to run on this context
  if (io_context_.stopped()) {
    io_context_.restart();
  }
}

} // namespace download
} // namespace chunkfs
