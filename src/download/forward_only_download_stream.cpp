#include "download/forward_only_download_stream.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace chunkfs {
namespace download {

ForwardOnlyDownloadStream::ForwardOnlyDownloadStream(ReadBinding& binding, FileInfo file_info,
                                                     bool check_content_hash)
  : DownloadStreamBase(binding, std::move(file_info)) {
  if (!check_content_hash) {
    return;
  }

  if (!this->file_info().content_hash) {
    BOOST_LOG_TRIVIAL(warning) << "Download stream: File " << this->file_info().id
                               << " has no content hash, reading without verification";
    return;
  }
  hasher_.emplace();
}

void ForwardOnlyDownloadStream::async_load_chunk(uint32_t n, ReadState& state,
                                                 const CancellationToken& token,
                                                 CompletionHandler handler) {
  // Every chunk before the next one is full sized
  const uint64_t next_index = state.bytes_fetched / file_info().chunk_size_bytes;
  if (n != next_index) {
    throw std::logic_error("Download stream: Forward-only stream asked for chunk "
                           + std::to_string(n) + " while next chunk is " + std::to_string(next_index));
  }

  async_fetch_chunk(n, token, [this, &state, handler = std::move(handler)](std::exception_ptr error, ChunkBuffer chunk) {
    if (error) {
      handler(error);
      return;
    }

    try {
      // The digest state is copied only once a read actually fetches
      if (hasher_ && !state.hasher) {
        state.hasher = hasher_;
      }
      if (state.hasher) {
        state.hasher->update(*chunk.bytes);
      }
    }
    catch (...) {
      handler(std::current_exception());
      return;
    }

    state.bytes_fetched += chunk.size();
    state.chunk = std::move(chunk);
    handler(nullptr);
  });
}

uint64_t ForwardOnlyDownloadStream::do_seek(int64_t /*offset*/, SeekOrigin /*origin*/) {
  throw UnsupportedOperationError("seek on forward-only stream");
}

DownloadStreamBase::ReadState ForwardOnlyDownloadStream::begin_read() const {
  ReadState state = DownloadStreamBase::begin_read();
  state.bytes_fetched = bytes_fetched_;
  return state;
}

void ForwardOnlyDownloadStream::commit_read(ReadState&& state) {
  bytes_fetched_ = state.bytes_fetched;
  if (state.hasher) {
    hasher_ = std::move(state.hasher);
  }
  DownloadStreamBase::commit_read(std::move(state));

  // A consumed chunk is never needed again
  if (!chunk_.empty() && position_ >= chunk_.end()) {
    chunk_.clear();
  }
}

void ForwardOnlyDownloadStream::verify_read() {
  if (end_verified_ || position_ < length()) {
    return;
  }

  if (bytes_fetched_ != length()) {
    BOOST_LOG_TRIVIAL(error) << "Download stream: File " << file_info().id << " delivered "
                             << bytes_fetched_ << " bytes, expected " << length();
    throw CorruptFileError("file " + file_info().id + " delivered " + std::to_string(bytes_fetched_)
                           + " bytes, expected " + std::to_string(length()));
  }

  if (hasher_) {
    std::string expected = *file_info().content_hash;
    std::transform(expected.begin(), expected.end(), expected.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const std::string actual = hasher_->hex_digest();
    if (actual != expected) {
      BOOST_LOG_TRIVIAL(error) << "Download stream: Content hash mismatch for file " << file_info().id
                               << ": stored " << expected << ", computed " << actual;
      throw CorruptFileError("content hash mismatch for file " + file_info().id);
    }
    BOOST_LOG_TRIVIAL(debug) << "Download stream: Content hash verified for file " << file_info().id;
  }

  end_verified_ = true;
}

} // namespace download
} // namespace chunkfs
