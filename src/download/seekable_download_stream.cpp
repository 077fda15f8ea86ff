#include "download/seekable_download_stream.hpp"
#include <limits>
#include <boost/log/trivial.hpp>

namespace chunkfs {
namespace download {

SeekableDownloadStream::SeekableDownloadStream(ReadBinding& binding, FileInfo file_info)
  : DownloadStreamBase(binding, std::move(file_info)) {}

void SeekableDownloadStream::async_load_chunk(uint32_t n, ReadState& state,
                                              const CancellationToken& token,
                                              CompletionHandler handler) {
  if (!state.chunk.empty()) {
    BOOST_LOG_TRIVIAL(trace) << "Download stream: Replacing buffered chunk " << *state.chunk.index
                             << " with chunk " << n;
  }

  async_fetch_chunk(n, token, [&state, handler = std::move(handler)](std::exception_ptr error, ChunkBuffer chunk) {
    if (!error) {
      state.chunk = std::move(chunk);
    }
    handler(error);
  });
}

uint64_t SeekableDownloadStream::do_seek(int64_t offset, SeekOrigin origin) {
  int64_t origin_position = 0;
  switch (origin) {
    case SeekOrigin::Begin:
      origin_position = 0;
      break;
    case SeekOrigin::Current:
      origin_position = static_cast<int64_t>(position_);
      break;
    case SeekOrigin::End:
      origin_position = static_cast<int64_t>(length());
      break;
  }

  if (offset > 0 && origin_position > std::numeric_limits<int64_t>::max() - offset) {
    throw OutOfRangeError("seek offset overflows stream position");
  }

  const int64_t new_position = origin_position + offset;
  if (new_position < 0) {
    BOOST_LOG_TRIVIAL(error) << "Download stream: Seek to negative position " << new_position
                             << " in file " << file_info().id;
    throw OutOfRangeError("seek to negative position " + std::to_string(new_position));
  }

  position_ = static_cast<uint64_t>(new_position);
  BOOST_LOG_TRIVIAL(trace) << "Download stream: Position set to " << position_;
  return position_;
}

} // namespace download
} // namespace chunkfs
