#ifndef CHUNKFS_SEEKABLE_DOWNLOAD_STREAM_HPP
#define CHUNKFS_SEEKABLE_DOWNLOAD_STREAM_HPP

#include "download/download_stream_base.hpp"

namespace chunkfs {
namespace download {

// Random access reader. Keeps the last fetched chunk and refetches whenever
// a read needs a different one. Seeking past the end is allowed and reads
// there return 0.
class SeekableDownloadStream : public DownloadStreamBase {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  SeekableDownloadStream(ReadBinding& binding, FileInfo file_info);

  bool can_seek() const override { return true; }

protected:
  void async_load_chunk(uint32_t n, ReadState& state,
    const CancellationToken& token, CompletionHandler handler) override;
  uint64_t do_seek(int64_t offset, SeekOrigin origin) override;
};

} // namespace download
} // namespace chunkfs

#endif // CHUNKFS_SEEKABLE_DOWNLOAD_STREAM_HPP
