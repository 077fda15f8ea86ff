#ifndef CHUNKFS_FORWARD_ONLY_DOWNLOAD_STREAM_HPP
#define CHUNKFS_FORWARD_ONLY_DOWNLOAD_STREAM_HPP

#include <optional>
#include "crypto/content_hasher.hpp"
#include "download/download_stream_base.hpp"

namespace chunkfs {
namespace download {

// Sequential reader. Chunks are fetched in ascending order, each exactly
// once, and dropped as soon as they have been consumed.
class ForwardOnlyDownloadStream : public DownloadStreamBase {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // With check_content_hash the content is digested while it is read and
  // compared with file_info.content_hash at end of stream
  ForwardOnlyDownloadStream(ReadBinding& binding, FileInfo file_info, bool check_content_hash = false);

  bool can_seek() const override { return false; }

protected:
  void async_load_chunk(uint32_t n, ReadState& state,
    const CancellationToken& token, CompletionHandler handler) override;
  uint64_t do_seek(int64_t offset, SeekOrigin origin) override;
  ReadState begin_read() const override;
  void commit_read(ReadState&& state) override;
  void verify_read() override;

private:
  // ---- PARAMETERS ----
  uint64_t bytes_fetched_{0};
  std::optional<crypto::ContentHasher> hasher_;
  bool end_verified_{false};
};

} // namespace download
} // namespace chunkfs

#endif // CHUNKFS_FORWARD_ONLY_DOWNLOAD_STREAM_HPP
