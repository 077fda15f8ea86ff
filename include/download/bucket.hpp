#ifndef CHUNKFS_DOWNLOAD_BUCKET_HPP
#define CHUNKFS_DOWNLOAD_BUCKET_HPP

#include <cstdint>
#include <memory>
#include <string>
#include "download/download_stream_base.hpp"
#include "download/file_info.hpp"
#include "download/read_binding.hpp"

namespace chunkfs {
namespace download {

struct BucketOptions {
  std::string bucket_name{"fs"};
  uint32_t chunk_size_bytes{255 * 1024};
};

struct DownloadOptions {
  // Open a SeekableDownloadStream instead of a ForwardOnlyDownloadStream
  bool seekable{false};
  // Verify the MD5 content hash at end of stream, forward-only streams only
  bool check_content_hash{false};
};

// Opens download streams for the files of one bucket
class Bucket {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Bucket(BucketOptions options = BucketOptions{});


  // ---- STREAM FACTORY ----
  // Opens a stream over an already known file document
  std::unique_ptr<DownloadStreamBase> open_download_stream(ReadBinding& binding, FileInfo file_info,
    const DownloadOptions& options = DownloadOptions{}) const;
  // Looks the file document up through the binding first
  std::unique_ptr<DownloadStreamBase> open_download_stream(ReadBinding& binding, const std::string& files_id,
    const DownloadOptions& options = DownloadOptions{}) const;


  // ---- GETTERS ----
  const BucketOptions& options() const { return options_; }

private:
  // ---- PARAMETERS ----
  BucketOptions options_;

  // Fills in defaults the file document left out
  FileInfo interpret(FileInfo file_info) const;
  // Blocking metadata lookup driven on the calling thread
  FileInfo find_file(ReadBinding& binding, const std::string& files_id) const;
};

} // namespace download
} // namespace chunkfs

#endif // CHUNKFS_DOWNLOAD_BUCKET_HPP
