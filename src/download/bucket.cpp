#include "download/bucket.hpp"
#include <atomic>
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include "download/forward_only_download_stream.hpp"
#include "download/seekable_download_stream.hpp"

namespace chunkfs {
namespace download {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Bucket::Bucket(BucketOptions options)
  : options_(std::move(options)) {
  if (options_.chunk_size_bytes == 0) {
    BOOST_LOG_TRIVIAL(error) << "Bucket: Invalid chunk size 0 for bucket " << options_.bucket_name;
    throw std::invalid_argument("Bucket: Chunk size must be positive");
  }
  BOOST_LOG_TRIVIAL(info) << "Bucket: Initializing bucket " << options_.bucket_name
                          << " with chunk size " << options_.chunk_size_bytes;
}

//==============================================
// STREAM FACTORY
//==============================================

std::unique_ptr<DownloadStreamBase> Bucket::open_download_stream(ReadBinding& binding, FileInfo file_info,
                                                                 const DownloadOptions& options) const {
  if (options.seekable && options.check_content_hash) {
    BOOST_LOG_TRIVIAL(error) << "Bucket: Content hash verification requested on a seekable stream";
    throw std::invalid_argument("Bucket: check_content_hash can only be used with forward-only streams");
  }

  file_info = interpret(std::move(file_info));
  BOOST_LOG_TRIVIAL(info) << "Bucket: Opening " << (options.seekable ? "seekable" : "forward-only")
                          << " download stream for file " << file_info.id;

  if (options.seekable) {
    return std::make_unique<SeekableDownloadStream>(binding, std::move(file_info));
  }
  return std::make_unique<ForwardOnlyDownloadStream>(binding, std::move(file_info), options.check_content_hash);
}

std::unique_ptr<DownloadStreamBase> Bucket::open_download_stream(ReadBinding& binding, const std::string& files_id,
                                                                 const DownloadOptions& options) const {
  return open_download_stream(binding, find_file(binding, files_id), options);
}

//==============================================
// UTILITY METHODS
//==============================================

FileInfo Bucket::interpret(FileInfo file_info) const {
  if (file_info.chunk_size_bytes == 0) {
    BOOST_LOG_TRIVIAL(debug) << "Bucket: File " << file_info.id << " has no chunk size, using "
                             << options_.chunk_size_bytes;
    file_info.chunk_size_bytes = options_.chunk_size_bytes;
  }
  return file_info;
}

FileInfo Bucket::find_file(ReadBinding& binding, const std::string& files_id) const {
  BOOST_LOG_TRIVIAL(debug) << "Bucket: Looking up file " << files_id;

  std::atomic<bool> done{false};
  std::exception_ptr error;
  std::optional<FileInfo> found;

  binding.async_find_file(files_id, CancellationToken{},
    [&](std::exception_ptr e, std::optional<FileInfo> file_info) {
      error = e;
      found = std::move(file_info);
      done = true;
    });

  auto& io_context = binding.io_context();
  while (!done) {
    if (io_context.stopped()) {
      io_context.restart();
    }
    io_context.run_one();
  }
  // run_one() stops the context once it runs out of work
  if (io_context.stopped()) {
    io_context.restart();
  }

  if (error) {
    std::rethrow_exception(error);
  }
  if (!found) {
    BOOST_LOG_TRIVIAL(error) << "Bucket: File " << files_id << " not found in bucket " << options_.bucket_name;
    throw FileNotFoundError(files_id);
  }
  return *found;
}

} // namespace download
} // namespace chunkfs
