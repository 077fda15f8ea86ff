#include "store/store_read_binding.hpp"
#include <boost/log/trivial.hpp>
#include "download/download_error.hpp"

namespace chunkfs {
namespace store {

StoreReadBinding::StoreReadBinding(Store& store, boost::asio::io_context& io_context)
  : store_(store)
  , io_context_(io_context) {
  BOOST_LOG_TRIVIAL(debug) << "Store binding: Created read binding over " << store_.base_path();
}

void StoreReadBinding::async_fetch_chunk(const std::string& files_id, uint32_t n,
                                         const download::CancellationToken& token,
                                         ChunkHandler handler) {
  boost::asio::post(io_context_, [this, files_id, n, token, handler = std::move(handler)]() {
    if (token.is_cancelled()) {
      handler(std::make_exception_ptr(download::OperationCancelledError("fetch of chunk " + std::to_string(n))),
              std::nullopt);
      return;
    }

    std::optional<download::Chunk> chunk;
    try {
      chunk = store_.get_chunk(files_id, n);
    }
    catch (...) {
      handler(std::current_exception(), std::nullopt);
      return;
    }

    // Cancellation during the lookup discards its result
    if (token.is_cancelled()) {
      handler(std::make_exception_ptr(download::OperationCancelledError("fetch of chunk " + std::to_string(n))),
              std::nullopt);
      return;
    }

    BOOST_LOG_TRIVIAL(trace) << "Store binding: Chunk " << n << " of file " << files_id
                             << (chunk ? " found" : " not found");
    handler(nullptr, std::move(chunk));
  });
}

void StoreReadBinding::async_find_file(const std::string& files_id,
                                       const download::CancellationToken& token,
                                       FileInfoHandler handler) {
  boost::asio::post(io_context_, [this, files_id, token, handler = std::move(handler)]() {
    if (token.is_cancelled()) {
      handler(std::make_exception_ptr(download::OperationCancelledError("lookup of file " + files_id)),
              std::nullopt);
      return;
    }

    std::optional<download::FileInfo> file_info;
    try {
      file_info = store_.get_file_info(files_id);
    }
    catch (...) {
      handler(std::current_exception(), std::nullopt);
      return;
    }
    handler(nullptr, std::move(file_info));
  });
}

void StoreReadBinding::release() {
  const int count = ++release_count_;
  BOOST_LOG_TRIVIAL(debug) << "Store binding: Released by stream (" << count << " releases)";
}

} // namespace store
} // namespace chunkfs
