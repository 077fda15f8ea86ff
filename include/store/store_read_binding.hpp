#ifndef CHUNKFS_STORE_READ_BINDING_HPP
#define CHUNKFS_STORE_READ_BINDING_HPP

#include <atomic>
#include <boost/asio.hpp>
#include "download/read_binding.hpp"
#include "store/store.hpp"

namespace chunkfs {
namespace store {

// Read binding serving chunk and file documents out of a local Store.
// Lookups run as handlers on the given io_context.
class StoreReadBinding : public download::ReadBinding {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  StoreReadBinding(Store& store, boost::asio::io_context& io_context);
  ~StoreReadBinding() override = default;

  StoreReadBinding(const StoreReadBinding&) = delete;
  StoreReadBinding& operator=(const StoreReadBinding&) = delete;


  // ---- READ BINDING INTERFACE ----
  boost::asio::io_context& io_context() override { return io_context_; }
  void async_fetch_chunk(const std::string& files_id, uint32_t n,
    const download::CancellationToken& token, ChunkHandler handler) override;
  void async_find_file(const std::string& files_id,
    const download::CancellationToken& token, FileInfoHandler handler) override;
  void release() override;


  // ---- GETTERS ----
  int release_count() const { return release_count_; }

private:
  // ---- PARAMETERS ----
  Store& store_;
  boost::asio::io_context& io_context_;
  std::atomic<int> release_count_{0};
};

} // namespace store
} // namespace chunkfs

#endif // CHUNKFS_STORE_READ_BINDING_HPP
