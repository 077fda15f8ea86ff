#ifndef CHUNKFS_DOWNLOAD_CANCELLATION_HPP
#define CHUNKFS_DOWNLOAD_CANCELLATION_HPP

#include <atomic>
#include <memory>

namespace chunkfs {
namespace download {

class CancellationSource;

// Read-only view of a cancellation flag. A default constructed token can
// never be cancelled.
class CancellationToken {
public:
  CancellationToken() = default;

  bool is_cancelled() const {
    return state_ && state_->load();
  }

private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<std::atomic<bool>> state)
    : state_(std::move(state)) {}

  std::shared_ptr<std::atomic<bool>> state_;
};

// Owner side of a cancellation flag shared with any number of tokens
class CancellationSource {
public:
  CancellationSource()
    : state_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() { state_->store(true); }
  bool is_cancelled() const { return state_->load(); }
  CancellationToken token() const { return CancellationToken(state_); }

private:
  std::shared_ptr<std::atomic<bool>> state_;
};

} // namespace download
} // namespace chunkfs

#endif // CHUNKFS_DOWNLOAD_CANCELLATION_HPP
