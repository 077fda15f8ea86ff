#ifndef CHUNKFS_CONTENT_HASHER_HPP
#define CHUNKFS_CONTENT_HASHER_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace chunkfs::crypto {

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Incremental MD5 over the content of a stored file. Copies carry the
// digest state, so a copy can be advanced and later swapped back in.
class ContentHasher {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ContentHasher();
  ContentHasher(const ContentHasher& other);
  ContentHasher& operator=(const ContentHasher& other);
  ContentHasher(ContentHasher&& other) noexcept;
  ContentHasher& operator=(ContentHasher&& other) noexcept;
  ~ContentHasher();


  // ---- DIGEST OPERATIONS ----
  // Feeds bytes into the running digest
  void update(const uint8_t* data, size_t size);
  void update(const std::vector<uint8_t>& data) { update(data.data(), data.size()); }
  // Lowercase hex digest of everything fed so far, the hasher stays usable
  std::string hex_digest() const;
  // Total number of bytes fed so far
  uint64_t bytes_hashed() const { return bytes_hashed_; }

  // One-shot digest of a buffer
  static std::string hex_digest_of(const uint8_t* data, size_t size);
  static std::string hex_digest_of(const std::vector<uint8_t>& data) {
    return hex_digest_of(data.data(), data.size());
  }

private:
  // ---- PARAMETERS ----
  std::unique_ptr<DigestContext> context_;
  uint64_t bytes_hashed_ = 0;
};

} // namespace chunkfs::crypto

#endif // CHUNKFS_CONTENT_HASHER_HPP
