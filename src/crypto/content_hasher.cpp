#include "crypto/content_hasher.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace chunkfs::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  // Create a new digest context initialized for MD5
  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw InitializationError("Content hasher: Failed to create digest context");
    }
    if (!EVP_DigestInit_ex(ctx, EVP_md5(), nullptr)) {
      EVP_MD_CTX_free(ctx);
      throw InitializationError("Content hasher: Failed to initialize digest context");
    }
  }

  // Create a context holding a copy of another context's state
  explicit DigestContext(const DigestContext& other) {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw InitializationError("Content hasher: Failed to create digest context");
    }
    if (!EVP_MD_CTX_copy_ex(ctx, other.ctx)) {
      EVP_MD_CTX_free(ctx);
      throw DigestError("Content hasher: Failed to copy digest context");
    }
  }

  DigestContext& operator=(const DigestContext&) = delete;

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ContentHasher::ContentHasher()
  : context_(std::make_unique<DigestContext>()) {}

ContentHasher::ContentHasher(const ContentHasher& other)
  : context_(other.context_ ? std::make_unique<DigestContext>(*other.context_) : nullptr)
  , bytes_hashed_(other.bytes_hashed_) {}

ContentHasher& ContentHasher::operator=(const ContentHasher& other) {
  if (this != &other) {
    ContentHasher copy(other);
    *this = std::move(copy);
  }
  return *this;
}

ContentHasher::ContentHasher(ContentHasher&& other) noexcept = default;
ContentHasher& ContentHasher::operator=(ContentHasher&& other) noexcept = default;
ContentHasher::~ContentHasher() = default;

//==============================================
// DIGEST OPERATIONS
//==============================================

void ContentHasher::update(const uint8_t* data, size_t size) {
  if (!context_) {
    throw DigestError("Content hasher: Hasher has been moved from");
  }
  if (size == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, size)) {
    BOOST_LOG_TRIVIAL(error) << "Content hasher: Failed to update digest with " << size << " bytes";
    throw DigestError("Content hasher: Failed to update digest");
  }
  bytes_hashed_ += size;
}

std::string ContentHasher::hex_digest() const {
  if (!context_) {
    throw DigestError("Content hasher: Hasher has been moved from");
  }

  // Finalize a copy so this hasher can keep accumulating
  DigestContext final_context(*context_);
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (!EVP_DigestFinal_ex(final_context.get(), digest, &digest_len)) {
    throw DigestError("Content hasher: Failed to finalize digest");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < digest_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(digest[i]);
  }
  return ss.str();
}

std::string ContentHasher::hex_digest_of(const uint8_t* data, size_t size) {
  ContentHasher hasher;
  hasher.update(data, size);
  return hasher.hex_digest();
}

} // namespace chunkfs::crypto
