#include "store/store.hpp"
#include "store/file_info_codec.hpp"
#include <iomanip>
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace chunkfs {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize store with base directory path and ensure it exists
Store::Store(const std::string& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing Store with base path: " << base_path;
  check_directory_exists(base_path_); // Create base directory if it doesn't exist
  BOOST_LOG_TRIVIAL(debug) << "Store: Store directory created/verified at: " << base_path;
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void Store::store(const std::string& key, std::istream& data) {
  BOOST_LOG_TRIVIAL(debug) << "Store: Storing data with key: " << key;

  if (!data.good()) {
    BOOST_LOG_TRIVIAL(error) << "Store: Invalid input stream provided for key: " << key;
    throw StoreError("Store: Invalid input stream");
  }

  // Generate path from key and ensure directory structure exists
  std::filesystem::path file_path = resolve_key_path(key);
  check_directory_exists(file_path.parent_path());
  BOOST_LOG_TRIVIAL(trace) << "Store: Calculated file path: " << file_path.string();

  // Open output file in binary mode for cross-platform consistency
  std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
  if (!file) {
    throw StoreError("Store: Failed to create file: " + file_path.string());
  }

  size_t bytes_written = 0;
  char buffer[4096];

  // Read input stream in chunks and write to file
  while (data.read(buffer, sizeof(buffer))) {
    file.write(buffer, data.gcount());
    bytes_written += data.gcount();
  }

  // Handle final partial chunk if present
  if (data.gcount() > 0) {
    file.write(buffer, data.gcount());
    bytes_written += data.gcount();
  }

  if (!file.good()) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to write record for key: " << key;
    throw StoreError("Store: Failed to write file: " + file_path.string());
  }

  file.close();
  BOOST_LOG_TRIVIAL(debug) << "Store: Successfully stored " << bytes_written << " bytes with key: " << key;
}

void Store::get(const std::string& key, std::ostream& output) const {
  BOOST_LOG_TRIVIAL(debug) << "Store: Retrieving data for key: " << key;

  std::filesystem::path file_path = resolve_key_path(key);
  verify_file_exists(file_path);

  // Open file in binary mode to handle all file types correctly
  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    throw StoreError("Store: Failed to open file: " + file_path.string());
  }

  char buffer[4096];
  size_t total_bytes = 0;

  // Read file in chunks to handle large files efficiently
  while (file.read(buffer, sizeof(buffer))) {
    output.write(buffer, file.gcount());
    total_bytes += file.gcount();
  }

  // Handle final partial chunk if any
  if (file.gcount() > 0) {
    output.write(buffer, file.gcount());
    total_bytes += file.gcount();
  }

  if (!output.good()) {
    throw StoreError("Store: Failed to write to output stream");
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Successfully streamed " << total_bytes << " bytes for key: " << key;
}

void Store::remove(const std::string& key) {
  BOOST_LOG_TRIVIAL(info) << "Store: Removing record with key: " << key;

  // Convert the key to its corresponding file path using content-addressing
  std::filesystem::path file_path = resolve_key_path(key);

  // Attempt to remove the file, std::filesystem::remove returns true if successful
  if (!std::filesystem::remove(file_path)) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to remove record with key: " << key;
    throw StoreError("Store: Failed to remove file");
  }

  // Clean up empty parent directories up to base_path_
  auto current = file_path.parent_path();
  while (current != base_path_ && std::filesystem::is_empty(current)) {
    std::filesystem::remove(current);
    current = current.parent_path();
  }

  BOOST_LOG_TRIVIAL(info) << "Store: Successfully removed record with key: " << key;
}

void Store::clear() {
  BOOST_LOG_TRIVIAL(info) << "Store: Clearing entire store at: " << base_path_;
  std::filesystem::remove_all(base_path_);
  check_directory_exists(base_path_);
  BOOST_LOG_TRIVIAL(info) << "Store: Store cleared successfully";
}


//==============================================
// CHUNK AND FILE DOCUMENTS
//==============================================

void Store::put_chunk(const std::string& files_id, uint32_t n, const std::vector<uint8_t>& data) {
  std::stringstream input;
  input.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  store(chunk_key(files_id, n), input);
}

std::optional<download::Chunk> Store::get_chunk(const std::string& files_id, uint32_t n) const {
  const std::string key = chunk_key(files_id, n);
  if (!has(key)) {
    BOOST_LOG_TRIVIAL(debug) << "Store: No chunk " << n << " for file " << files_id;
    return std::nullopt;
  }

  std::stringstream output;
  get(key, output);
  const std::string bytes = output.str();

  download::Chunk chunk;
  chunk.files_id = files_id;
  chunk.n = n;
  chunk.data.assign(bytes.begin(), bytes.end());
  return chunk;
}

void Store::put_file_info(const download::FileInfo& file_info) {
  std::stringstream input;
  FileInfoCodec::serialize(file_info, input);
  input.seekg(0);
  store(file_info_key(file_info.id), input);
}

std::optional<download::FileInfo> Store::get_file_info(const std::string& files_id) const {
  const std::string key = file_info_key(files_id);
  if (!has(key)) {
    BOOST_LOG_TRIVIAL(debug) << "Store: No file document for file " << files_id;
    return std::nullopt;
  }

  std::stringstream output;
  get(key, output);
  output.seekg(0);
  return FileInfoCodec::deserialize(output);
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool Store::has(const std::string& key) const {
  std::filesystem::path file_path = resolve_key_path(key);
  bool exists = std::filesystem::exists(file_path);

  BOOST_LOG_TRIVIAL(trace) << "Store: Key " << key << (exists ? " exists" : " not found")
                           << " at path: " << file_path.string();
  return exists;
}

std::uintmax_t Store::get_file_size(const std::string& key) const {
  BOOST_LOG_TRIVIAL(debug) << "Store: Getting file size for key: " << key;

  std::filesystem::path file_path = resolve_key_path(key);
  verify_file_exists(file_path);

  std::uintmax_t size = std::filesystem::file_size(file_path);
  BOOST_LOG_TRIVIAL(debug) << "Store: File size for key " << key << ": " << size << " bytes";
  return size;
}


//==============================================
// RECORD KEYS
//==============================================

std::string Store::chunk_key(const std::string& files_id, uint32_t n) {
  return files_id + "/chunks/" + std::to_string(n);
}

std::string Store::file_info_key(const std::string& files_id) {
  return files_id + "/files";
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::string Store::hash_key(const std::string& key) const {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;

  // Create a new message digest context for the hashing operation
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw StoreError("Store: Failed to create hash context");
  }

  // Initialize the context with SHA-256 algorithm
  if (!EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr)) {
    EVP_MD_CTX_free(ctx);
    throw StoreError("Store: Failed to initialize hash context");
  }

  // Feed the input key data into the hash function
  if (!EVP_DigestUpdate(ctx, key.c_str(), key.length())) {
    EVP_MD_CTX_free(ctx);
    throw StoreError("Store: Failed to update hash");
  }

  // Generate the final hash value
  if (!EVP_DigestFinal_ex(ctx, hash, &hash_len)) {
    EVP_MD_CTX_free(ctx);
    throw StoreError("Store: Failed to finalize hash");
  }

  EVP_MD_CTX_free(ctx);

  // Convert the raw hash bytes to a hexadecimal string
  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(hash[i]);
  }

  return ss.str();
}

std::filesystem::path Store::get_path_for_hash(const std::string& hash) const {
  std::filesystem::path path = base_path_;

  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }

  path /= hash.substr(6);
  return path;
}


//==============================================
// UTILITY METHODS
//==============================================

void Store::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

std::filesystem::path Store::resolve_key_path(const std::string& key) const {
  std::string hash = hash_key(key);
  return get_path_for_hash(hash);
}

void Store::verify_file_exists(const std::filesystem::path& file_path) const {
  if (!std::filesystem::exists(file_path)) {
    BOOST_LOG_TRIVIAL(error) << "Store: File not found: " << file_path.string();
    throw StoreError("Store: File not found");
  }
}

} // namespace store
} // namespace chunkfs
