#pragma once

#include <cstdint>
#include <string>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <memory>
#include <optional>
#include <vector>
#include <stdexcept>
#include "download/file_info.hpp"

namespace chunkfs {
namespace store {

// Content addressed record store holding the chunk and file documents of
// stored files. Every record lives at a path derived from the SHA-256 of its
// key, so record keys never touch the filesystem directly.
class Store {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Store(const std::string& base_path);


  // ---- CORE STORAGE OPERATIONS ----
  // stores data stream under given key
  void store(const std::string& key, std::istream& data);
  // Retrieves data stream using given key
  void get(const std::string& key, std::ostream& output) const;
  // Removes data associated with given key
  void remove(const std::string& key);
  // Removes all stored data and reset store
  void clear();


  // ---- CHUNK AND FILE DOCUMENTS ----
  // Stores chunk n of a file
  void put_chunk(const std::string& files_id, uint32_t n, const std::vector<uint8_t>& data);
  // Returns chunk n of a file, or nothing when no such record exists
  std::optional<download::Chunk> get_chunk(const std::string& files_id, uint32_t n) const;
  // Stores the metadata document of a file
  void put_file_info(const download::FileInfo& file_info);
  // Returns the metadata document of a file, or nothing when it is unknown
  std::optional<download::FileInfo> get_file_info(const std::string& files_id) const;


  // ---- QUERY OPERATIONS ----
  // Checks if data exists using given key
  bool has(const std::string& key) const;
  // Returns the size of the stored record in bytes
  std::uintmax_t get_file_size(const std::string& key) const;
  const std::filesystem::path& base_path() const { return base_path_; }


  // ---- RECORD KEYS ----
  static std::string chunk_key(const std::string& files_id, uint32_t n);
  static std::string file_info_key(const std::string& files_id);

private:
  // ---- PARAMETERS ----
  // Root path for all stored records
  std::filesystem::path base_path_;


  // ---- CAS STORAGE SUPPORT ----
  // Generate SHA-256 hash from key using OpenSSL EVP
  std::string hash_key(const std::string& key) const;
  // Creates a directory structure using parts of the hash:
  // {base_path}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}
  std::filesystem::path get_path_for_hash(const std::string& hash) const;


  // ---- QUERY OPERATIONS ----
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
  // Resolves a key to its corresponding filesystem path by generating hash and converting to path
  std::filesystem::path resolve_key_path(const std::string& key) const;
  // Verifies if a file exists at the given path, throws StoreError if not found
  void verify_file_exists(const std::filesystem::path& file_path) const;
};

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace store
} // namespace chunkfs
