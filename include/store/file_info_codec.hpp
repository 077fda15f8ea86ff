#ifndef CHUNKFS_STORE_FILE_INFO_CODEC_HPP
#define CHUNKFS_STORE_FILE_INFO_CODEC_HPP

#include <cstdint>
#include <iostream>
#include <string>
#include <boost/endian/conversion.hpp>
#include "download/file_info.hpp"

namespace chunkfs {
namespace store {

// Binary layout of a file document record, all integers big endian:
//   u32 id length, id bytes
//   u64 length
//   u32 chunk size
//   i64 upload date in milliseconds since the epoch
//   u8  content hash present flag, then u32 length and bytes if set
//   u32 filename length, filename bytes
//   u32 metadata entry count, then per entry u32 key length, key bytes,
//       u32 value length, value bytes
class FileInfoCodec {
public:

  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Serializes a file document to an output stream, returns bytes written
  static std::size_t serialize(const download::FileInfo& file_info, std::ostream& output);
  // Deserializes a file document from an input stream
  static download::FileInfo deserialize(std::istream& input);

private:
  // Upper bound for any length prefixed field
  static constexpr uint32_t MAX_FIELD_LENGTH = 16 * 1024 * 1024;

  // ---- STREAM OPERATIONS ----
  // Writes bytes to an output stream
  static void write_bytes(std::ostream& output, const void* data, std::size_t size);
  // Reads bytes from an input stream
  static void read_bytes(std::istream& input, void* data, std::size_t size);
  static std::size_t write_string(std::ostream& output, const std::string& value);
  static std::string read_string(std::istream& input);

  
  // ---- HOST TO NETWORK BYTE ORDER CONVERSION ----
  template <typename T>
  static std::size_t write_integer(std::ostream& output, T host_value) {
    T network_value = boost::endian::native_to_big(host_value);
    write_bytes(output, &network_value, sizeof(network_value));
    return sizeof(network_value);
  }

  
  // ---- NETWORK TO HOST BYTE ORDER CONVERSION ----
  template <typename T>
  static T read_integer(std::istream& input) {
    T network_value;
    read_bytes(input, &network_value, sizeof(network_value));
    return boost::endian::big_to_native(network_value);
  }
};

} // namespace store
} // namespace chunkfs

#endif // CHUNKFS_STORE_FILE_INFO_CODEC_HPP
