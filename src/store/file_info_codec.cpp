#include "store/file_info_codec.hpp"
#include "store/store.hpp"
#include <chrono>
#include <boost/log/trivial.hpp>

namespace chunkfs {
namespace store {

std::size_t FileInfoCodec::serialize(const download::FileInfo& file_info, std::ostream& output) {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid output stream state";
    throw StoreError("Codec: Invalid output stream");
  }

  std::size_t total_bytes = 0;
  BOOST_LOG_TRIVIAL(debug) << "Codec: Serializing file document " << file_info.id;

  total_bytes += write_string(output, file_info.id);
  total_bytes += write_integer<uint64_t>(output, file_info.length);
  total_bytes += write_integer<uint32_t>(output, file_info.chunk_size_bytes);

  // Upload date is kept at millisecond precision
  const int64_t upload_millis = std::chrono::duration_cast<std::chrono::milliseconds>(
    file_info.upload_date.time_since_epoch()).count();
  total_bytes += write_integer<int64_t>(output, upload_millis);

  const uint8_t has_hash = file_info.content_hash ? 1 : 0;
  write_bytes(output, &has_hash, sizeof(has_hash));
  total_bytes += sizeof(has_hash);
  if (file_info.content_hash) {
    total_bytes += write_string(output, *file_info.content_hash);
  }

  total_bytes += write_string(output, file_info.filename);

  total_bytes += write_integer<uint32_t>(output, static_cast<uint32_t>(file_info.metadata.size()));
  for (const auto& [key, value] : file_info.metadata) {
    total_bytes += write_string(output, key);
    total_bytes += write_string(output, value);
  }

  output.flush();
  BOOST_LOG_TRIVIAL(debug) << "Codec: File document serialization complete. Total bytes written: " << total_bytes;
  return total_bytes;
}

download::FileInfo FileInfoCodec::deserialize(std::istream& input) {
  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid input stream state";
    throw StoreError("Codec: Invalid input stream");
  }

  download::FileInfo file_info;
  file_info.id = read_string(input);
  file_info.length = read_integer<uint64_t>(input);
  file_info.chunk_size_bytes = read_integer<uint32_t>(input);

  const int64_t upload_millis = read_integer<int64_t>(input);
  file_info.upload_date = std::chrono::system_clock::time_point(
    std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(upload_millis)));

  uint8_t has_hash = 0;
  read_bytes(input, &has_hash, sizeof(has_hash));
  if (has_hash > 1) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid content hash flag: " << static_cast<int>(has_hash);
    throw StoreError("Codec: Invalid content hash flag");
  }
  if (has_hash) {
    file_info.content_hash = read_string(input);
  }

  file_info.filename = read_string(input);

  const uint32_t entry_count = read_integer<uint32_t>(input);
  for (uint32_t i = 0; i < entry_count; ++i) {
    std::string key = read_string(input);
    std::string value = read_string(input);
    file_info.metadata.emplace(std::move(key), std::move(value));
  }

  BOOST_LOG_TRIVIAL(debug) << "Codec: Deserialized file document " << file_info.id
                           << " (" << file_info.length << " bytes)";
  return file_info;
}

//==============================================
// STREAM OPERATIONS
//==============================================

void FileInfoCodec::write_bytes(std::ostream& output, const void* data, std::size_t size) {
  if (!output.write(static_cast<const char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to write " << size << " bytes to output stream";
    throw StoreError("Codec: Failed to write to output stream");
  }
}

void FileInfoCodec::read_bytes(std::istream& input, void* data, std::size_t size) {
  if (!input.read(static_cast<char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to read " << size << " bytes from input stream";
    throw StoreError("Codec: Failed to read from input stream");
  }
}

std::size_t FileInfoCodec::write_string(std::ostream& output, const std::string& value) {
  if (value.size() > MAX_FIELD_LENGTH) {
    throw StoreError("Codec: Field too long: " + std::to_string(value.size()) + " bytes");
  }
  std::size_t total_bytes = write_integer<uint32_t>(output, static_cast<uint32_t>(value.size()));
  if (!value.empty()) {
    write_bytes(output, value.data(), value.size());
  }
  return total_bytes + value.size();
}

std::string FileInfoCodec::read_string(std::istream& input) {
  const uint32_t size = read_integer<uint32_t>(input);
  if (size > MAX_FIELD_LENGTH) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Field length " << size << " exceeds limit";
    throw StoreError("Codec: Field too long");
  }
  std::string value(size, '\0');
  if (size > 0) {
    read_bytes(input, value.data(), size);
  }
  return value;
}

} // namespace store
} // namespace chunkfs
