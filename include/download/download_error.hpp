#ifndef CHUNKFS_DOWNLOAD_ERROR_HPP
#define CHUNKFS_DOWNLOAD_ERROR_HPP

#include <stdexcept>
#include <string>

namespace chunkfs {
namespace download {

class DownloadError : public std::runtime_error {
public:
  explicit DownloadError(const std::string& message)
    : std::runtime_error(message) {}
};

// Raised by every stream operation invoked after close/dispose
class DisposedStreamError : public DownloadError {
public:
  explicit DisposedStreamError(const std::string& message)
    : DownloadError("Disposed stream: " + message) {}
};

// Permanent capability limitation of a download stream
class UnsupportedOperationError : public DownloadError {
public:
  explicit UnsupportedOperationError(const std::string& message)
    : DownloadError("Unsupported operation: " + message) {}
};

class OutOfRangeError : public DownloadError {
public:
  explicit OutOfRangeError(const std::string& message)
    : DownloadError("Out of range: " + message) {}
};

class OperationCancelledError : public DownloadError {
public:
  explicit OperationCancelledError(const std::string& message)
    : DownloadError("Operation cancelled: " + message) {}
};

class FileNotFoundError : public DownloadError {
public:
  explicit FileNotFoundError(const std::string& message)
    : DownloadError("File not found: " + message) {}
};

// Stored data does not match the file metadata
class DataCorruptionError : public DownloadError {
public:
  explicit DataCorruptionError(const std::string& message)
    : DownloadError(message) {}
};

class MissingChunkError : public DataCorruptionError {
public:
  explicit MissingChunkError(const std::string& message)
    : DataCorruptionError("Missing chunk: " + message) {}
};

class CorruptChunkError : public DataCorruptionError {
public:
  explicit CorruptChunkError(const std::string& message)
    : DataCorruptionError("Corrupt chunk: " + message) {}
};

class CorruptFileError : public DataCorruptionError {
public:
  explicit CorruptFileError(const std::string& message)
    : DataCorruptionError("Corrupt file: " + message) {}
};

} // namespace download
} // namespace chunkfs

#endif // CHUNKFS_DOWNLOAD_ERROR_HPP
