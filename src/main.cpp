#include "download/bucket.hpp"
#include "logger/logger.hpp"
#include "store/store.hpp"
#include "store/store_read_binding.hpp"
#include <boost/asio.hpp>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  std::string store_dir;
  std::string files_id;
  int64_t offset{0};
  bool seekable{false};
  bool check_hash{false};
  std::string log_file;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -d <store dir> -i <file id> [options]\n"
        << "Required arguments:\n"
        << "  -d, --dir         Store directory\n"
        << "  -i, --id          Id of the stored file\n"
        << "Options:\n"
        << "  -o, --offset      Start reading at this byte offset (implies --seekable)\n"
        << "  -s, --seekable    Read through a seekable stream\n"
        << "  -c, --check-hash  Verify the stored content hash (forward-only only)\n"
        << "  -l, --log         Write a debug log to this file\n"
        << "Example: " << program_name << " -d ./store -i report.pdf > report.pdf\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> value_flags = {
    "-d", "--dir", "-i", "--id", "-o", "--offset", "-l", "--log"
  };

  ProgramOptions options;

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "-s" || flag == "--seekable") {
      options.seekable = true;
      continue;
    }
    if (flag == "-c" || flag == "--check-hash") {
      options.check_hash = true;
      continue;
    }

    if (value_flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    const std::string value(argv[++i]);
    if (flag == "-d" || flag == "--dir") {
      options.store_dir = value;
    } else if (flag == "-i" || flag == "--id") {
      options.files_id = value;
    } else if (flag == "-l" || flag == "--log") {
      options.log_file = value;
    } else if (flag == "-o" || flag == "--offset") {
      try {
        options.offset = std::stoll(value);
      } catch (const std::exception&) {
        std::cerr << "Error: Invalid offset\n";
        print_usage(argv[0]);
        return options;
      }
      options.seekable = true;
    }
  }

  if (options.store_dir.empty() || options.files_id.empty()) {
    std::cerr << "Error: Both store directory and file id are required\n";
    print_usage(argv[0]);
    return options;
  }
  if (options.seekable && options.check_hash) {
    std::cerr << "Error: --check-hash cannot be combined with --seekable or --offset\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_download(const ProgramOptions& options) {
  try {
    chunkfs::store::Store store(options.store_dir);
    boost::asio::io_context io_context;
    chunkfs::store::StoreReadBinding binding(store, io_context);
    chunkfs::download::Bucket bucket;

    chunkfs::download::DownloadOptions download_options;
    download_options.seekable = options.seekable;
    download_options.check_content_hash = options.check_hash;

    auto stream = bucket.open_download_stream(binding, options.files_id, download_options);
    if (options.offset != 0) {
      stream->seek(options.offset, chunkfs::download::SeekOrigin::Begin);
    }
    LOG_INFO << "Copying file " << options.files_id << " (" << stream->length() << " bytes) to stdout";

    bool copy_done = false;
    std::exception_ptr copy_error;
    stream->async_copy_to(std::cout, [&copy_done, &copy_error](std::exception_ptr error) {
      copy_error = error;
      copy_done = true;
    });
    io_context.restart();
    io_context.run();
    stream->close();

    if (!copy_done) {
      throw std::runtime_error("Copy to stdout did not complete");
    }
    if (copy_error) {
      std::rethrow_exception(copy_error);
    }
    std::cout.flush();
    return true;
  } catch (const std::exception& e) {
    LOG_ERROR << "Download failed: " << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const auto options = parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }

  if (options.log_file.empty()) {
    chunkfs::logging::init_console_logging(boost::log::trivial::warning);
  } else {
    chunkfs::logging::init_logging(options.log_file, boost::log::trivial::debug);
  }

  return run_download(options) ? 0 : 1;
}
