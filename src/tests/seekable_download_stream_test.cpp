#include <gtest/gtest.h>
#include <limits>
#include <vector>
#include "download/seekable_download_stream.hpp"
#include "download/download_error.hpp"
#include "test_utils.hpp"

using namespace chunkfs::download;
using chunkfs::test::FakeReadBinding;
using chunkfs::test::make_content;
using chunkfs::test::read_all;

class SeekableDownloadStreamTest : public ::testing::Test {
protected:
  static constexpr uint32_t CHUNK_SIZE = 128;
  FakeReadBinding binding;
  std::vector<uint8_t> content;
  FileInfo file_info;

  void SetUp() override {
    init_logging();
    content = make_content(320);
    file_info = binding.upload("seekable", content, CHUNK_SIZE);
  }

  std::vector<uint8_t> slice(std::size_t from, std::size_t count) const {
    const std::size_t end = std::min(content.size(), from + count);
    if (from >= end) {
      return {};
    }
    return std::vector<uint8_t>(content.begin() + from, content.begin() + end);
  }

  std::vector<uint8_t> read_some(SeekableDownloadStream& stream, std::size_t count) {
    std::vector<uint8_t> buffer(count);
    buffer.resize(stream.read(buffer.data(), buffer.size()));
    return buffer;
  }
};

TEST_F(SeekableDownloadStreamTest, ReadsWholeFile) {
  SeekableDownloadStream stream(binding, file_info);

  EXPECT_TRUE(stream.can_seek());
  EXPECT_EQ(read_all(stream, 50), content);
  EXPECT_EQ(stream.position(), 320u);
}

TEST_F(SeekableDownloadStreamTest, RoundTripsEverySize) {
  for (std::size_t size : chunkfs::test::round_trip_sizes(CHUNK_SIZE)) {
    for (std::size_t buffer_size : {1u, 127u, 128u, 129u, 1000u}) {
      FakeReadBinding sized_binding;
      const auto sized_content = make_content(size);
      const auto sized_info = sized_binding.upload("sized", sized_content, CHUNK_SIZE);

      SeekableDownloadStream stream(sized_binding, sized_info);
      EXPECT_EQ(read_all(stream, buffer_size), sized_content)
        << "size " << size << ", buffer size " << buffer_size;
      EXPECT_EQ(stream.position(), size);
    }
  }
}

TEST_F(SeekableDownloadStreamTest, SeekIntoOneByteTerminalChunk) {
  const auto sized_content = make_content(CHUNK_SIZE + 1);
  const auto sized_info = binding.upload("one-over", sized_content, CHUNK_SIZE);
  SeekableDownloadStream stream(binding, sized_info);

  EXPECT_EQ(stream.seek(-1, SeekOrigin::End), CHUNK_SIZE);
  std::vector<uint8_t> buffer(10);
  EXPECT_EQ(stream.read(buffer.data(), buffer.size()), 1u);
  EXPECT_EQ(buffer[0], sized_content.back());
  EXPECT_EQ(binding.fetched_indexes(), (std::vector<uint32_t>{1}));
}

TEST_F(SeekableDownloadStreamTest, SeekThenReadMatchesContent) {
  const std::vector<int64_t> positions = {0, 1, 64, 127, 128, 129, 200, 255, 256, 257, 300, 319};

  for (int64_t position : positions) {
    SeekableDownloadStream stream(binding, file_info);
    EXPECT_EQ(stream.seek(position, SeekOrigin::Begin), static_cast<uint64_t>(position));
    EXPECT_EQ(stream.position(), static_cast<uint64_t>(position));
    EXPECT_EQ(read_some(stream, 150), slice(position, 150)) << "position " << position;
  }
}

TEST_F(SeekableDownloadStreamTest, SetPositionMatchesSeekFromBegin) {
  SeekableDownloadStream stream(binding, file_info);

  stream.set_position(130);
  EXPECT_EQ(stream.position(), 130u);
  EXPECT_EQ(read_some(stream, 10), slice(130, 10));

  stream.set_position(5);
  EXPECT_EQ(read_some(stream, 10), slice(5, 10));
}

TEST_F(SeekableDownloadStreamTest, SeekFromCurrent) {
  SeekableDownloadStream stream(binding, file_info);
  read_some(stream, 10);

  EXPECT_EQ(stream.seek(5, SeekOrigin::Current), 15u);
  EXPECT_EQ(read_some(stream, 10), slice(15, 10));

  EXPECT_EQ(stream.seek(-20, SeekOrigin::Current), 5u);
  EXPECT_EQ(read_some(stream, 10), slice(5, 10));
}

TEST_F(SeekableDownloadStreamTest, SeekFromEnd) {
  SeekableDownloadStream stream(binding, file_info);

  EXPECT_EQ(stream.seek(-10, SeekOrigin::End), 310u);
  EXPECT_EQ(read_some(stream, 100), slice(310, 10));

  EXPECT_EQ(stream.seek(0, SeekOrigin::End), 320u);
  EXPECT_EQ(read_some(stream, 100).size(), 0u);
}

TEST_F(SeekableDownloadStreamTest, SeekPastEndReadsNothing) {
  SeekableDownloadStream stream(binding, file_info);

  EXPECT_EQ(stream.seek(1000, SeekOrigin::Begin), 1000u);
  EXPECT_EQ(stream.position(), 1000u);
  EXPECT_EQ(read_some(stream, 10).size(), 0u);
  EXPECT_EQ(stream.position(), 1000u);
  EXPECT_EQ(binding.fetch_count(), 0);

  // Seeking back into the file makes data readable again
  stream.seek(300, SeekOrigin::Begin);
  EXPECT_EQ(read_some(stream, 100), slice(300, 20));
}

TEST_F(SeekableDownloadStreamTest, NegativePositionIsRejected) {
  SeekableDownloadStream stream(binding, file_info);
  read_some(stream, 10);

  EXPECT_THROW(stream.seek(-1, SeekOrigin::Begin), OutOfRangeError);
  EXPECT_THROW(stream.seek(-11, SeekOrigin::Current), OutOfRangeError);
  EXPECT_THROW(stream.seek(-321, SeekOrigin::End), OutOfRangeError);
  EXPECT_THROW(stream.set_position(-1), OutOfRangeError);
  EXPECT_EQ(stream.position(), 10u);

  EXPECT_EQ(stream.seek(-10, SeekOrigin::Current), 0u);
}

TEST_F(SeekableDownloadStreamTest, OverflowingSeekIsRejected) {
  SeekableDownloadStream stream(binding, file_info);

  EXPECT_THROW(stream.seek(std::numeric_limits<int64_t>::max(), SeekOrigin::End), OutOfRangeError);
  EXPECT_EQ(stream.position(), 0u);
}

TEST_F(SeekableDownloadStreamTest, ReadsWithinBufferedChunkDoNotRefetch) {
  SeekableDownloadStream stream(binding, file_info);

  read_some(stream, 10);
  stream.seek(100, SeekOrigin::Begin);
  read_some(stream, 10);
  stream.seek(0, SeekOrigin::Begin);
  read_some(stream, 10);

  EXPECT_EQ(binding.fetch_count(), 1);
}

TEST_F(SeekableDownloadStreamTest, SeekingBackRefetchesEarlierChunk) {
  SeekableDownloadStream stream(binding, file_info);

  stream.seek(260, SeekOrigin::Begin);
  read_some(stream, 10);
  stream.seek(0, SeekOrigin::Begin);
  EXPECT_EQ(read_some(stream, 10), slice(0, 10));

  EXPECT_EQ(binding.fetched_indexes(), (std::vector<uint32_t>{2, 0}));
}

TEST_F(SeekableDownloadStreamTest, SeekAloneDoesNotFetch) {
  SeekableDownloadStream stream(binding, file_info);

  stream.seek(200, SeekOrigin::Begin);
  stream.seek(-5, SeekOrigin::End);
  EXPECT_EQ(binding.fetch_count(), 0);
}

TEST_F(SeekableDownloadStreamTest, MissingChunkIsReported) {
  binding.remove_chunk("seekable", 1);
  SeekableDownloadStream stream(binding, file_info);

  stream.seek(150, SeekOrigin::Begin);
  EXPECT_THROW(read_some(stream, 10), MissingChunkError);
  EXPECT_EQ(stream.position(), 150u);

  // Other chunks stay readable
  stream.seek(260, SeekOrigin::Begin);
  EXPECT_EQ(read_some(stream, 10), slice(260, 10));
}

TEST_F(SeekableDownloadStreamTest, WrongSizedChunkIsReported) {
  binding.put_chunk("seekable", 2, std::vector<uint8_t>(10, 0));
  SeekableDownloadStream stream(binding, file_info);

  stream.seek(-1, SeekOrigin::End);
  EXPECT_THROW(read_some(stream, 1), CorruptChunkError);
  EXPECT_EQ(stream.position(), 319u);
}

TEST_F(SeekableDownloadStreamTest, CancellationDuringFetchKeepsBufferedChunk) {
  SeekableDownloadStream stream(binding, file_info);
  EXPECT_EQ(read_some(stream, 10), slice(0, 10));

  binding.set_defer_fetches(true);
  CancellationSource source;
  std::vector<uint8_t> buffer(200);
  bool done = false;
  std::exception_ptr error;
  stream.async_read(buffer.data(), buffer.size(), [&](std::exception_ptr e, std::size_t) {
    error = e;
    done = true;
  }, source.token());

  source.cancel();
  binding.complete_pending();
  binding.io_context().restart();
  binding.io_context().run();

  ASSERT_TRUE(done);
  EXPECT_THROW(std::rethrow_exception(error), OperationCancelledError);
  EXPECT_EQ(stream.position(), 10u);

  // Chunk 0 is still buffered
  binding.set_defer_fetches(false);
  const int fetches = binding.fetch_count();
  EXPECT_EQ(read_some(stream, 10), slice(10, 10));
  EXPECT_EQ(binding.fetch_count(), fetches);
}
