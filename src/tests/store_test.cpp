#include <gtest/gtest.h>
#include <sstream>
#include <filesystem>
#include "store/store.hpp"
#include <chrono>
#include <thread>
#include <atomic>

using namespace chunkfs::store;
using chunkfs::download::FileInfo;

class StoreTest : public ::testing::Test {
protected:
  std::string test_dir;
  std::unique_ptr<Store> store;

  void SetUp() override {
    test_dir = std::filesystem::temp_directory_path() /
      ("store_test_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
    std::filesystem::create_directories(test_dir);
    ASSERT_TRUE(std::filesystem::exists(test_dir));
    store = std::make_unique<Store>(test_dir);
    ASSERT_NE(store, nullptr);
  }

  void TearDown() override {
    if (store) {
      store->clear();
      store.reset();
    }
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  // Helper methods to reduce repetition
  void store_and_verify(const std::string& key, const std::string& data) {
    auto input = create_test_stream(data);
    ASSERT_NO_THROW(store->store(key, *input)) << "Failed to store key: " << key;
    ASSERT_TRUE(store->has(key)) << "Key should exist after storing: " << key;

    std::stringstream output;
    ASSERT_NO_THROW(store->get(key, output)) << "Failed to retrieve key: " << key;
    ASSERT_EQ(output.str(), data) << "Data mismatch for key: " << key;
  }

  void expect_retrieval_fails(const std::string& key) {
    EXPECT_FALSE(store->has(key)) << "Key should not exist: " << key;
    std::stringstream output;
    EXPECT_THROW(store->get(key, output), StoreError)
      << "Getting non-existent key should throw: " << key;
  }

  static std::unique_ptr<std::stringstream> create_test_stream(const std::string& content) {
    auto ss = std::make_unique<std::stringstream>();
    if (!content.empty()) {
      ss->write(content.c_str(), content.length());
      ss->seekg(0);
    }
    return ss;
  }

  static FileInfo make_file_info(const std::string& id) {
    FileInfo file_info;
    file_info.id = id;
    file_info.length = 300;
    file_info.chunk_size_bytes = 128;
    file_info.upload_date = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123));
    file_info.content_hash = "d41d8cd98f00b204e9800998ecf8427e";
    file_info.filename = id + ".txt";
    file_info.metadata["type"] = "text/plain";
    return file_info;
  }
};

TEST_F(StoreTest, BasicOperations) {
  const std::string key = "test_key";
  const std::string data = "Hello, Store!";

  // Test storing and retrieving
  store_and_verify(key, data);

  // Test empty data
  store_and_verify("empty_key", "");

  // Test non-existent key
  expect_retrieval_fails("nonexistent_key");
}

TEST_F(StoreTest, ErrorHandling) {
  // Test invalid stream
  std::stringstream bad_stream;
  bad_stream.setstate(std::ios::badbit);
  EXPECT_THROW(store->store("bad_stream", bad_stream), StoreError);

  // Test clear operation
  store_and_verify("temp_key", "temp_data");
  ASSERT_NO_THROW(store->clear());
  expect_retrieval_fails("temp_key");
}

TEST_F(StoreTest, RemoveDeletesRecord) {
  store_and_verify("removable", "data");

  ASSERT_NO_THROW(store->remove("removable"));
  expect_retrieval_fails("removable");
  EXPECT_THROW(store->remove("removable"), StoreError);

  // Emptied fan-out directories are cleaned up
  EXPECT_TRUE(std::filesystem::is_empty(test_dir));
}

TEST_F(StoreTest, OverwriteReplacesRecord) {
  const std::string key = "advanced_test";
  const size_t large_size = 1024 * 1024;  // 1MB
  const std::string large_data(large_size, 'X');

  store_and_verify(key, large_data);
  ASSERT_EQ(store->get_file_size(key), large_size);

  const std::string updated_data = "Updated content";
  store_and_verify(key, updated_data);
  ASSERT_EQ(store->get_file_size(key), updated_data.length());
}

TEST_F(StoreTest, RecordKeys) {
  EXPECT_EQ(Store::chunk_key("abc", 0), "abc/chunks/0");
  EXPECT_EQ(Store::chunk_key("abc", 12), "abc/chunks/12");
  EXPECT_EQ(Store::file_info_key("abc"), "abc/files");
}

TEST_F(StoreTest, ChunkRecords) {
  const std::vector<uint8_t> data = {0x00, 0x01, 0xFF, 0x10, 0x00};
  store->put_chunk("file", 3, data);

  EXPECT_TRUE(store->has(Store::chunk_key("file", 3)));
  auto chunk = store->get_chunk("file", 3);
  ASSERT_TRUE(chunk.has_value());
  EXPECT_EQ(chunk->files_id, "file");
  EXPECT_EQ(chunk->n, 3u);
  EXPECT_EQ(chunk->data, data);

  EXPECT_FALSE(store->get_chunk("file", 4).has_value());
  EXPECT_FALSE(store->get_chunk("other", 3).has_value());
}

TEST_F(StoreTest, EmptyChunkRecord) {
  store->put_chunk("file", 0, {});

  auto chunk = store->get_chunk("file", 0);
  ASSERT_TRUE(chunk.has_value());
  EXPECT_TRUE(chunk->data.empty());
}

TEST_F(StoreTest, FileInfoRecords) {
  const FileInfo file_info = make_file_info("document");
  store->put_file_info(file_info);

  auto loaded = store->get_file_info("document");
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(*loaded, file_info);

  EXPECT_FALSE(store->get_file_info("unknown").has_value());
}

TEST_F(StoreTest, CorruptFileInfoRecordThrows) {
  auto input = create_test_stream("xx");
  store->store(Store::file_info_key("broken"), *input);

  EXPECT_THROW(store->get_file_info("broken"), StoreError);
}

TEST_F(StoreTest, ConcurrentAccess) {
  const size_t num_threads = 5;
  const size_t ops_per_thread = 50;
  std::atomic<size_t> successful_ops{0};
  std::vector<std::thread> threads;

  for (size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([this, i, ops_per_thread, &successful_ops]() {
      for (size_t j = 0; j < ops_per_thread; ++j) {
        try {
          const std::string files_id = "concurrent_" + std::to_string(i);
          const std::vector<uint8_t> data(j + 1, static_cast<uint8_t>(i));
          store->put_chunk(files_id, static_cast<uint32_t>(j), data);
          auto chunk = store->get_chunk(files_id, static_cast<uint32_t>(j));
          if (chunk && chunk->data == data) {
            successful_ops++;
          }
        } catch (const std::exception& e) {
          ADD_FAILURE() << "Thread " << i << " failed: " << e.what();
        }
      }
    });
  }

  for (auto& thread : threads) {
      thread.join();
  }

  EXPECT_EQ(successful_ops, num_threads * ops_per_thread);
}
