/**
 * @file test_chunk_store.cpp
 * @brief Unit tests for ChunkStore
 */

#include <gtest/gtest.h>
#include "nightjar/chunk_store.hpp"
#include <filesystem>
#include <thread>
#include <vector>

using namespace nightjar;
namespace fs = std::filesystem;

class ChunkStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "nightjar_store_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);

        db_path_ = (test_dir_ / "chunks.db").string();
        store_ = std::make_unique<ChunkStore>(db_path_);
    }

    void TearDown() override {
        store_.reset();
        fs::remove_all(test_dir_);
    }

    static StoredChunk make_chunk(uint8_t fill, size_t size = 64) {
        StoredChunk chunk;
        chunk.encrypted.assign(size, fill);
        chunk.nonce.assign(12, static_cast<uint8_t>(fill + 1));
        return chunk;
    }

    fs::path test_dir_;
    std::string db_path_;
    std::unique_ptr<ChunkStore> store_;
};

// ============================================================================
// Basic Operations
// ============================================================================

TEST_F(ChunkStoreTest, PutAndGet) {
    ASSERT_TRUE(store_->put("file1", 0, make_chunk(0xAA)));

    auto chunk = store_->get("file1", 0);
    ASSERT_TRUE(chunk.has_value());
    EXPECT_EQ(chunk->encrypted, make_chunk(0xAA).encrypted);
    EXPECT_EQ(chunk->nonce, make_chunk(0xAA).nonce);
    EXPECT_EQ(chunk->wire_size(), 64u + 12u);
}

TEST_F(ChunkStoreTest, GetMissingReturnsNullopt) {
    EXPECT_FALSE(store_->get("file1", 0).has_value());
    EXPECT_FALSE(store_->has("file1", 0));
}

TEST_F(ChunkStoreTest, ChunksAreImmutable) {
    ASSERT_TRUE(store_->put("file1", 0, make_chunk(0x01)));
    EXPECT_TRUE(store_->put("file1", 0, make_chunk(0x02)));

    auto chunk = store_->get("file1", 0);
    ASSERT_TRUE(chunk.has_value());
    EXPECT_EQ(chunk->encrypted[0], 0x01);
    EXPECT_EQ(store_->count(), 1u);
}

TEST_F(ChunkStoreTest, EmptyCiphertextIsStored) {
    StoredChunk empty;
    empty.nonce.assign(12, 0);
    ASSERT_TRUE(store_->put("file1", 0, empty));

    auto chunk = store_->get("file1", 0);
    ASSERT_TRUE(chunk.has_value());
    EXPECT_TRUE(chunk->encrypted.empty());
}

TEST_F(ChunkStoreTest, ListIndicesSorted) {
    store_->put("file1", 2, make_chunk(2));
    store_->put("file1", 0, make_chunk(0));
    store_->put("file1", 1, make_chunk(1));
    store_->put("file2", 5, make_chunk(5));

    EXPECT_EQ(store_->list_indices("file1"), (std::vector<uint32_t>{0, 1, 2}));
    EXPECT_EQ(store_->list_indices("file2"), (std::vector<uint32_t>{5}));
    EXPECT_TRUE(store_->list_indices("file3").empty());
    EXPECT_EQ(store_->count(), 4u);
}

TEST_F(ChunkStoreTest, RemoveChunkAndFile) {
    store_->put("file1", 0, make_chunk(0));
    store_->put("file1", 1, make_chunk(1));
    store_->put("file2", 0, make_chunk(2));

    EXPECT_TRUE(store_->remove("file1", 0));
    EXPECT_FALSE(store_->remove("file1", 0));
    EXPECT_FALSE(store_->has("file1", 0));

    EXPECT_EQ(store_->remove_file("file1"), 1u);
    EXPECT_EQ(store_->count(), 1u);
    EXPECT_TRUE(store_->has("file2", 0));
}

TEST_F(ChunkStoreTest, MakeKey) {
    EXPECT_EQ(ChunkStore::make_key("abc", 7), "abc:7");
}

// ============================================================================
// Persistence and Concurrency
// ============================================================================

TEST_F(ChunkStoreTest, SurvivesReopen) {
    store_->put("file1", 3, make_chunk(0x33));
    store_.reset();

    store_ = std::make_unique<ChunkStore>(db_path_);
    auto chunk = store_->get("file1", 3);
    ASSERT_TRUE(chunk.has_value());
    EXPECT_EQ(chunk->encrypted[0], 0x33);
}

TEST_F(ChunkStoreTest, OpenFailureThrows) {
    EXPECT_THROW(ChunkStore((test_dir_ / "missing" / "dir" / "chunks.db").string()), std::runtime_error);
}

TEST_F(ChunkStoreTest, ConcurrentPuts) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, t]() {
            for (uint32_t i = 0; i < 25; ++i) {
                store_->put("file" + std::to_string(t), i, make_chunk(static_cast<uint8_t>(i)));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(store_->count(), 100u);
}
