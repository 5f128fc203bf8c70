#include <gtest/gtest.h>

#include <fstream>

#include "common/utilities_test.hpp"
#include "policylens_core/errors.hpp"
#include "policylens_core/index/vector_store.hpp"

namespace policylens_tests {

using namespace policylens_core;

class VectorStoreTest : public TempDirTestBase {
 protected:
  void SetUp() override {
    TempDirTestBase::SetUp();
    vectors_ = {{0.0f, 0.0f, 0.0f},
                {1.0f, 0.0f, 0.0f},
                {0.0f, 2.0f, 0.0f},
                {0.0f, 0.0f, 3.0f},
                {4.0f, 4.0f, 4.0f}};
    chunks_ = TestUtilities::create_test_chunks(5, "policy text");
  }

  std::vector<std::vector<float>> vectors_;
  std::vector<Chunk> chunks_;
};

TEST_F(VectorStoreTest, ExactQueryReturnsItsOwnChunk) {
  VectorStore store(3);
  store.build(vectors_, chunks_);

  auto results = store.search(vectors_[2], 1);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].chunk.chunk_id, chunks_[2].chunk_id);
  EXPECT_FLOAT_EQ(results[0].score, 0.0f);
  EXPECT_EQ(results[0].rank, 0);
}

TEST_F(VectorStoreTest, ResultsAscendByDistance) {
  VectorStore store(3);
  store.build(vectors_, chunks_);

  auto results = store.search({0.0f, 0.0f, 0.0f}, 5);
  ASSERT_EQ(results.size(), 5u);
  EXPECT_FLOAT_EQ(results[0].score, 0.0f);
  EXPECT_FLOAT_EQ(results[1].score, 1.0f);
  EXPECT_FLOAT_EQ(results[2].score, 4.0f);
  EXPECT_FLOAT_EQ(results[3].score, 9.0f);
  EXPECT_FLOAT_EQ(results[4].score, 48.0f);
  for (size_t i = 0; i < results.size(); ++i) {
    EXPECT_EQ(results[i].rank, static_cast<int>(i));
    EXPECT_EQ(results[i].chunk.chunk_id, chunks_[i].chunk_id);
  }
}

TEST_F(VectorStoreTest, KLargerThanStoreReturnsEverything) {
  VectorStore store(3);
  store.build(vectors_, chunks_);
  EXPECT_EQ(store.search(vectors_[0], 50).size(), 5u);
}

TEST_F(VectorStoreTest, NonPositiveKReturnsNothing) {
  VectorStore store(3);
  store.build(vectors_, chunks_);
  EXPECT_TRUE(store.search(vectors_[0], 0).empty());
  EXPECT_TRUE(store.search(vectors_[0], -1).empty());
}

TEST_F(VectorStoreTest, EmptyStoreReturnsNothing) {
  VectorStore store(3);
  EXPECT_TRUE(store.empty());
  EXPECT_TRUE(store.search({1.0f, 1.0f, 1.0f}, 3).empty());

  store.build({}, {});
  EXPECT_EQ(store.size(), 0u);
  EXPECT_TRUE(store.search({1.0f, 1.0f, 1.0f}, 3).empty());
}

TEST_F(VectorStoreTest, WrongQueryDimensionThrows) {
  VectorStore store(3);
  store.build(vectors_, chunks_);
  EXPECT_THROW(store.search({1.0f, 2.0f}, 1), DimensionMismatch);
}

TEST_F(VectorStoreTest, TiesKeepInsertionOrder) {
  VectorStore store(3);
  std::vector<std::vector<float>> tied = {
      {5.0f, 5.0f, 5.0f}, {1.0f, 1.0f, 1.0f}, {9.0f, 9.0f, 9.0f}, {1.0f, 1.0f, 1.0f}};
  auto chunks = TestUtilities::create_test_chunks(4);
  store.build(tied, chunks);

  auto results = store.search({1.0f, 1.0f, 1.0f}, 2);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].chunk.chunk_id, chunks[1].chunk_id);
  EXPECT_EQ(results[1].chunk.chunk_id, chunks[3].chunk_id);
}

TEST_F(VectorStoreTest, SmallerKIsPrefixOfLargerK) {
  VectorStore store(3);
  store.build(vectors_, chunks_);

  auto top2 = store.search({1.0f, 1.0f, 1.0f}, 2);
  auto top4 = store.search({1.0f, 1.0f, 1.0f}, 4);
  ASSERT_EQ(top2.size(), 2u);
  for (size_t i = 0; i < top2.size(); ++i) {
    EXPECT_EQ(top2[i].chunk.chunk_id, top4[i].chunk.chunk_id);
    EXPECT_FLOAT_EQ(top2[i].score, top4[i].score);
  }
}

TEST_F(VectorStoreTest, FailedBuildKeepsPreviousContents) {
  VectorStore store(3);
  store.build(vectors_, chunks_);

  EXPECT_THROW(store.build({{1.0f, 2.0f, 3.0f}}, chunks_), DimensionMismatch);
  EXPECT_THROW(store.build({{1.0f, 2.0f}}, {chunks_[0]}), DimensionMismatch);
  EXPECT_EQ(store.size(), 5u);
  EXPECT_EQ(store.search(vectors_[4], 1)[0].chunk.chunk_id, chunks_[4].chunk_id);
}

TEST_F(VectorStoreTest, BuildFromEmbeddedChunks) {
  std::vector<EmbeddedChunk> embedded;
  for (size_t i = 0; i < chunks_.size(); ++i) {
    embedded.push_back({chunks_[i], vectors_[i]});
  }
  VectorStore store(3);
  store.build(embedded);

  EXPECT_EQ(store.size(), 5u);
  EXPECT_EQ(store.metadata_at(3).chunk_id, chunks_[3].chunk_id);
}

TEST_F(VectorStoreTest, SaveAndLoadPreserveSearchResults) {
  VectorStore store(3);
  store.build(vectors_, chunks_);
  store.save(temp_dir_);
  EXPECT_TRUE(VectorStore::exists(temp_dir_));

  VectorStore loaded(3);
  loaded.load(temp_dir_);
  ASSERT_EQ(loaded.size(), store.size());

  auto expected = store.search({0.5f, 0.5f, 0.5f}, 5);
  auto actual = loaded.search({0.5f, 0.5f, 0.5f}, 5);
  ASSERT_EQ(actual.size(), expected.size());
  for (size_t i = 0; i < actual.size(); ++i) {
    EXPECT_EQ(actual[i].chunk.chunk_id, expected[i].chunk.chunk_id);
    EXPECT_EQ(actual[i].chunk.text, expected[i].chunk.text);
    EXPECT_EQ(actual[i].chunk.region, expected[i].chunk.region);
    EXPECT_FLOAT_EQ(actual[i].score, expected[i].score);
  }
}

TEST_F(VectorStoreTest, SaveCreatesMissingDirectory) {
  VectorStore store(3);
  store.build(vectors_, chunks_);
  auto nested = temp_dir_ / "nested" / "store";
  store.save(nested);
  EXPECT_TRUE(VectorStore::exists(nested));
}

TEST_F(VectorStoreTest, LoadMissingArtifactsThrows) {
  VectorStore store(3);
  EXPECT_FALSE(VectorStore::exists(temp_dir_));
  EXPECT_THROW(store.load(temp_dir_), CorruptStore);

  VectorStore saved(3);
  saved.build(vectors_, chunks_);
  saved.save(temp_dir_);
  std::filesystem::remove(temp_dir_ / VectorStore::METADATA_FILE_NAME);
  EXPECT_THROW(store.load(temp_dir_), CorruptStore);
}

TEST_F(VectorStoreTest, LoadCountMismatchThrows) {
  VectorStore saved(3);
  saved.build(vectors_, chunks_);
  saved.save(temp_dir_);

  nlohmann::json fewer = std::vector<Chunk>(chunks_.begin(), chunks_.begin() + 3);
  TestUtilities::write_file(temp_dir_ / VectorStore::METADATA_FILE_NAME, fewer.dump());

  VectorStore store(3);
  EXPECT_THROW(store.load(temp_dir_), CorruptStore);
  EXPECT_TRUE(store.empty());
}

TEST_F(VectorStoreTest, MetadataFromAnOlderSaveIsRejected) {
  VectorStore first(3);
  first.build(vectors_, chunks_);
  first.save(temp_dir_);
  auto older_metadata = temp_dir_ / "older_metadata.json";
  std::filesystem::copy_file(temp_dir_ / VectorStore::METADATA_FILE_NAME, older_metadata);

  VectorStore second(3);
  second.build(vectors_, TestUtilities::create_test_chunks(5, "amended policy text"));
  second.save(temp_dir_);
  std::filesystem::copy_file(older_metadata, temp_dir_ / VectorStore::METADATA_FILE_NAME,
                             std::filesystem::copy_options::overwrite_existing);

  VectorStore store(3);
  EXPECT_THROW(store.load(temp_dir_), CorruptStore);
  EXPECT_TRUE(store.empty());
}

TEST_F(VectorStoreTest, IndexFromAnInterruptedSaveIsRejected) {
  auto next_dir = temp_dir_ / "next";
  VectorStore first(3);
  first.build(vectors_, chunks_);
  first.save(temp_dir_);

  std::vector<std::vector<float>> moved = vectors_;
  moved[0] = {9.0f, 9.0f, 9.0f};
  VectorStore second(3);
  second.build(moved, chunks_);
  second.save(next_dir);

  // Only the index of the newer save made it into place.
  std::filesystem::copy_file(next_dir / VectorStore::INDEX_FILE_NAME,
                             temp_dir_ / VectorStore::INDEX_FILE_NAME,
                             std::filesystem::copy_options::overwrite_existing);

  VectorStore store(3);
  EXPECT_THROW(store.load(temp_dir_), CorruptStore);
}

TEST_F(VectorStoreTest, LoadWithoutManifestThrows) {
  VectorStore saved(3);
  saved.build(vectors_, chunks_);
  saved.save(temp_dir_);
  std::filesystem::remove(temp_dir_ / VectorStore::MANIFEST_FILE_NAME);

  EXPECT_FALSE(VectorStore::exists(temp_dir_));
  VectorStore store(3);
  EXPECT_THROW(store.load(temp_dir_), CorruptStore);

  TestUtilities::write_file(temp_dir_ / VectorStore::MANIFEST_FILE_NAME, R"({"vector_count": 5})");
  EXPECT_THROW(store.load(temp_dir_), CorruptStore);
}

TEST_F(VectorStoreTest, SaveUnderARegularFileThrowsCorruptStore) {
  VectorStore store(3);
  store.build(vectors_, chunks_);
  auto blocker = temp_dir_ / "blocker";
  TestUtilities::write_file(blocker, "not a directory");

  EXPECT_THROW(store.save(blocker / "store"), CorruptStore);
}

TEST_F(VectorStoreTest, LoadGarbageThrows) {
  VectorStore saved(3);
  saved.build(vectors_, chunks_);
  saved.save(temp_dir_);

  TestUtilities::write_file(temp_dir_ / VectorStore::METADATA_FILE_NAME, "{not json");
  VectorStore store(3);
  EXPECT_THROW(store.load(temp_dir_), CorruptStore);

  TestUtilities::write_file(temp_dir_ / VectorStore::METADATA_FILE_NAME, R"({"a": 1})");
  EXPECT_THROW(store.load(temp_dir_), CorruptStore);

  TestUtilities::write_file(temp_dir_ / VectorStore::INDEX_FILE_NAME, "garbage bytes");
  EXPECT_THROW(store.load(temp_dir_), CorruptStore);
}

TEST_F(VectorStoreTest, LoadWithOtherDimensionThrows) {
  VectorStore saved(3);
  saved.build(vectors_, chunks_);
  saved.save(temp_dir_);

  VectorStore store(4);
  EXPECT_THROW(store.load(temp_dir_), DimensionMismatch);
}

TEST_F(VectorStoreTest, MetadataAtOutOfRangeThrows) {
  VectorStore store(3);
  store.build(vectors_, chunks_);
  EXPECT_EQ(store.metadata_at(0).chunk_id, chunks_[0].chunk_id);
  EXPECT_THROW(store.metadata_at(5), std::out_of_range);
}

TEST_F(VectorStoreTest, ZeroDimensionThrows) {
  EXPECT_THROW(VectorStore(0), ConfigError);
}

}  // namespace policylens_tests
