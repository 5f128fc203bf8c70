#include <gtest/gtest.h>

#include "common/utilities_test.hpp"
#include "policylens_core/services/corpus_stats.hpp"

namespace policylens_tests {

using namespace policylens_core;

TEST(CorpusStatsTest, EmptySetIsAllZero) {
  ChunkStats stats = chunk_stats({});
  EXPECT_EQ(stats.total_chunks, 0u);
  EXPECT_EQ(stats.avg_chunk_size, 0u);
  EXPECT_EQ(stats.min_chunk_size, 0u);
  EXPECT_EQ(stats.max_chunk_size, 0u);
  EXPECT_EQ(stats.total_chars, 0u);

  MetadataSummary summary = metadata_summary({});
  EXPECT_EQ(summary.total_chunks, 0u);
  EXPECT_TRUE(summary.regions.empty());
  EXPECT_TRUE(summary.categories.empty());
  EXPECT_EQ(summary.unique_pages, 0u);
  EXPECT_EQ(summary.page_range, "N/A");
}

TEST(CorpusStatsTest, SizesAreAggregated) {
  std::vector<Chunk> chunks = {
      TestUtilities::create_test_chunk(std::string(10, 'a')),
      TestUtilities::create_test_chunk(std::string(20, 'b')),
      TestUtilities::create_test_chunk(std::string(31, 'c')),
  };

  ChunkStats stats = chunk_stats(chunks);
  EXPECT_EQ(stats.total_chunks, 3u);
  EXPECT_EQ(stats.total_chars, 61u);
  EXPECT_EQ(stats.avg_chunk_size, 20u);
  EXPECT_EQ(stats.min_chunk_size, 10u);
  EXPECT_EQ(stats.max_chunk_size, 31u);
}

TEST(CorpusStatsTest, SizesCountCodePoints) {
  ChunkStats stats = chunk_stats({TestUtilities::create_test_chunk("caf\xC3\xA9")});
  EXPECT_EQ(stats.total_chars, 4u);
}

TEST(CorpusStatsTest, SummaryCountsLabelsAndPages) {
  std::vector<Chunk> chunks = {
      TestUtilities::create_test_chunk("a", "NC-formulary.pdf", 3, 0, "NC", "formulary"),
      TestUtilities::create_test_chunk("b", "NC-formulary.pdf", 3, 1, "NC", "formulary"),
      TestUtilities::create_test_chunk("c", "texas-faq.pdf", 7, 0, "TX", "faq"),
      TestUtilities::create_test_chunk("d", "texas-faq.pdf", 12, 0, "TX", "faq"),
  };

  MetadataSummary summary = metadata_summary(chunks);
  EXPECT_EQ(summary.total_chunks, 4u);
  EXPECT_EQ(summary.regions.at("NC"), 2u);
  EXPECT_EQ(summary.regions.at("TX"), 2u);
  EXPECT_EQ(summary.categories.at("formulary"), 2u);
  EXPECT_EQ(summary.categories.at("faq"), 2u);
  EXPECT_EQ(summary.unique_pages, 3u);
  EXPECT_EQ(summary.page_range, "3-12");
}

TEST(CorpusStatsTest, JsonShape) {
  nlohmann::json json_stats = chunk_stats({TestUtilities::create_test_chunk("abcd")});
  EXPECT_EQ(json_stats["total_chunks"], 1);
  EXPECT_EQ(json_stats["avg_chunk_size"], 4);

  nlohmann::json json_summary = metadata_summary({TestUtilities::create_test_chunk("abcd")});
  EXPECT_EQ(json_summary["regions"]["NC"], 1);
  EXPECT_EQ(json_summary["page_range"], "1-1");
}

}  // namespace policylens_tests
