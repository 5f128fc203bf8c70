#include <gtest/gtest.h>

#include "policylens_core/errors.hpp"
#include "policylens_core/types.hpp"

namespace policylens_core {

TEST(PageTest, ParsesCanonicalFields) {
  auto json_page = nlohmann::json::parse(
      R"({"source_id": "NC-formulary.pdf", "page_number": 3, "raw_text": "Tier 1"})");
  Page page = page_from_json(json_page);

  EXPECT_EQ(page.source_id, "NC-formulary.pdf");
  EXPECT_EQ(page.page_number, 3);
  EXPECT_EQ(page.raw_text, "Tier 1");
}

TEST(PageTest, ParsesLegacyFields) {
  auto json_page =
      nlohmann::json::parse(R"({"source": "texas-faq.pdf", "page_num": 1, "text": ""})");
  Page page = page_from_json(json_page);

  EXPECT_EQ(page.source_id, "texas-faq.pdf");
  EXPECT_EQ(page.page_number, 1);
  EXPECT_TRUE(page.raw_text.empty());
}

TEST(PageTest, RejectsMalformedRecords) {
  EXPECT_THROW(page_from_json(nlohmann::json::array()), ParseInputError);
  EXPECT_THROW(page_from_json(nlohmann::json::parse(R"({"page_number": 1, "raw_text": "x"})")),
               ParseInputError);
  EXPECT_THROW(page_from_json(nlohmann::json::parse(
                   R"({"source_id": "a.pdf", "page_number": "1", "raw_text": "x"})")),
               ParseInputError);
  EXPECT_THROW(
      page_from_json(nlohmann::json::parse(R"({"source_id": "a.pdf", "page_number": 1})")),
      ParseInputError);
  EXPECT_THROW(page_from_json(nlohmann::json::parse(
                   R"({"source_id": "", "page_number": 1, "raw_text": "x"})")),
               ParseInputError);
  EXPECT_THROW(page_from_json(nlohmann::json::parse(
                   R"({"source_id": "a.pdf", "page_number": 0, "raw_text": "x"})")),
               ParseInputError);
}

TEST(ChunkTest, JsonRoundTrip) {
  Chunk chunk;
  chunk.text = "Metformin is Tier 1.";
  chunk.source_id = "NC-formulary.pdf";
  chunk.page_number = 23;
  chunk.chunk_index = 2;
  chunk.chunk_id = "NC-formulary-p23-c2";
  chunk.region = "NC";
  chunk.category = "formulary";

  nlohmann::json json_chunk = chunk;
  Chunk restored = json_chunk.get<Chunk>();

  EXPECT_EQ(restored.text, chunk.text);
  EXPECT_EQ(restored.source_id, chunk.source_id);
  EXPECT_EQ(restored.page_number, chunk.page_number);
  EXPECT_EQ(restored.chunk_index, chunk.chunk_index);
  EXPECT_EQ(restored.chunk_id, chunk.chunk_id);
  EXPECT_EQ(restored.region, chunk.region);
  EXPECT_EQ(restored.category, chunk.category);
}

TEST(ChunkTest, MissingFieldThrows) {
  auto json_chunk = nlohmann::json::parse(R"({"text": "x", "source_id": "a.pdf"})");
  EXPECT_THROW(json_chunk.get<Chunk>(), nlohmann::json::exception);
}

TEST(ChunkTest, DefaultsToUnknownLabels) {
  Chunk chunk;
  EXPECT_EQ(chunk.region, UNKNOWN_LABEL);
  EXPECT_EQ(chunk.category, UNKNOWN_LABEL);
}

TEST(SearchResultTest, SerializesChunkWithScoreAndRank) {
  SearchResult result;
  result.chunk.text = "Copay is $5.";
  result.chunk.chunk_id = "NC-formulary-p1-c0";
  result.score = 0.25f;
  result.rank = 1;

  nlohmann::json json_result = result;
  EXPECT_EQ(json_result["text"], "Copay is $5.");
  EXPECT_EQ(json_result["chunk_id"], "NC-formulary-p1-c0");
  EXPECT_FLOAT_EQ(json_result["score"].get<float>(), 0.25f);
  EXPECT_EQ(json_result["rank"], 1);
}

}  // namespace policylens_core
