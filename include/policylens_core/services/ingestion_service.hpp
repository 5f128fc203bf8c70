#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "policylens_core/index/vector_store.hpp"
#include "policylens_core/services/corpus_stats.hpp"
#include "policylens_core/services/embedding_service.hpp"
#include "policylens_core/tagging/tagger.hpp"
#include "policylens_core/text/normalizer.hpp"
#include "policylens_core/text/segmenter.hpp"
#include "policylens_core/types.hpp"

namespace policylens_core {

using ProgressUpdater = std::function<void(float, const std::string &)>;

struct IngestionOptions {
  int chunk_size = 500;
  int chunk_overlap = 50;
  int num_workers = 1;
};

struct IngestionReport {
  size_t pages_received = 0;
  size_t pages_indexed = 0;
  size_t pages_skipped = 0;  // rejected as malformed
  size_t pages_empty = 0;    // nothing left after normalization
  ChunkStats chunk_stats;
  MetadataSummary metadata_summary;
};

void to_json(nlohmann::json &json_report, const IngestionReport &report);

struct IngestionResult {
  std::shared_ptr<VectorStore> store;
  IngestionReport report;
};

/**
 * @class IngestionService
 * @brief Runs pages through normalize -> segment -> tag -> embed -> build.
 *
 * Pages are independent and are processed on up to `num_workers` threads; the chunk
 * sequence is always assembled in input page order. A malformed page is logged and skipped.
 * Embedding or dimension failures abort the run and no store is returned.
 */
class IngestionService {
 public:
  // Throws ConfigError for invalid chunking or worker settings.
  IngestionService(Normalizer normalizer,
                   Tagger tagger,
                   std::shared_ptr<EmbeddingService> embedding_service,
                   size_t dimension,
                   IngestionOptions options = {});

  IngestionResult ingest(const std::vector<Page> &pages,
                         const TaggingOverrides &overrides = {},
                         const ProgressUpdater &on_progress = nullptr) const;

  // ingest() followed by VectorStore::save(directory).
  IngestionResult ingest_and_save(const std::vector<Page> &pages,
                                  const std::filesystem::path &directory,
                                  const TaggingOverrides &overrides = {},
                                  const ProgressUpdater &on_progress = nullptr) const;

  // Reads a JSON array of page records. Malformed entries are logged and skipped; an
  // unreadable file or a document that is not an array throws ParseInputError.
  static std::vector<Page> load_pages(const std::filesystem::path &path);

  // Normalize, segment and tag one page.
  std::vector<Chunk> chunk_page(const Page &page, const TaggingOverrides &overrides = {}) const;

 private:
  struct PageOutcome {
    enum class Status { Indexed, Empty, Skipped };
    Status status = Status::Indexed;
    std::vector<Chunk> chunks;
    std::string error;
  };

  Normalizer normalizer_;
  Segmenter segmenter_;
  Tagger tagger_;
  std::shared_ptr<EmbeddingService> embedding_service_;
  size_t dimension_;
  IngestionOptions options_;

  PageOutcome process_page(const Page &page, const TaggingOverrides &overrides) const;
  std::vector<PageOutcome> process_pages(const std::vector<Page> &pages,
                                         const TaggingOverrides &overrides) const;
  std::vector<std::vector<float>> embed_in_batches(const std::vector<Chunk> &chunks,
                                                   const ProgressUpdater &on_progress) const;
};

}  // namespace policylens_core
