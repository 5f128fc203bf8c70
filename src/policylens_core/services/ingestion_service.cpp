#include "policylens_core/services/ingestion_service.hpp"

#include <algorithm>
#include <fstream>
#include <future>
#include <iostream>
#include <iterator>
#include <unordered_set>
#include <utility>

#include "policylens_core/errors.hpp"

namespace policylens_core {

void to_json(nlohmann::json &json_report, const IngestionReport &report) {
  json_report = nlohmann::json{{"pages_received", report.pages_received},
                               {"pages_indexed", report.pages_indexed},
                               {"pages_skipped", report.pages_skipped},
                               {"pages_empty", report.pages_empty},
                               {"chunk_stats", report.chunk_stats},
                               {"metadata_summary", report.metadata_summary}};
}

IngestionService::IngestionService(Normalizer normalizer,
                                   Tagger tagger,
                                   std::shared_ptr<EmbeddingService> embedding_service,
                                   size_t dimension,
                                   IngestionOptions options)
    : normalizer_(std::move(normalizer)),
      segmenter_(options.chunk_size, options.chunk_overlap),
      tagger_(std::move(tagger)),
      embedding_service_(std::move(embedding_service)),
      dimension_(dimension),
      options_(options) {
  if (!embedding_service_) {
    throw ConfigError("IngestionService requires an embedding service");
  }
  if (options_.num_workers <= 0) {
    throw ConfigError("num_workers must be positive, got " + std::to_string(options_.num_workers));
  }
  if (dimension_ == 0) {
    throw ConfigError("embedding dimension must be positive");
  }
}

std::vector<Chunk> IngestionService::chunk_page(const Page &page,
                                                const TaggingOverrides &overrides) const {
  validate_page(page);
  std::string clean_text = normalizer_.normalize(page.raw_text);
  if (clean_text.empty()) {
    return {};
  }
  return tagger_.tag(segmenter_.segment(clean_text), page, overrides);
}

IngestionService::PageOutcome IngestionService::process_page(
    const Page &page, const TaggingOverrides &overrides) const {
  PageOutcome outcome;
  try {
    outcome.chunks = chunk_page(page, overrides);
    if (outcome.chunks.empty()) {
      outcome.status = PageOutcome::Status::Empty;
    }
  } catch (const ParseInputError &e) {
    outcome.status = PageOutcome::Status::Skipped;
    outcome.error = e.what();
  }
  return outcome;
}

std::vector<IngestionService::PageOutcome> IngestionService::process_pages(
    const std::vector<Page> &pages, const TaggingOverrides &overrides) const {
  std::vector<PageOutcome> outcomes(pages.size());
  size_t workers = std::min(static_cast<size_t>(options_.num_workers), pages.size());
  if (workers <= 1) {
    for (size_t i = 0; i < pages.size(); ++i) {
      outcomes[i] = process_page(pages[i], overrides);
    }
    return outcomes;
  }

  // Contiguous slices, one per worker; each worker writes only its own slots.
  size_t slice = (pages.size() + workers - 1) / workers;
  std::vector<std::future<void>> futures;
  futures.reserve(workers);
  for (size_t start = 0; start < pages.size(); start += slice) {
    size_t end = std::min(start + slice, pages.size());
    auto work = [this, &pages, &outcomes, &overrides, start, end]() {
      for (size_t i = start; i < end; ++i) {
        outcomes[i] = process_page(pages[i], overrides);
      }
    };
    futures.push_back(std::async(std::launch::async, work));
  }
  for (auto &future : futures) {
    future.get();
  }
  return outcomes;
}

std::vector<std::vector<float>> IngestionService::embed_in_batches(
    const std::vector<Chunk> &chunks, const ProgressUpdater &on_progress) const {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(chunks.size());

  const size_t batch = static_cast<size_t>(embedding_service_->batch_size());
  for (size_t start = 0; start < chunks.size(); start += batch) {
    size_t end = std::min(start + batch, chunks.size());
    std::vector<std::string> texts;
    texts.reserve(end - start);
    for (size_t i = start; i < end; ++i) {
      texts.push_back(chunks[i].text);
    }

    for (auto &vector : embedding_service_->embed_many(texts)) {
      vectors.push_back(std::move(vector));
    }

    if (on_progress) {
      float progress = 0.3f + (0.6f * (static_cast<float>(end) / chunks.size()));
      on_progress(progress, "Embedded chunk " + std::to_string(end) + " of " +
                                std::to_string(chunks.size()));
    }
  }
  return vectors;
}

IngestionResult IngestionService::ingest(const std::vector<Page> &pages,
                                         const TaggingOverrides &overrides,
                                         const ProgressUpdater &on_progress) const {
  auto progress = [&on_progress](float fraction, const std::string &message) {
    if (on_progress) {
      on_progress(fraction, message);
    }
  };
  progress(0.0f, "Starting ingestion of " + std::to_string(pages.size()) + " pages...");

  // 1. Normalize, segment and tag every page
  IngestionReport report;
  report.pages_received = pages.size();
  std::vector<Chunk> chunks;
  std::unordered_set<std::string> chunk_ids;
  auto outcomes = process_pages(pages, overrides);
  for (size_t i = 0; i < outcomes.size(); ++i) {
    auto &outcome = outcomes[i];
    switch (outcome.status) {
      case PageOutcome::Status::Skipped:
        report.pages_skipped++;
        std::cerr << "Warning: Skipping page " << i << " of the batch: " << outcome.error
                  << std::endl;
        break;
      case PageOutcome::Status::Empty:
        report.pages_empty++;
        std::cout << "Page " << pages[i].page_number << " of '" << pages[i].source_id
                  << "' has no text after cleaning, skipped" << std::endl;
        break;
      case PageOutcome::Status::Indexed: {
        // Ids only keep a prefix of the file name, so two sources can collide.
        auto taken = std::find_if(outcome.chunks.begin(), outcome.chunks.end(),
                                  [&chunk_ids](const Chunk &chunk) {
                                    return chunk_ids.count(chunk.chunk_id) > 0;
                                  });
        if (taken != outcome.chunks.end()) {
          report.pages_skipped++;
          std::cerr << "Warning: Skipping page " << pages[i].page_number << " of '"
                    << pages[i].source_id << "': chunk id '" << taken->chunk_id
                    << "' is already used by an earlier page" << std::endl;
          break;
        }
        for (const auto &chunk : outcome.chunks) {
          chunk_ids.insert(chunk.chunk_id);
        }
        report.pages_indexed++;
        std::move(outcome.chunks.begin(), outcome.chunks.end(), std::back_inserter(chunks));
        break;
      }
    }
  }
  report.chunk_stats = chunk_stats(chunks);
  report.metadata_summary = metadata_summary(chunks);
  progress(0.3f, "Created " + std::to_string(chunks.size()) + " chunks from " +
                     std::to_string(report.pages_indexed) + " pages.");

  // 2. Embed; any failure here propagates and no store is produced
  std::vector<std::vector<float>> vectors = embed_in_batches(chunks, on_progress);

  // 3. Build
  auto store = std::make_shared<VectorStore>(dimension_);
  store->build(vectors, chunks);
  progress(1.0f, "Ingestion complete.");

  return {std::move(store), std::move(report)};
}

IngestionResult IngestionService::ingest_and_save(const std::vector<Page> &pages,
                                                  const std::filesystem::path &directory,
                                                  const TaggingOverrides &overrides,
                                                  const ProgressUpdater &on_progress) const {
  IngestionResult result = ingest(pages, overrides, on_progress);
  result.store->save(directory);
  return result;
}

std::vector<Page> IngestionService::load_pages(const std::filesystem::path &path) {
  std::ifstream pages_file(path);
  if (!pages_file) {
    throw ParseInputError("Could not open pages file: " + path.string());
  }

  nlohmann::json json_pages;
  try {
    json_pages = nlohmann::json::parse(pages_file);
  } catch (const nlohmann::json::parse_error &e) {
    throw ParseInputError("Pages file " + path.string() + " is not valid JSON: " + e.what());
  }
  if (!json_pages.is_array()) {
    throw ParseInputError("Pages file " + path.string() + " must contain a JSON array");
  }

  std::vector<Page> pages;
  pages.reserve(json_pages.size());
  for (size_t i = 0; i < json_pages.size(); ++i) {
    try {
      pages.push_back(page_from_json(json_pages[i]));
    } catch (const ParseInputError &e) {
      std::cerr << "Warning: Skipping entry " << i << " of " << path << ": " << e.what()
                << std::endl;
    }
  }
  std::cout << "Loaded " << pages.size() << " pages from " << path << std::endl;
  return pages;
}

}  // namespace policylens_core
