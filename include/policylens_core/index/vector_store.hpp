#pragma once

#include <faiss/IndexFlat.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "policylens_core/types.hpp"

namespace policylens_core {

/**
 * @class VectorStore
 * @brief Exact squared-L2 index (faiss IndexFlatL2) with a parallel metadata table.
 *
 * Position i of the index is the chunk at position i of the metadata table, and the two
 * always have the same size. build() and load() replace both only once the new pair is
 * complete, so a failed build leaves the previous contents in place.
 *
 * Search scores are squared L2 distances: LOWER is MORE similar.
 *
 * Not synchronized. Publish a finished store to concurrent readers as
 * std::shared_ptr<const VectorStore>; the const interface is safe to share.
 */
class VectorStore {
 public:
  static constexpr const char *INDEX_FILE_NAME = "index.faiss";
  static constexpr const char *METADATA_FILE_NAME = "metadata.json";
  static constexpr const char *MANIFEST_FILE_NAME = "manifest.json";

  explicit VectorStore(size_t dimension);
  ~VectorStore();

  // Disable copy constructor and assignment
  VectorStore(const VectorStore &) = delete;
  VectorStore &operator=(const VectorStore &) = delete;

  // Throws DimensionMismatch on a length or dimension disagreement.
  void build(const std::vector<std::vector<float>> &vectors, const std::vector<Chunk> &metadata);
  void build(const std::vector<EmbeddedChunk> &embedded_chunks);

  // Writes index.faiss, metadata.json and manifest.json into `directory` (created if
  // missing). The manifest holds the count, the dimension and a SHA-256 of each artifact
  // and is renamed into place last, which commits the save. Throws CorruptStore.
  void save(const std::filesystem::path &directory) const;
  // Throws CorruptStore when a file is missing or unreadable, an artifact does not match
  // the manifest, or the counts disagree. DimensionMismatch when saved with another D.
  void load(const std::filesystem::path &directory);
  // True when all three files exist in `directory`.
  static bool exists(const std::filesystem::path &directory);

  // The k nearest entries ordered by ascending distance, ties by insertion order.
  std::vector<SearchResult> search(const std::vector<float> &query_vector, int k) const;

  size_t size() const {
    return metadata_.size();
  }
  bool empty() const {
    return metadata_.empty();
  }
  size_t dimension() const {
    return dimension_;
  }
  const Chunk &metadata_at(size_t position) const;
  const std::vector<Chunk> &metadata() const {
    return metadata_;
  }

 private:
  size_t dimension_;
  std::unique_ptr<faiss::IndexFlatL2> index_;
  std::vector<Chunk> metadata_;

  void validate_vector_dimension(const std::vector<float> &vector, const std::string &context) const;
};

}  // namespace policylens_core
