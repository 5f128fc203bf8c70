#include "policylens_core/services/embedding_service.hpp"

#include <algorithm>

#include "policylens_core/errors.hpp"

namespace policylens_core {

EmbeddingService::EmbeddingService(std::shared_ptr<OllamaClient> ollama_client,
                                   int batch_size,
                                   size_t expected_dimension)
    : ollama_client_(std::move(ollama_client)),
      batch_size_(batch_size),
      dimension_(expected_dimension) {
  if (!ollama_client_) {
    throw ConfigError("EmbeddingService requires an Ollama client");
  }
  if (batch_size_ <= 0) {
    throw ConfigError("embedding batch size must be positive, got " + std::to_string(batch_size_));
  }
}

size_t EmbeddingService::dimension() const {
  std::lock_guard<std::mutex> lock(dimension_mutex_);
  return dimension_;
}

void EmbeddingService::check_dimension(const std::vector<float> &vector) {
  std::lock_guard<std::mutex> lock(dimension_mutex_);
  if (vector.empty()) {
    throw ModelUnavailable("Embedding service returned an empty vector");
  }
  if (dimension_ == 0) {
    dimension_ = vector.size();
    return;
  }
  if (vector.size() != dimension_) {
    throw DimensionMismatch("Embedding dimension mismatch. Expected " + std::to_string(dimension_) +
                            ", got " + std::to_string(vector.size()));
  }
}

std::vector<std::vector<float>> EmbeddingService::embed_many(const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());

  const size_t batch = static_cast<size_t>(batch_size_);
  for (size_t start = 0; start < texts.size(); start += batch) {
    size_t end = std::min(start + batch, texts.size());
    std::vector<std::string> batch_texts(texts.begin() + start, texts.begin() + end);

    auto batch_vectors = ollama_client_->get_embeddings(batch_texts);
    if (batch_vectors.size() != batch_texts.size()) {
      throw ModelUnavailable("Embedding service returned " + std::to_string(batch_vectors.size()) +
                             " vectors for " + std::to_string(batch_texts.size()) + " texts");
    }
    for (auto &vector : batch_vectors) {
      check_dimension(vector);
      vectors.push_back(std::move(vector));
    }
  }
  return vectors;
}

std::vector<float> EmbeddingService::embed_one(const std::string &text) {
  return embed_many({text})[0];
}

}  // namespace policylens_core
