#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "policylens_core/llm/ollama_client.hpp"

namespace policylens_core {

/**
 * @class EmbeddingService
 * @brief Batches texts through an OllamaClient and checks what comes back.
 *
 * The batch size bounds how many texts go into one request and never changes the output.
 * The dimension is fixed by the first response seen (or by `expected_dimension` when it is
 * non-zero); any later vector of another length raises DimensionMismatch. A response with
 * the wrong number of vectors raises ModelUnavailable. Nothing partial is returned.
 */
class EmbeddingService {
 public:
  EmbeddingService(std::shared_ptr<OllamaClient> ollama_client,
                   int batch_size,
                   size_t expected_dimension = 0);

  std::vector<std::vector<float>> embed_many(const std::vector<std::string> &texts);
  std::vector<float> embed_one(const std::string &text);

  // 0 until the first response has been seen, unless fixed at construction.
  size_t dimension() const;
  int batch_size() const {
    return batch_size_;
  }

 private:
  std::shared_ptr<OllamaClient> ollama_client_;
  int batch_size_;
  size_t dimension_;
  mutable std::mutex dimension_mutex_;

  void check_dimension(const std::vector<float> &vector);
};

}  // namespace policylens_core
