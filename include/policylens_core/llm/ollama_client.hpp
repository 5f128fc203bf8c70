#pragma once

#include <string>
#include <vector>

namespace policylens_core {

/**
 * @class OllamaClient
 * @brief Thin wrapper over ollama-hpp for the embedding endpoint.
 *
 * Construction points the process-wide ollama-hpp connection at the server URL; the
 * server itself is first contacted by a request. Requests never reconfigure the
 * connection, so they may run concurrently. Every transport or server failure surfaces
 * as ModelUnavailable.
 */
class OllamaClient {
 public:
  OllamaClient(const std::string &ollama_url, const std::string &embedding_model);
  virtual ~OllamaClient() = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  // One request for the whole batch; vectors come back in input order.
  virtual std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts);

  virtual bool is_server_available();

  const std::string &embedding_model() const {
    return embedding_model_;
  }

 private:
  std::string ollama_url_;
  std::string embedding_model_;
};

}  // namespace policylens_core
