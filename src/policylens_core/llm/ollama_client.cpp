#include "policylens_core/llm/ollama_client.hpp"

#include "ollama.hpp"
#include "policylens_core/errors.hpp"

namespace policylens_core {

OllamaClient::OllamaClient(const std::string &ollama_url, const std::string &embedding_model)
    : ollama_url_(ollama_url), embedding_model_(embedding_model) {
  // ollama-hpp keeps one process-wide connection; it is configured here and
  // never touched again by a request.
  ollama::setServerURL(ollama_url_);
}

std::vector<std::vector<float>> OllamaClient::get_embeddings(const std::vector<std::string> &texts) {
  if (texts.empty()) {
    return {};
  }
  try {
    ollama::request request = ollama::request::from_embedding(embedding_model_, texts[0]);
    request["input"] = texts;
    ollama::response response = ollama::generate_embeddings(request);

    auto json_response = response.as_json();
    if (!json_response.contains("embeddings")) {
      throw ModelUnavailable("Response does not contain embeddings field");
    }

    const auto &embeddings = json_response["embeddings"];
    if (!embeddings.is_array()) {
      throw ModelUnavailable("Embeddings field is not an array");
    }

    std::vector<std::vector<float>> vectors;
    vectors.reserve(embeddings.size());
    for (const auto &embedding : embeddings) {
      if (!embedding.is_array()) {
        throw ModelUnavailable("Embedding entry is not an array of floats");
      }
      vectors.push_back(embedding.get<std::vector<float>>());
    }
    return vectors;

  } catch (const ollama::exception &e) {
    throw ModelUnavailable("Embedding generation failed at " + ollama_url_ + ": " +
                           std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw ModelUnavailable("Malformed embedding response: " + std::string(e.what()));
  }
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

}  // namespace policylens_core
