#include <atomic>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>

#include "policylens_api/config.hpp"
#include "policylens_api/routes.hpp"
#include "policylens_api/server.hpp"
#include "policylens_core/index/vector_store.hpp"
#include "policylens_core/llm/ollama_client.hpp"
#include "policylens_core/services/embedding_service.hpp"
#include "policylens_core/services/ingestion_service.hpp"
#include "policylens_core/services/retriever.hpp"
#include "policylens_core/tagging/tagger.hpp"
#include "policylens_core/text/normalizer.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

// The signal handler function
void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();  // Wake up the main thread
}

int main(int argc, char *argv[]) {
  try {
    std::string config_path = argc > 1 ? argv[1] : "policylensrc.json";
    Config config = Config::from_file(config_path);

    std::cout << "Starting PolicyLens API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Store Directory: " << config.store_directory << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << " (dimension "
              << config.embedding_dimension << ")" << std::endl;

    // Initialize core components
    const size_t dimension = static_cast<size_t>(config.embedding_dimension);
    auto ollama_client =
        std::make_shared<policylens_core::OllamaClient>(config.ollama_url, config.embedding_model);
    if (!ollama_client->is_server_available()) {
      std::cerr << "Warning: Ollama server is not reachable at " << config.ollama_url
                << "; retrieval and ingestion will fail until it is" << std::endl;
    }
    auto embedding_service = std::make_shared<policylens_core::EmbeddingService>(
        ollama_client, config.embedding_batch_size, dimension);
    auto ingestion_service = std::make_shared<policylens_core::IngestionService>(
        policylens_core::Normalizer(config.normalizer_options()), policylens_core::Tagger(),
        embedding_service, dimension, config.ingestion_options());

    auto store = std::make_shared<policylens_core::VectorStore>(dimension);
    if (policylens_core::VectorStore::exists(config.store_directory)) {
      store->load(config.store_directory);
    } else {
      std::cout << "No store found at " << config.store_directory
                << "; starting empty until the first ingestion" << std::endl;
    }
    auto retriever = std::make_shared<policylens_core::Retriever>(embedding_service, store);

    auto [host, port] = policylens_api::Server::parse_address(config.api_base_url);
    policylens_api::Server server(host, port);
    policylens_api::Routes routes(retriever, ingestion_service, config.store_directory);
    routes.register_routes(server);

    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "Stopping API server..." << std::endl;
    server.stop();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
