#pragma once
#include <filesystem>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

#include "server.hpp"

// Forward declarations
namespace policylens_core {
class IngestionService;
class Retriever;
}  // namespace policylens_core

namespace policylens_api {

class Routes {
 public:
  static constexpr int DEFAULT_TOP_K = 5;

  Routes(std::shared_ptr<policylens_core::Retriever> retriever,
         std::shared_ptr<policylens_core::IngestionService> ingestion_service,
         std::filesystem::path store_directory);
  ~Routes() = default;

  // Disable copy constructor and assignment
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_retrieve(const crow::request &req);
  crow::response handle_ingest(const crow::request &req);
  crow::response handle_stats(const crow::request &req);

 private:
  std::shared_ptr<policylens_core::Retriever> retriever_;
  std::shared_ptr<policylens_core::IngestionService> ingestion_service_;
  std::filesystem::path store_directory_;
  // One ingestion at a time; retrieval keeps serving the published store meanwhile.
  std::mutex ingest_mutex_;

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace policylens_api
