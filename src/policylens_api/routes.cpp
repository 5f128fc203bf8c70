#include "policylens_api/routes.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>

#include "policylens_core/errors.hpp"
#include "policylens_core/services/corpus_stats.hpp"
#include "policylens_core/services/ingestion_service.hpp"
#include "policylens_core/services/retriever.hpp"

namespace policylens_api {

namespace {

constexpr const char *API_VERSION = "0.1.0";

std::optional<std::string> optional_string(const nlohmann::json &body, const char *key) {
  auto it = body.find(key);
  if (it == body.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    throw std::invalid_argument(std::string("'") + key + "' must be a string");
  }
  return it->get<std::string>();
}

}  // namespace

Routes::Routes(std::shared_ptr<policylens_core::Retriever> retriever,
               std::shared_ptr<policylens_core::IngestionService> ingestion_service,
               std::filesystem::path store_directory)
    : retriever_(std::move(retriever)),
      ingestion_service_(std::move(ingestion_service)),
      store_directory_(std::move(store_directory)) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoint
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/retrieve").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_retrieve(req);
  });

  CROW_ROUTE(app, "/ingest").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_ingest(req);
  });

  CROW_ROUTE(app, "/stats")
  ([this](const crow::request &req) { return handle_stats(req); });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response = create_success_response("PolicyLens API is running");
  response["version"] = API_VERSION;
  response["status"] = "healthy";
  return create_json_response(response);
}

crow::response Routes::handle_retrieve(const crow::request &req) {
  try {
    auto json_body = parse_json_body(req.body);
    if (!json_body.contains("query") || !json_body["query"].is_string() ||
        json_body["query"].get<std::string>().empty()) {
      throw std::invalid_argument("'query' must be a non-empty string");
    }
    std::string query = json_body["query"].get<std::string>();

    int top_k = DEFAULT_TOP_K;
    if (json_body.contains("top_k")) {
      if (!json_body["top_k"].is_number_integer()) {
        throw std::invalid_argument("'top_k' must be an integer");
      }
      // Read wide so an out-of-range value cannot wrap into a valid one; more
      // than the store holds already means "everything".
      const auto &requested = json_body["top_k"];
      if (requested.is_number_unsigned()) {
        top_k = static_cast<int>(
            std::min<uint64_t>(requested.get<uint64_t>(), std::numeric_limits<int>::max()));
      } else {
        int64_t signed_top_k = requested.get<int64_t>();
        top_k = signed_top_k < 1 ? 0 : static_cast<int>(std::min<int64_t>(
                                           signed_top_k, std::numeric_limits<int>::max()));
      }
      if (top_k < 1) {
        throw std::invalid_argument("'top_k' must be at least 1");
      }
    }

    policylens_core::RetrievalFilter filter;
    filter.region = optional_string(json_body, "region");
    filter.category = optional_string(json_body, "category");

    std::cout << "Retrieve for: " << query << " with top_k: " << top_k << std::endl;
    auto results = retriever_->retrieve(query, top_k, filter);

    nlohmann::json response = create_success_response("Retrieved " +
                                                      std::to_string(results.size()) + " chunks");
    response["results"] = results;
    return create_json_response(response);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(std::string("Invalid JSON body: ") + e.what()),
                                400);
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const policylens_core::ModelUnavailable &e) {
    std::cerr << "Error: retrieval failed: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 503);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_retrieve: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_ingest(const crow::request &req) {
  try {
    auto json_body = parse_json_body(req.body);
    auto pages_file = optional_string(json_body, "pages_file");
    if (!pages_file || pages_file->empty()) {
      throw std::invalid_argument("'pages_file' is required");
    }
    policylens_core::TaggingOverrides overrides;
    overrides.region = optional_string(json_body, "region");
    overrides.category = optional_string(json_body, "category");

    std::lock_guard<std::mutex> lock(ingest_mutex_);
    std::cout << "Ingesting pages from: " << *pages_file << std::endl;
    auto pages = policylens_core::IngestionService::load_pages(*pages_file);
    auto result = ingestion_service_->ingest_and_save(
        pages, store_directory_, overrides, [](float progress, const std::string &message) {
          std::cout << "[" << static_cast<int>(progress * 100) << "%] " << message << std::endl;
        });
    retriever_->publish(result.store);

    nlohmann::json response =
        create_success_response("Ingestion complete", nlohmann::json(result.report));
    return create_json_response(response);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(std::string("Invalid JSON body: ") + e.what()),
                                400);
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const policylens_core::ParseInputError &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const policylens_core::ModelUnavailable &e) {
    std::cerr << "Error: ingestion aborted: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 503);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_ingest: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_stats(const crow::request &req) {
  auto store = retriever_->store();
  nlohmann::json response = create_success_response("Store statistics");
  if (!store) {
    response["total_vectors"] = 0;
    response["dimension"] = 0;
    response["regions"] = nlohmann::json::object();
    response["categories"] = nlohmann::json::object();
    return create_json_response(response);
  }

  auto summary = policylens_core::metadata_summary(store->metadata());
  response["total_vectors"] = store->size();
  response["dimension"] = store->dimension();
  response["regions"] = summary.regions;
  response["categories"] = summary.categories;
  return create_json_response(response);
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  auto json_body = nlohmann::json::parse(body);
  if (!json_body.is_object()) {
    throw std::invalid_argument("Request body must be a JSON object");
  }
  return json_body;
}

}  // namespace policylens_api
