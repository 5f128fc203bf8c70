#pragma once

#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "policylens_core/errors.hpp"
#include "policylens_core/services/ingestion_service.hpp"
#include "policylens_core/text/normalizer.hpp"

class Config {
 public:
  std::string api_base_url;
  std::string store_directory;
  std::string ollama_url;
  std::string embedding_model;
  int embedding_dimension;
  int embedding_batch_size;

  // Chunking and cleaning
  int chunk_size;
  int chunk_overlap;
  bool remove_boilerplate;
  std::vector<std::string> boilerplate_patterns;
  int num_workers;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string &filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw policylens_core::ConfigError("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const nlohmann::json::exception &e) {
      throw policylens_core::ConfigError(std::string("Failed to parse JSON in config file '") +
                                         filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json &json_config) {
    if (!json_config.is_object()) {
      throw policylens_core::ConfigError("Configuration must be a JSON object");
    }

    Config config;
    // Apply defaults when keys are missing; a key of the wrong type is an error
    try {
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));
      config.store_directory = json_config.value("store_directory", std::string("./data/store"));
      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model = json_config.value("embedding_model", std::string("all-minilm"));
      config.embedding_dimension = json_config.value("embedding_dimension", 384);
      config.embedding_batch_size = json_config.value("embedding_batch_size", 32);

      config.chunk_size = json_config.value("chunk_size", 500);
      config.chunk_overlap = json_config.value("chunk_overlap", 50);
      config.remove_boilerplate = json_config.value("remove_boilerplate", true);
      config.boilerplate_patterns = json_config.value(
          "boilerplate_patterns",
          std::vector<std::string>{"Oscar Health Insurance", "Confidential"});
      config.num_workers = json_config.value("num_workers", 1);
    } catch (const nlohmann::json::exception &e) {
      throw policylens_core::ConfigError(std::string("Invalid configuration value: ") + e.what());
    }

    config.validate();
    return config;
  }

  policylens_core::NormalizerOptions normalizer_options() const {
    return {remove_boilerplate, boilerplate_patterns};
  }

  policylens_core::IngestionOptions ingestion_options() const {
    return {chunk_size, chunk_overlap, num_workers};
  }

 private:
  void validate() const {
    if (api_base_url.empty()) {
      throw policylens_core::ConfigError("api_base_url cannot be empty");
    }
    if (store_directory.empty()) {
      throw policylens_core::ConfigError("store_directory cannot be empty");
    }
    if (ollama_url.empty()) {
      throw policylens_core::ConfigError("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw policylens_core::ConfigError("embedding_model cannot be empty");
    }
    if (embedding_dimension <= 0) {
      throw policylens_core::ConfigError("embedding_dimension must be greater than 0");
    }
    if (embedding_batch_size <= 0) {
      throw policylens_core::ConfigError("embedding_batch_size must be greater than 0");
    }
    if (chunk_size <= 0) {
      throw policylens_core::ConfigError("chunk_size must be greater than 0");
    }
    if (chunk_overlap <= 0) {
      throw policylens_core::ConfigError("chunk_overlap must be greater than 0");
    }
    if (chunk_overlap >= chunk_size) {
      throw policylens_core::ConfigError("chunk_overlap must be smaller than chunk_size");
    }
    if (num_workers <= 0) {
      throw policylens_core::ConfigError("num_workers must be greater than 0");
    }
  }
};
