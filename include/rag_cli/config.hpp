#pragma once

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "rag_core/db/index_store.hpp"

namespace rag_cli {

class Config {
 public:
  static constexpr const char *DEFAULT_CONFIG_FILE = "rag_index.json";

  std::string index_path;
  std::string metadata_path;
  int dimension;
  int default_top_k;
  bool use_file_lock;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Config must be a JSON object");
    }

    Config config;
    try {
      config.index_path = json_config.value("index_path", std::string("faiss.index"));
      config.metadata_path = json_config.value("metadata_path", std::string("faiss_metadata.json"));
      config.dimension = json_config.value("dimension", rag_core::StoreOptions::DEFAULT_DIMENSION);
      config.default_top_k = json_config.value("default_top_k", 5);
      config.use_file_lock = json_config.value("use_file_lock", true);
    } catch (const nlohmann::json::type_error& e) {
      throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    config.validate();
    return config;
  }

  static Config defaults() {
    return from_json(nlohmann::json::object());
  }

  rag_core::StoreOptions store_options() const {
    rag_core::StoreOptions options;
    options.index_path = index_path;
    options.metadata_path = metadata_path;
    options.dimension = dimension;
    return options;
  }

 private:
  void validate() const {
    if (index_path.empty()) {
      throw std::runtime_error("index_path cannot be empty");
    }
    if (metadata_path.empty()) {
      throw std::runtime_error("metadata_path cannot be empty");
    }
    if (std::filesystem::path(index_path).lexically_normal() ==
        std::filesystem::path(metadata_path).lexically_normal()) {
      throw std::runtime_error("index_path and metadata_path must differ");
    }
    if (dimension <= 0) {
      throw std::runtime_error("dimension must be greater than 0");
    }
    if (default_top_k <= 0) {
      throw std::runtime_error("default_top_k must be greater than 0");
    }
  }
};

}  // namespace rag_cli
