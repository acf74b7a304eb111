#pragma once

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace recall_cli {

class AppConfig {
 public:
  std::string db_path;
  std::string db_key_env;
  int db_pool_size;
  std::string index_kind;

  std::string ollama_url;
  std::string embedding_model;
  int embedding_dimension;
  int embedding_batch_size;

  int commit_interval;
  int commit_retries;

  std::string roam_graph;
  std::string roam_api_token_env;

  // Search defaults
  int search_limit;
  double search_min_similarity;
  double search_recency_window_days;
  double search_recency_max_boost;
  int search_sync_timeout_ms;

  int sync_poll_interval_seconds;

  // Load configuration from a JSON file at the given path
  static AppConfig from_file(const std::string &filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception &e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static AppConfig from_json(const nlohmann::json &json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Config root must be a JSON object");
    }
    AppConfig config;

    try {
      config.db_path = json_config.value("db_path", std::string("./data/graph_recall.db"));
      config.db_key_env = json_config.value("db_key_env", std::string("GRAPH_RECALL_DB_KEY"));
      config.db_pool_size = json_config.value("db_pool_size", 4);
      config.index_kind = json_config.value("index_kind", std::string("flat"));

      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model =
          json_config.value("embedding_model", std::string("mxbai-embed-large"));
      config.embedding_dimension = json_config.value("embedding_dimension", 1024);
      config.embedding_batch_size = json_config.value("embedding_batch_size", 64);

      config.commit_interval = json_config.value("commit_interval", 100);
      config.commit_retries = json_config.value("commit_retries", 2);

      config.roam_graph = json_config.value("roam_graph", std::string());
      config.roam_api_token_env =
          json_config.value("roam_api_token_env", std::string("ROAM_API_TOKEN"));

      const nlohmann::json search =
          json_config.contains("search") ? json_config.at("search") : nlohmann::json::object();
      config.search_limit = search.value("limit", 10);
      config.search_min_similarity = search.value("min_similarity", 0.3);
      config.search_recency_window_days = search.value("recency_window_days", 30.0);
      config.search_recency_max_boost = search.value("recency_max_boost", 0.1);
      config.search_sync_timeout_ms = search.value("sync_timeout_ms", 2000);

      config.sync_poll_interval_seconds = json_config.value("sync_poll_interval_seconds", 0);
    } catch (const nlohmann::json::exception &e) {
      throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    if (config.roam_graph.empty()) {
      const char *graph = std::getenv("ROAM_GRAPH_NAME");
      if (graph) {
        config.roam_graph = graph;
      }
    }

    config.validate();
    return config;
  }

  // Empty when the variable is unset, which opens the database unencrypted.
  std::string db_key() const {
    const char *key = std::getenv(db_key_env.c_str());
    return key ? std::string(key) : std::string();
  }

  std::string roam_api_token() const {
    const char *token = std::getenv(roam_api_token_env.c_str());
    return token ? std::string(token) : std::string();
  }

 private:
  void validate() const {
    if (db_path.empty()) {
      throw std::runtime_error("db_path cannot be empty");
    }
    if (db_pool_size <= 0) {
      throw std::runtime_error("db_pool_size must be greater than 0");
    }
    if (index_kind != "flat" && index_kind != "hnsw") {
      throw std::runtime_error("index_kind must be 'flat' or 'hnsw'");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (embedding_dimension <= 0) {
      throw std::runtime_error("embedding_dimension must be greater than 0");
    }
    if (embedding_batch_size <= 0) {
      throw std::runtime_error("embedding_batch_size must be greater than 0");
    }
    if (commit_interval <= 0) {
      throw std::runtime_error("commit_interval must be greater than 0");
    }
    if (commit_retries < 0) {
      throw std::runtime_error("commit_retries cannot be negative");
    }
    if (search_limit <= 0) {
      throw std::runtime_error("search.limit must be greater than 0");
    }
    if (search_min_similarity < 0.0 || search_min_similarity > 1.0) {
      throw std::runtime_error("search.min_similarity must be between 0 and 1");
    }
    if (search_recency_window_days < 0.0) {
      throw std::runtime_error("search.recency_window_days cannot be negative");
    }
    if (search_recency_max_boost < 0.0) {
      throw std::runtime_error("search.recency_max_boost cannot be negative");
    }
    if (search_sync_timeout_ms < 0) {
      throw std::runtime_error("search.sync_timeout_ms cannot be negative");
    }
    if (sync_poll_interval_seconds < 0) {
      throw std::runtime_error("sync_poll_interval_seconds cannot be negative");
    }
  }
};

}  // namespace recall_cli
