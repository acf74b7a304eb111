#pragma once

#include <memory>
#include <optional>
#include <string>

#include "recall_cli/config.hpp"

namespace recall_core {
class DatabaseManager;
class VectorStore;
class EmbeddingService;
class GraphClient;
class SyncCoordinator;
class SearchRanker;
struct SearchResponse;
}  // namespace recall_core

namespace recall_cli {

enum class Command { Sync, Search, Status, Reconcile, Watch, Help };

struct CliOptions {
  Command command = Command::Help;
  std::string config_path = "graph_recall.json";
  bool full = false;
  bool rebuild = false;
  std::string query;
  std::optional<int> limit;
  std::optional<double> min_similarity;
};

class CliError : public std::exception {
 public:
  explicit CliError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class CliHandler {
 public:
  explicit CliHandler(AppConfig config);
  ~CliHandler();

  // Disable copy constructor and assignment
  CliHandler(const CliHandler &) = delete;
  CliHandler &operator=(const CliHandler &) = delete;

  // Parse command line arguments. Runs before the config is loaded.
  static CliOptions parse_arguments(int argc, char *argv[]);

  // Execute command
  void execute_command(const CliOptions &options);

  static void print_help();

 private:
  // Command handlers
  void handle_sync_command(const CliOptions &options);
  void handle_search_command(const CliOptions &options);
  void handle_status_command(const CliOptions &options);
  void handle_reconcile_command(const CliOptions &options);
  void handle_watch_command(const CliOptions &options);

  // Components are built on first use so `status` never needs Roam or Ollama.
  recall_core::VectorStore &store(bool verify_identity = true);
  recall_core::SyncCoordinator &coordinator();
  recall_core::SearchRanker &ranker();
  std::shared_ptr<recall_core::EmbeddingService> embedding_service();
  std::shared_ptr<recall_core::GraphClient> graph_client();

  void print_search_response(const recall_core::SearchResponse &response);

  AppConfig config_;
  std::unique_ptr<recall_core::DatabaseManager> db_manager_;
  std::shared_ptr<recall_core::VectorStore> vector_store_;
  std::shared_ptr<recall_core::EmbeddingService> embedding_service_;
  std::shared_ptr<recall_core::GraphClient> graph_client_;
  std::shared_ptr<recall_core::SyncCoordinator> coordinator_;
  std::shared_ptr<recall_core::SearchRanker> ranker_;
};

}  // namespace recall_cli
