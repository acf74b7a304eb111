#include "recall_cli/cli_handler.hpp"

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>

#include "recall_core/async/sync_scheduler.hpp"
#include "recall_core/db/database_manager.hpp"
#include "recall_core/db/vector_store.hpp"
#include "recall_core/graph/roam_graph_client.hpp"
#include "recall_core/llm/ollama_client.hpp"
#include "recall_core/services/embedding_service.hpp"
#include "recall_core/services/search_ranker.hpp"
#include "recall_core/services/sync_coordinator.hpp"

namespace recall_cli {

namespace {

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Stopping..." << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

std::string require_value(int argc, char *argv[], int &i, const std::string &flag) {
  if (i + 1 >= argc) {
    throw CliError(flag + " requires a value");
  }
  return argv[++i];
}

std::string truncate_for_display(const std::string &text, size_t max_chars) {
  if (text.size() <= max_chars) {
    return text;
  }
  return text.substr(0, max_chars) + "...";
}

}  // namespace

CliHandler::CliHandler(AppConfig config) : config_(std::move(config)) {}

CliHandler::~CliHandler() = default;

CliOptions CliHandler::parse_arguments(int argc, char *argv[]) {
  CliOptions options;
  if (argc < 2) {
    options.command = Command::Help;
    return options;
  }

  std::string command = argv[1];
  if (command == "sync" || command == "s") {
    options.command = Command::Sync;
  } else if (command == "search" || command == "q") {
    options.command = Command::Search;
  } else if (command == "status" || command == "st") {
    options.command = Command::Status;
  } else if (command == "reconcile") {
    options.command = Command::Reconcile;
  } else if (command == "watch" || command == "w") {
    options.command = Command::Watch;
  } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
    options.command = Command::Help;
    return options;
  } else {
    throw CliError("Unknown command: " + command);
  }

  for (int i = 2; i < argc; ++i) {
    std::string flag = argv[i];
    if (flag == "--config" || flag == "-c") {
      options.config_path = require_value(argc, argv, i, flag);
    } else if (options.command == Command::Sync && flag == "--full") {
      options.full = true;
    } else if (options.command == Command::Sync && flag == "--rebuild") {
      options.rebuild = true;
    } else if (options.command == Command::Search && (flag == "--query" || flag == "-q")) {
      options.query = require_value(argc, argv, i, flag);
    } else if (options.command == Command::Search && (flag == "--limit" || flag == "-k")) {
      std::string value = require_value(argc, argv, i, flag);
      try {
        options.limit = std::stoi(value);
      } catch (const std::exception &) {
        throw CliError("Invalid value for " + flag + ": " + value);
      }
      if (*options.limit <= 0) {
        throw CliError(flag + " must be greater than 0");
      }
    } else if (options.command == Command::Search &&
               (flag == "--min-similarity" || flag == "-m")) {
      std::string value = require_value(argc, argv, i, flag);
      try {
        options.min_similarity = std::stod(value);
      } catch (const std::exception &) {
        throw CliError("Invalid value for " + flag + ": " + value);
      }
    } else {
      throw CliError("Unknown option for " + command + ": " + flag);
    }
  }

  if (options.command == Command::Search && options.query.empty()) {
    throw CliError("Search command requires a query. Usage: search --query <query>");
  }
  return options;
}

void CliHandler::execute_command(const CliOptions &options) {
  switch (options.command) {
    case Command::Sync:
      handle_sync_command(options);
      break;
    case Command::Search:
      handle_search_command(options);
      break;
    case Command::Status:
      handle_status_command(options);
      break;
    case Command::Reconcile:
      handle_reconcile_command(options);
      break;
    case Command::Watch:
      handle_watch_command(options);
      break;
    case Command::Help:
      print_help();
      break;
  }
}

recall_core::VectorStore &CliHandler::store(bool verify_identity) {
  if (!vector_store_) {
    std::filesystem::path db_path(config_.db_path);
    if (db_path.has_parent_path()) {
      std::filesystem::create_directories(db_path.parent_path());
    }
    db_manager_ = std::make_unique<recall_core::DatabaseManager>(db_path, config_.db_key(),
                                                                 config_.db_pool_size);
    recall_core::VectorStoreOptions options;
    options.dimension = config_.embedding_dimension;
    options.embedding_model = config_.embedding_model;
    options.index_kind = recall_core::index_kind_from_string(config_.index_kind);
    options.verify_identity = verify_identity;
    vector_store_ = std::make_shared<recall_core::VectorStore>(*db_manager_, options);
  }
  return *vector_store_;
}

std::shared_ptr<recall_core::EmbeddingService> CliHandler::embedding_service() {
  if (!embedding_service_) {
    auto ollama_client =
        std::make_shared<recall_core::OllamaClient>(config_.ollama_url, config_.embedding_model);
    recall_core::EmbeddingConfig embedding_config;
    embedding_config.dimension = config_.embedding_dimension;
    embedding_config.batch_size = static_cast<size_t>(config_.embedding_batch_size);
    embedding_service_ =
        std::make_shared<recall_core::EmbeddingService>(ollama_client, embedding_config);
  }
  return embedding_service_;
}

std::shared_ptr<recall_core::GraphClient> CliHandler::graph_client() {
  if (!graph_client_) {
    if (config_.roam_graph.empty()) {
      throw CliError("No Roam graph configured. Set roam_graph or ROAM_GRAPH_NAME.");
    }
    std::string token = config_.roam_api_token();
    if (token.empty()) {
      throw CliError("No Roam API token found in $" + config_.roam_api_token_env);
    }
    recall_core::RoamConfig roam_config;
    roam_config.graph_name = config_.roam_graph;
    roam_config.api_token = token;
    graph_client_ = std::make_shared<recall_core::RoamGraphClient>(roam_config);
  }
  return graph_client_;
}

recall_core::SyncCoordinator &CliHandler::coordinator() {
  if (!coordinator_) {
    store();
    recall_core::SyncConfig sync_config;
    sync_config.commit_interval = static_cast<size_t>(config_.commit_interval);
    sync_config.commit_retries = config_.commit_retries;
    coordinator_ = std::make_shared<recall_core::SyncCoordinator>(
        graph_client(), embedding_service(), vector_store_, sync_config);
  }
  return *coordinator_;
}

recall_core::SearchRanker &CliHandler::ranker() {
  if (!ranker_) {
    coordinator();
    recall_core::SearchOptions defaults;
    defaults.limit = static_cast<size_t>(config_.search_limit);
    defaults.min_similarity = static_cast<float>(config_.search_min_similarity);
    defaults.recency_window_days = config_.search_recency_window_days;
    defaults.recency_max_boost = static_cast<float>(config_.search_recency_max_boost);
    defaults.sync_timeout_ms = config_.search_sync_timeout_ms;
    ranker_ = std::make_shared<recall_core::SearchRanker>(embedding_service(), vector_store_,
                                                          coordinator_, defaults);
  }
  return *ranker_;
}

void CliHandler::handle_sync_command(const CliOptions &options) {
  // A rebuild may be switching models, so the stored identity is not enforced.
  store(/*verify_identity*/ !options.rebuild);
  recall_core::SyncResult result;
  if (options.rebuild) {
    result = coordinator().rebuild();
  } else {
    result = coordinator().sync(options.full);
  }

  std::cout << "\n=== Sync " << recall_core::to_string(result.outcome) << " ===" << std::endl;
  std::cout << "Units processed: " << result.units_processed << std::endl;
  std::cout << "Elapsed: " << result.elapsed_ms << "ms" << std::endl;
  std::cout << "Watermark: "
            << (result.new_watermark ? std::to_string(*result.new_watermark) : "none")
            << std::endl;
}

void CliHandler::handle_search_command(const CliOptions &options) {
  recall_core::SearchOptions search_options = ranker().default_options();
  if (options.limit) {
    search_options.limit = static_cast<size_t>(*options.limit);
  }
  if (options.min_similarity) {
    search_options.min_similarity = static_cast<float>(*options.min_similarity);
  }
  std::cout << "Search for: " << options.query << " (limit: " << search_options.limit << ")"
            << std::endl;
  print_search_response(ranker().search(options.query, search_options));
}

void CliHandler::handle_status_command(const CliOptions &options) {
  auto &vector_store = store();
  auto watermark = vector_store.last_sync_timestamp();
  std::cout << "Database: " << config_.db_path << std::endl;
  std::cout << "Units indexed: " << vector_store.count() << std::endl;
  std::cout << "Watermark: " << (watermark ? std::to_string(*watermark) : "none") << std::endl;
  std::cout << "Sync status: " << recall_core::to_string(vector_store.sync_status())
            << std::endl;
  std::cout << "Embedding: " << config_.embedding_model << " (" << vector_store.dimension()
            << " dimensions, " << recall_core::to_string(vector_store.index_kind()) << " index)"
            << std::endl;
}

void CliHandler::handle_reconcile_command(const CliOptions &options) {
  auto result = coordinator().reconcile_deletions();
  std::cout << "Reconciliation " << recall_core::to_string(result.outcome) << ": removed "
            << result.units_processed << " units in " << result.elapsed_ms << "ms" << std::endl;
}

void CliHandler::handle_watch_command(const CliOptions &options) {
  int interval_seconds = config_.sync_poll_interval_seconds > 0
                             ? config_.sync_poll_interval_seconds
                             : 60;
  coordinator();
  recall_core::async::SyncScheduler scheduler(coordinator_,
                                              std::chrono::seconds(interval_seconds));

  signal(SIGINT, signal_handler);
  signal(SIGTERM, signal_handler);

  scheduler.start();
  std::cout << "Watching graph " << config_.roam_graph << ". Press Ctrl+C to exit." << std::endl;
  {
    std::unique_lock<std::mutex> lock(shutdown_mutex);
    shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
  }
  scheduler.stop();
  scheduler.join();
  std::cout << "Stopped after " << scheduler.cycles() << " sync cycles." << std::endl;
}

void CliHandler::print_search_response(const recall_core::SearchResponse &response) {
  if (response.sync_error) {
    std::cout << "Warning: sync failed, results may be stale (" << *response.sync_error << ")"
              << std::endl;
  }
  if (response.status == recall_core::SearchStatus::IndexEmpty) {
    std::cout << "The index is empty. Run `sync --full` first." << std::endl;
    return;
  }
  if (response.results.empty()) {
    std::cout << "No results above the similarity threshold." << std::endl;
    return;
  }

  std::cout << "\n=== Search Results ===" << std::endl;
  for (const auto &result : response.results) {
    std::cout << std::setw(3) << result.rank << ". "
              << "[" << std::fixed << std::setprecision(3) << result.adjusted_score
              << " | sim " << result.similarity << "] "
              << "((" << result.id << ")) " << result.unit.container_title << std::endl;
    std::cout << "     " << truncate_for_display(result.unit.content, 160) << std::endl;
  }
}

void CliHandler::print_help() {
  std::cout << "graph_recall_cli - semantic search over a Roam graph\n\n"
            << "Usage: graph_recall_cli <command> [options] [--config <path>]\n\n"
            << "Commands:\n"
            << "  sync [--full] [--rebuild]        Bring the index up to date\n"
            << "  search --query <q> [--limit N] [--min-similarity X]\n"
            << "                                   Ranked semantic search\n"
            << "  status                           Index size, watermark and sync status\n"
            << "  reconcile                        Remove units deleted from the graph\n"
            << "  watch                            Poll for changes until interrupted\n"
            << "  help                             Show this message\n\n"
            << "Environment:\n"
            << "  ROAM_API_TOKEN       Roam API token (name set by roam_api_token_env)\n"
            << "  ROAM_GRAPH_NAME      Graph name when roam_graph is not configured\n"
            << "  GRAPH_RECALL_DB_KEY  SQLCipher key (name set by db_key_env)\n"
            << std::endl;
}

}  // namespace recall_cli
