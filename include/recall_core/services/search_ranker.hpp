#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "recall_core/db/vector_store.hpp"
#include "recall_core/services/embedding_service.hpp"
#include "recall_core/services/sync_coordinator.hpp"
#include "recall_core/types/unit.hpp"

namespace recall_core {

struct SearchOptions {
  size_t limit = 10;
  float min_similarity = 0.3f;  // applies to the raw similarity, never the boosted score
  double recency_window_days = 30.0;
  float recency_max_boost = 0.1f;
  size_t over_fetch_multiplier = 3;
  bool sync_before_search = true;
  int64_t sync_timeout_ms = 2000;
};

enum class SearchStatus { Ok, IndexEmpty };

inline std::string to_string(SearchStatus status) {
  switch (status) {
    case SearchStatus::Ok:
      return "ok";
    case SearchStatus::IndexEmpty:
      return "index_empty";
    default:
      return "unknown";
  }
}

struct SearchResult {
  std::string id;
  float distance;
  float similarity;
  float adjusted_score;
  int rank;  // 1-based
  UnitRecord unit;
};

struct SearchResponse {
  SearchStatus status = SearchStatus::Ok;
  std::vector<SearchResult> results;
  // Set when the pre-search sync failed and the query ran on the existing index.
  std::optional<std::string> sync_error;
};

// Milliseconds since the epoch.
using Clock = std::function<int64_t()>;
int64_t system_clock_ms();

class SearchRanker {
 public:
  // sync_coordinator may be null, in which case searches never sync first.
  SearchRanker(std::shared_ptr<EmbeddingService> embedding_service,
               std::shared_ptr<VectorStore> vector_store,
               std::shared_ptr<SyncCoordinator> sync_coordinator,
               SearchOptions defaults = {}, Clock clock = system_clock_ms);

  SearchResponse search(const std::string &query);
  // Throws ModelUnavailableError when the query cannot be embedded.
  SearchResponse search(const std::string &query, const SearchOptions &options);

  // Linear decay from max_boost at age 0 to 0 at window_days. Future
  // timestamps count as age 0.
  static float recency_boost(int64_t now_ms, int64_t last_modified_ms, double window_days,
                             float max_boost);

  const SearchOptions &default_options() const {
    return defaults_;
  }

 private:
  void sync_before_search(const SearchOptions &options, SearchResponse &response);
  static void validate(const SearchOptions &options);

  std::shared_ptr<EmbeddingService> embedding_service_;
  std::shared_ptr<VectorStore> vector_store_;
  std::shared_ptr<SyncCoordinator> sync_coordinator_;
  SearchOptions defaults_;
  Clock clock_;
};

}  // namespace recall_core
