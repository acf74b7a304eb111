#include "recall_core/services/search_ranker.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <unordered_map>

namespace recall_core {

namespace {
constexpr double kMillisPerDay = 86'400'000.0;
}

int64_t system_clock_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

SearchRanker::SearchRanker(std::shared_ptr<EmbeddingService> embedding_service,
                           std::shared_ptr<VectorStore> vector_store,
                           std::shared_ptr<SyncCoordinator> sync_coordinator,
                           SearchOptions defaults, Clock clock)
    : embedding_service_(std::move(embedding_service)),
      vector_store_(std::move(vector_store)),
      sync_coordinator_(std::move(sync_coordinator)),
      defaults_(defaults),
      clock_(std::move(clock)) {
  if (!embedding_service_ || !vector_store_) {
    throw std::invalid_argument("SearchRanker requires an embedder and a store");
  }
  if (!clock_) {
    clock_ = system_clock_ms;
  }
  validate(defaults_);
}

void SearchRanker::validate(const SearchOptions &options) {
  if (options.over_fetch_multiplier == 0) {
    throw std::invalid_argument("over_fetch_multiplier must be at least 1");
  }
  if (options.recency_window_days < 0.0) {
    throw std::invalid_argument("recency_window_days cannot be negative");
  }
  if (options.recency_max_boost < 0.0f) {
    throw std::invalid_argument("recency_max_boost cannot be negative");
  }
}

float SearchRanker::recency_boost(int64_t now_ms, int64_t last_modified_ms, double window_days,
                                  float max_boost) {
  if (window_days <= 0.0) {
    return 0.0f;
  }
  const double age_days = std::max<int64_t>(0, now_ms - last_modified_ms) / kMillisPerDay;
  const double factor = std::max(0.0, 1.0 - age_days / window_days);
  return static_cast<float>(max_boost * factor);
}

SearchResponse SearchRanker::search(const std::string &query) {
  return search(query, defaults_);
}

SearchResponse SearchRanker::search(const std::string &query, const SearchOptions &options) {
  validate(options);
  if (query.empty()) {
    throw std::invalid_argument("Search query must not be empty");
  }

  SearchResponse response;
  if (options.sync_before_search && sync_coordinator_) {
    sync_before_search(options, response);
  }

  if (vector_store_->count() == 0) {
    std::cout << "[Search] Index is empty, run a full sync first" << std::endl;
    response.status = SearchStatus::IndexEmpty;
    return response;
  }
  if (options.limit == 0) {
    return response;
  }

  Vector query_vector = embedding_service_->embed(query);
  // Saturates at the largest k faiss accepts
  const size_t max_k = static_cast<size_t>(std::numeric_limits<int>::max());
  const int k = options.limit > max_k / options.over_fetch_multiplier
                    ? std::numeric_limits<int>::max()
                    : static_cast<int>(options.limit * options.over_fetch_multiplier);
  std::vector<Neighbor> neighbors = vector_store_->knn(query_vector, k);

  std::vector<std::string> ids;
  ids.reserve(neighbors.size());
  for (const auto &neighbor : neighbors) {
    ids.push_back(neighbor.id);
  }
  std::unordered_map<std::string, UnitRecord> records;
  for (auto &record : vector_store_->get_many(ids)) {
    std::string id = record.id;
    records.emplace(std::move(id), std::move(record));
  }

  const int64_t now = clock_();
  std::vector<SearchResult> candidates;
  candidates.reserve(neighbors.size());
  for (const auto &neighbor : neighbors) {
    auto it = records.find(neighbor.id);
    if (it == records.end()) {
      std::cerr << "[Search] Warning: no metadata for neighbour " << neighbor.id << std::endl;
      continue;
    }
    const float similarity = distance_to_similarity(neighbor.distance);
    if (similarity < options.min_similarity) {
      continue;
    }
    SearchResult result;
    result.id = neighbor.id;
    result.distance = neighbor.distance;
    result.similarity = similarity;
    result.adjusted_score =
        similarity + recency_boost(now, it->second.last_modified, options.recency_window_days,
                                   options.recency_max_boost);
    result.rank = 0;
    result.unit = it->second;
    candidates.push_back(std::move(result));
  }

  std::sort(candidates.begin(), candidates.end(),
            [](const SearchResult &a, const SearchResult &b) {
              if (a.adjusted_score != b.adjusted_score)
                return a.adjusted_score > b.adjusted_score;
              return a.id < b.id;
            });
  if (candidates.size() > options.limit) {
    candidates.resize(options.limit);
  }
  for (size_t i = 0; i < candidates.size(); ++i) {
    candidates[i].rank = static_cast<int>(i + 1);
  }

  std::cout << "[Search] " << candidates.size() << " results from " << neighbors.size()
            << " candidates" << std::endl;
  response.results = std::move(candidates);
  return response;
}

void SearchRanker::sync_before_search(const SearchOptions &options, SearchResponse &response) {
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(options.sync_timeout_ms);
  try {
    SyncResult result = sync_coordinator_->incremental_sync(deadline);
    if (result.cancelled) {
      std::cout << "[Search] Pre-search sync hit its " << options.sync_timeout_ms
                << "ms budget after " << result.units_processed << " units" << std::endl;
    }
  } catch (const ModelUnavailableError &) {
    throw;
  } catch (const std::exception &e) {
    std::cerr << "[Search] Sync failed, searching the existing index: " << e.what()
              << std::endl;
    response.sync_error = e.what();
  }
}

}  // namespace recall_core
