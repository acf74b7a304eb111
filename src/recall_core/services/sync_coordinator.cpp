#include "recall_core/services/sync_coordinator.hpp"

#include <algorithm>
#include <iostream>
#include <set>
#include <stdexcept>
#include <unordered_map>

namespace recall_core {

namespace {

// Puts the coordinator back to IDLE however the sync ends.
class PhaseGuard {
 public:
  explicit PhaseGuard(std::atomic<SyncPhase> &phase) : phase_(phase) {
    phase_.store(SyncPhase::DIFFING);
  }
  ~PhaseGuard() {
    phase_.store(SyncPhase::IDLE);
  }

 private:
  std::atomic<SyncPhase> &phase_;
};

int64_t elapsed_since(std::chrono::steady_clock::time_point started) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               started)
      .count();
}

}  // namespace

SyncCoordinator::SyncCoordinator(std::shared_ptr<GraphClient> graph_client,
                                 std::shared_ptr<EmbeddingService> embedding_service,
                                 std::shared_ptr<VectorStore> vector_store, SyncConfig config)
    : graph_client_(std::move(graph_client)),
      embedding_service_(std::move(embedding_service)),
      vector_store_(std::move(vector_store)),
      config_(config) {
  if (!graph_client_ || !embedding_service_ || !vector_store_) {
    throw std::invalid_argument("SyncCoordinator requires a graph client, embedder and store");
  }
  if (config_.commit_interval == 0) {
    throw std::invalid_argument("Commit interval must be at least 1");
  }
  if (config_.commit_retries < 0) {
    throw std::invalid_argument("Commit retries cannot be negative");
  }
}

SyncResult SyncCoordinator::full_sync(Deadline deadline) {
  return run(Mode::Full, deadline);
}

SyncResult SyncCoordinator::incremental_sync(Deadline deadline) {
  return run(Mode::Incremental, deadline);
}

SyncResult SyncCoordinator::rebuild(Deadline deadline) {
  return run(Mode::Rebuild, deadline);
}

SyncResult SyncCoordinator::sync(bool full, Deadline deadline) {
  return full ? full_sync(deadline) : incremental_sync(deadline);
}

SyncResult SyncCoordinator::run(Mode mode, Deadline deadline) {
  std::unique_lock<std::mutex> lock(sync_mutex_, std::try_to_lock);
  if (!lock.owns_lock()) {
    std::cout << "[Sync] A sync is already running, skipping this request" << std::endl;
    SyncResult result;
    result.outcome = SyncOutcome::AlreadyRunning;
    return result;
  }

  const auto started = std::chrono::steady_clock::now();
  PhaseGuard guard(phase_);

  std::vector<UnitSnapshot> units;
  std::optional<int64_t> watermark = vector_store_->last_sync_timestamp();

  switch (mode) {
    case Mode::Incremental:
      if (watermark) {
        std::cout << "[Sync] Incremental sync since " << *watermark << std::endl;
        units = graph_client_->fetch_modified_since(*watermark);
      } else {
        std::cout << "[Sync] No watermark recorded, fetching the whole graph" << std::endl;
        units = graph_client_->fetch_all();
      }
      break;
    case Mode::Full:
      std::cout << "[Sync] Full sync" << std::endl;
      units = graph_client_->fetch_all();
      break;
    case Mode::Rebuild:
      std::cout << "[Sync] Rebuilding index from scratch" << std::endl;
      units = graph_client_->fetch_all();
      if (units.empty()) {
        vector_store_->drop_all();
        watermark.reset();
      }
      break;
  }

  if (units.empty()) {
    std::cout << "[Sync] No changes to sync" << std::endl;
    if (mode == Mode::Rebuild) {
      vector_store_->set_sync_status(SyncStatus::COMPLETED);
    }
    SyncResult result;
    result.outcome = mode == Mode::Rebuild ? SyncOutcome::Completed : SyncOutcome::NoChanges;
    result.new_watermark = watermark;
    result.elapsed_ms = elapsed_since(started);
    return result;
  }

  return process(std::move(units), deadline, started, mode == Mode::Rebuild);
}

SyncResult SyncCoordinator::process(std::vector<UnitSnapshot> units, Deadline deadline,
                                    std::chrono::steady_clock::time_point started,
                                    bool replace_existing) {
  units = order_for_commit(std::move(units));
  const size_t total = units.size();
  // Taken before any embedding starts; edits made during the sync land above it.
  const int64_t max_observed = units.back().last_modified;

  embedding_service_->ensure_ready();
  vector_store_->set_sync_status(SyncStatus::IN_PROGRESS);

  SyncResult result;
  if (!replace_existing) {
    result.new_watermark = vector_store_->last_sync_timestamp();
  }
  std::cout << "[Sync] Processing " << total << " units in sub-batches of "
            << config_.commit_interval << std::endl;

  for (size_t begin = 0; begin < total; begin += config_.commit_interval) {
    const size_t end = std::min(total, begin + config_.commit_interval);

    if (expired(deadline)) {
      result.cancelled = true;
      break;
    }

    phase_.store(SyncPhase::EMBEDDING);
    bool cancelled =
        config_.backfill_ancestors && !backfill_ancestors(units, begin, end, deadline);
    std::vector<Vector> vectors;
    if (!cancelled) {
      vectors = embed_slice(units, begin, end, deadline, cancelled);
    }
    if (cancelled || expired(deadline)) {
      result.cancelled = true;
      break;
    }

    std::vector<EmbeddedUnit> batch;
    batch.reserve(end - begin);
    for (size_t i = begin; i < end; ++i) {
      batch.push_back({units[i], std::move(vectors[i - begin])});
    }

    phase_.store(SyncPhase::COMMITTING);
    // A rebuild keeps the old index until vectors from the current model are in hand
    if (replace_existing) {
      vector_store_->drop_all();
      vector_store_->set_sync_status(SyncStatus::IN_PROGRESS);
      replace_existing = false;
    }
    commit_with_retry(batch);
    result.units_processed += batch.size();

    // Everything at or below the candidate is committed. When the next pending
    // unit shares the last committed timestamp, stop just below that group.
    int64_t candidate = max_observed;
    if (end < total) {
      const int64_t next = units[end].last_modified;
      const int64_t last = units[end - 1].last_modified;
      candidate = next > last ? last : next - 1;
    }
    result.new_watermark = advance_watermark(candidate);

    std::cout << "[Sync] Committed " << end << "/" << total << " units" << std::endl;
  }

  if (replace_existing) {
    // Cancelled before the first commit; the old index is still in place
    result.new_watermark = vector_store_->last_sync_timestamp();
  }
  if (result.cancelled) {
    result.outcome = SyncOutcome::Cancelled;
    std::cout << "[Sync] Deadline reached after " << result.units_processed << "/" << total
              << " units, stopping" << std::endl;
  } else {
    result.outcome = SyncOutcome::Completed;
    vector_store_->set_sync_status(SyncStatus::COMPLETED);
  }
  result.elapsed_ms = elapsed_since(started);
  std::cout << "[Sync] Finished: " << result.units_processed << " units in " << result.elapsed_ms
            << "ms, watermark "
            << (result.new_watermark ? std::to_string(*result.new_watermark) : "none")
            << std::endl;
  return result;
}

bool SyncCoordinator::backfill_ancestors(std::vector<UnitSnapshot> &units, size_t begin,
                                         size_t end, Deadline deadline) {
  for (size_t i = begin; i < end; ++i) {
    UnitSnapshot &unit = units[i];
    if (!unit.ancestor_texts.empty() || unit.parent_id.empty() ||
        unit.parent_id == unit.container_id) {
      continue;
    }
    if (expired(deadline)) {
      return false;
    }
    try {
      unit.ancestor_texts = graph_client_->fetch_ancestor_chain(unit.id);
    } catch (const GraphSourceError &e) {
      std::cerr << "[Sync] Could not fetch ancestors of " << unit.id
                << ", embedding without context: " << e.what() << std::endl;
    }
  }
  return true;
}

std::vector<Vector> SyncCoordinator::embed_slice(const std::vector<UnitSnapshot> &units,
                                                 size_t begin, size_t end, Deadline deadline,
                                                 bool &cancelled) {
  std::vector<Vector> vectors;
  vectors.reserve(end - begin);
  const size_t batch_size = embedding_service_->batch_size();
  for (size_t start = begin; start < end; start += batch_size) {
    if (expired(deadline)) {
      cancelled = true;
      return {};
    }
    const size_t stop = std::min(end, start + batch_size);
    std::vector<std::string> texts;
    texts.reserve(stop - start);
    for (size_t i = start; i < stop; ++i) {
      texts.push_back(EmbeddingService::format_unit_text(units[i]));
    }
    auto batch = embedding_service_->embed_batch(texts);
    for (auto &vector : batch) {
      vectors.push_back(std::move(vector));
    }
  }
  return vectors;
}

void SyncCoordinator::commit_with_retry(const std::vector<EmbeddedUnit> &batch) {
  for (int attempt = 0;; ++attempt) {
    try {
      vector_store_->upsert_batch(batch);
      return;
    } catch (const StoreWriteError &e) {
      if (attempt >= config_.commit_retries) {
        std::cerr << "[Sync] Sub-batch commit failed after " << attempt + 1
                  << " attempts, aborting sync: " << e.what() << std::endl;
        throw;
      }
      std::cerr << "[Sync] Sub-batch commit failed (attempt " << attempt + 1 << "/"
                << config_.commit_retries + 1 << "): " << e.what() << std::endl;
    }
  }
}

std::optional<int64_t> SyncCoordinator::advance_watermark(int64_t candidate) {
  std::optional<int64_t> current = vector_store_->last_sync_timestamp();
  if (current && *current >= candidate) {
    return current;
  }
  vector_store_->set_last_sync_timestamp(candidate);
  return candidate;
}

SyncResult SyncCoordinator::reconcile_deletions() {
  std::unique_lock<std::mutex> lock(sync_mutex_, std::try_to_lock);
  if (!lock.owns_lock()) {
    std::cout << "[Sync] A sync is already running, skipping reconciliation" << std::endl;
    SyncResult result;
    result.outcome = SyncOutcome::AlreadyRunning;
    return result;
  }

  const auto started = std::chrono::steady_clock::now();
  PhaseGuard guard(phase_);

  std::set<std::string> live;
  for (const auto &unit : graph_client_->fetch_all()) {
    live.insert(unit.id);
  }
  std::vector<std::string> gone;
  for (const auto &id : vector_store_->all_identifiers()) {
    if (live.find(id) == live.end()) {
      gone.push_back(id);
    }
  }

  SyncResult result;
  result.new_watermark = vector_store_->last_sync_timestamp();
  if (gone.empty()) {
    result.outcome = SyncOutcome::NoChanges;
  } else {
    phase_.store(SyncPhase::COMMITTING);
    result.units_processed = vector_store_->remove(gone);
    result.outcome = SyncOutcome::Completed;
  }
  result.elapsed_ms = elapsed_since(started);
  std::cout << "[Sync] Reconciliation removed " << result.units_processed << " units"
            << std::endl;
  return result;
}

bool SyncCoordinator::expired(const Deadline &deadline) {
  return deadline.has_value() && std::chrono::steady_clock::now() >= *deadline;
}

// Ascending (last_modified, id); a uid reported twice keeps its newest snapshot.
std::vector<UnitSnapshot> SyncCoordinator::order_for_commit(std::vector<UnitSnapshot> units) {
  std::unordered_map<std::string, size_t> newest;
  std::vector<UnitSnapshot> unique;
  unique.reserve(units.size());
  for (auto &unit : units) {
    auto it = newest.find(unit.id);
    if (it == newest.end()) {
      newest.emplace(unit.id, unique.size());
      unique.push_back(std::move(unit));
    } else if (unit.last_modified >= unique[it->second].last_modified) {
      unique[it->second] = std::move(unit);
    }
  }
  std::sort(unique.begin(), unique.end(), [](const UnitSnapshot &a, const UnitSnapshot &b) {
    if (a.last_modified != b.last_modified)
      return a.last_modified < b.last_modified;
    return a.id < b.id;
  });
  return unique;
}

}  // namespace recall_core
