#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "recall_core/db/vector_store.hpp"
#include "recall_core/graph/graph_client.hpp"
#include "recall_core/services/embedding_service.hpp"
#include "recall_core/types/unit.hpp"

namespace recall_core {

enum class SyncPhase { IDLE, DIFFING, EMBEDDING, COMMITTING };

inline std::string to_string(SyncPhase phase) {
  switch (phase) {
    case SyncPhase::IDLE:
      return "idle";
    case SyncPhase::DIFFING:
      return "diffing";
    case SyncPhase::EMBEDDING:
      return "embedding";
    case SyncPhase::COMMITTING:
      return "committing";
    default:
      return "unknown";
  }
}

enum class SyncOutcome { Completed, NoChanges, AlreadyRunning, Cancelled };

inline std::string to_string(SyncOutcome outcome) {
  switch (outcome) {
    case SyncOutcome::Completed:
      return "completed";
    case SyncOutcome::NoChanges:
      return "no_changes";
    case SyncOutcome::AlreadyRunning:
      return "already_running";
    case SyncOutcome::Cancelled:
      return "cancelled";
    default:
      return "unknown";
  }
}

using Deadline = std::optional<std::chrono::steady_clock::time_point>;

struct SyncConfig {
  size_t commit_interval = 100;
  int commit_retries = 2;
  bool backfill_ancestors = true;
};

struct SyncResult {
  SyncOutcome outcome = SyncOutcome::NoChanges;
  size_t units_processed = 0;
  int64_t elapsed_ms = 0;
  std::optional<int64_t> new_watermark;
  bool cancelled = false;
};

/**
 * @class SyncCoordinator
 * @brief Keeps a VectorStore in step with the source graph.
 *
 * Fetched units are embedded and committed in sub-batches of
 * SyncConfig::commit_interval, in ascending (last_modified, id) order. The
 * watermark is advanced after every committed sub-batch and only ever covers
 * units that are durably stored, so an interrupted sync resumes without
 * replaying or skipping anything.
 *
 * At most one sync runs at a time. A request that arrives while another is in
 * flight returns SyncOutcome::AlreadyRunning without touching the store.
 */
class SyncCoordinator {
 public:
  SyncCoordinator(std::shared_ptr<GraphClient> graph_client,
                  std::shared_ptr<EmbeddingService> embedding_service,
                  std::shared_ptr<VectorStore> vector_store, SyncConfig config = {});

  SyncCoordinator(const SyncCoordinator &) = delete;
  SyncCoordinator &operator=(const SyncCoordinator &) = delete;

  /**
   * @brief Embeds every unit the source reports.
   *
   * The watermark ends at max(previous watermark, max observed last_modified).
   * @throws ModelUnavailableError, GraphSourceError, StoreWriteError
   */
  SyncResult full_sync(Deadline deadline = std::nullopt);

  /**
   * @brief Embeds units modified after the watermark. No-op when there are none.
   *
   * Falls back to a full fetch when the store has never been synced.
   * @throws ModelUnavailableError, GraphSourceError, StoreWriteError
   */
  SyncResult incremental_sync(Deadline deadline = std::nullopt);

  /**
   * @brief Discards the whole store and repopulates it from a fresh fetch.
   *
   * The old index is dropped only once the first sub-batch has been fetched
   * and embedded, so a source failure or a model that returns the wrong
   * dimension leaves it intact. This is the only operation that may lower the
   * watermark.
   */
  SyncResult rebuild(Deadline deadline = std::nullopt);

  SyncResult sync(bool full, Deadline deadline = std::nullopt);

  // Removes stored units the source no longer reports. units_processed is the
  // number removed.
  SyncResult reconcile_deletions();

  SyncPhase phase() const {
    return phase_.load();
  }
  bool is_running() const {
    return phase_.load() != SyncPhase::IDLE;
  }

 private:
  enum class Mode { Full, Incremental, Rebuild };

  SyncResult run(Mode mode, Deadline deadline);
  SyncResult process(std::vector<UnitSnapshot> units, Deadline deadline,
                     std::chrono::steady_clock::time_point started, bool replace_existing);
  // False when the deadline passed before every lookup was made.
  bool backfill_ancestors(std::vector<UnitSnapshot> &units, size_t begin, size_t end,
                          Deadline deadline);
  std::vector<Vector> embed_slice(const std::vector<UnitSnapshot> &units, size_t begin,
                                  size_t end, Deadline deadline, bool &cancelled);
  void commit_with_retry(const std::vector<EmbeddedUnit> &batch);
  std::optional<int64_t> advance_watermark(int64_t candidate);

  static bool expired(const Deadline &deadline);
  static std::vector<UnitSnapshot> order_for_commit(std::vector<UnitSnapshot> units);

  std::shared_ptr<GraphClient> graph_client_;
  std::shared_ptr<EmbeddingService> embedding_service_;
  std::shared_ptr<VectorStore> vector_store_;
  SyncConfig config_;

  std::mutex sync_mutex_;
  std::atomic<SyncPhase> phase_{SyncPhase::IDLE};
};

}  // namespace recall_core
