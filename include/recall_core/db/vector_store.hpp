#pragma once
#include <faiss/Index.h>
#include <faiss/IndexIDMap.h>
#include <sqlite_modern_cpp.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "recall_core/db/database_manager.hpp"
#include "recall_core/types/unit.hpp"

namespace recall_core {

enum class IndexKind { Flat, Hnsw };

inline std::string to_string(IndexKind kind) {
  switch (kind) {
    case IndexKind::Flat:
      return "flat";
    case IndexKind::Hnsw:
      return "hnsw";
    default:
      return "unknown";
  }
}

inline IndexKind index_kind_from_string(const std::string &str) {
  if (str == "flat")
    return IndexKind::Flat;
  if (str == "hnsw")
    return IndexKind::Hnsw;
  throw std::invalid_argument("Unknown IndexKind: " + str);
}

enum class SyncStatus { NOT_INITIALIZED, IN_PROGRESS, COMPLETED };

inline std::string to_string(SyncStatus status) {
  switch (status) {
    case SyncStatus::NOT_INITIALIZED:
      return "not_initialized";
    case SyncStatus::IN_PROGRESS:
      return "in_progress";
    case SyncStatus::COMPLETED:
      return "completed";
    default:
      return "unknown";
  }
}

inline SyncStatus sync_status_from_string(const std::string &str) {
  if (str == "not_initialized")
    return SyncStatus::NOT_INITIALIZED;
  if (str == "in_progress")
    return SyncStatus::IN_PROGRESS;
  if (str == "completed")
    return SyncStatus::COMPLETED;
  throw std::invalid_argument("Unknown SyncStatus: " + str);
}

namespace sync_keys {
inline constexpr const char *kLastSyncTimestamp = "last_sync_timestamp";
inline constexpr const char *kSyncStatus = "sync_status";
inline constexpr const char *kEmbeddingDimension = "embedding_dimension";
inline constexpr const char *kEmbeddingModel = "embedding_model";
}  // namespace sync_keys

class VectorStoreError : public std::exception {
 public:
  explicit VectorStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// A write that did not become visible. Nothing of the failed batch persists.
class StoreWriteError : public VectorStoreError {
 public:
  using VectorStoreError::VectorStoreError;
};

struct Neighbor {
  std::string id;
  float distance;
};

// Squared L2 distance to a similarity in (0, 1]. Every threshold in the
// ranking layer is expressed in these units.
inline float distance_to_similarity(float distance) {
  return 1.0f / (1.0f + distance);
}

struct VectorStoreOptions {
  int dimension = 1024;
  std::string embedding_model;  // recorded on first write, checked on open when set
  IndexKind index_kind = IndexKind::Flat;
  int hnsw_m = 32;
  int hnsw_ef_construction = 100;
  int hnsw_ef_search = 64;
  // Off only for a store that is about to be rebuilt under new settings.
  bool verify_identity = true;
};

class VectorStore {
 public:
  VectorStore(DatabaseManager &db_manager, VectorStoreOptions options);
  virtual ~VectorStore();

  VectorStore(const VectorStore &) = delete;
  VectorStore &operator=(const VectorStore &) = delete;

  // Non-movable to keep DB references stable
  VectorStore(VectorStore &&) = delete;
  VectorStore &operator=(VectorStore &&) = delete;

  // Metadata and vector land together or not at all.
  void upsert(const UnitSnapshot &unit, const Vector &vector);
  // One transaction for the whole batch.
  void upsert_batch(const std::vector<EmbeddedUnit> &units);

  std::optional<UnitRecord> get(const std::string &id);
  std::vector<UnitRecord> get_many(const std::vector<std::string> &ids);

  // Ascending squared L2 distance, ties broken by identifier.
  std::vector<Neighbor> knn(const Vector &query_vector, int k);

  std::set<std::string> all_identifiers();
  size_t count() const;

  // Returns how many identifiers were present.
  size_t remove(const std::vector<std::string> &ids);
  // Discards units, vectors and sync state.
  void drop_all();

  std::optional<std::string> get_sync_state(const std::string &key);
  void set_sync_state(const std::string &key, const std::string &value);

  std::optional<int64_t> last_sync_timestamp();
  void set_last_sync_timestamp(int64_t timestamp);
  SyncStatus sync_status();
  void set_sync_status(SyncStatus status);

  // Reloads the in-memory index from the database.
  void rebuild_index();

  int dimension() const {
    return options_.dimension;
  }
  IndexKind index_kind() const {
    return options_.index_kind;
  }

 protected:
  // The two halves of an upsert, run inside the caller's transaction.
  virtual int64_t write_unit_row(sqlite::database &db, const UnitSnapshot &unit,
                                 int64_t embedded_at);
  virtual void write_vector_row(sqlite::database &db, int64_t unit_id, const Vector &vector);

 private:
  DatabaseManager &db_manager_;
  VectorStoreOptions options_;

  // In-memory Faiss index, labels are units.id
  std::unique_ptr<faiss::IndexIDMap> faiss_index_;
  std::unordered_map<faiss::idx_t, std::string> label_to_uid_;
  bool index_dirty_ = false;
  mutable std::mutex index_mutex_;

  bool dimension_recorded_ = false;

  std::unique_ptr<faiss::IndexIDMap> create_base_index() const;
  void verify_index_identity();
  void record_index_identity(sqlite::database &db);
  void validate_vector(const std::string &id, const Vector &vector) const;
  void apply_to_index(const std::vector<std::pair<faiss::idx_t, std::string>> &labels,
                      const std::vector<const Vector *> &vectors);
  void rebuild_index_locked();
  std::vector<UnitRecord> query_units(const std::string &where_clause,
                                      const std::vector<std::string> &params);
};
}  // namespace recall_core
