#include "recall_core/db/vector_store.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/IndexHNSW.h>
#include <faiss/impl/FaissException.h>
#include <faiss/impl/IDSelector.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <iostream>
#include <nlohmann/json.hpp>

#include "recall_core/db/pooled_connection.hpp"
#include "recall_core/db/sqlite_error_utils.hpp"
#include "recall_core/db/transaction.hpp"

namespace recall_core {

namespace {

constexpr size_t kMaxBoundParams = 500;

int64_t now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::vector<char> vector_to_blob(const Vector &vector) {
  std::vector<char> blob(vector.size() * sizeof(float));
  std::memcpy(blob.data(), vector.data(), blob.size());
  return blob;
}

std::string ancestors_to_json(const std::vector<std::string> &ancestors) {
  return nlohmann::json(ancestors).dump();
}

std::vector<std::string> ancestors_from_json(const std::optional<std::string> &text) {
  if (!text || text->empty()) {
    return {};
  }
  try {
    return nlohmann::json::parse(*text).get<std::vector<std::string>>();
  } catch (const nlohmann::json::exception &e) {
    std::cerr << "[VectorStore] Ignoring malformed ancestor_texts: " << e.what() << std::endl;
    return {};
  }
}

std::string placeholders(size_t count) {
  std::string out;
  for (size_t i = 0; i < count; ++i) {
    out += (i == 0) ? "?" : ",?";
  }
  return out;
}

}  // namespace

VectorStore::VectorStore(DatabaseManager &db_manager, VectorStoreOptions options)
    : db_manager_(db_manager), options_(std::move(options)) {
  if (options_.dimension <= 0) {
    throw VectorStoreError("Vector dimension must be positive, got " +
                           std::to_string(options_.dimension));
  }
  if (options_.verify_identity) {
    verify_index_identity();
  }
  rebuild_index();
}

VectorStore::~VectorStore() = default;

/*
The dimension (and model, when configured) of an existing index is fixed.
Opening it with different settings would mix vector spaces, so we refuse
until the caller rebuilds.
*/
void VectorStore::verify_index_identity() {
  auto stored_dimension = get_sync_state(sync_keys::kEmbeddingDimension);
  if (stored_dimension) {
    if (std::stoi(*stored_dimension) != options_.dimension) {
      throw VectorStoreError("Index was built with dimension " + *stored_dimension +
                             " but " + std::to_string(options_.dimension) +
                             " was requested. A full rebuild is required.");
    }
    dimension_recorded_ = true;
  }
  auto stored_model = get_sync_state(sync_keys::kEmbeddingModel);
  if (stored_model && !options_.embedding_model.empty() &&
      *stored_model != options_.embedding_model) {
    throw VectorStoreError("Index was built with model '" + *stored_model + "' but '" +
                           options_.embedding_model +
                           "' was requested. A full rebuild is required.");
  }
}

void VectorStore::record_index_identity(sqlite::database &db) {
  if (dimension_recorded_) {
    return;
  }
  db << "INSERT OR REPLACE INTO sync_state (key, value) VALUES (?, ?)"
     << sync_keys::kEmbeddingDimension << std::to_string(options_.dimension);
  if (!options_.embedding_model.empty()) {
    db << "INSERT OR REPLACE INTO sync_state (key, value) VALUES (?, ?)"
       << sync_keys::kEmbeddingModel << options_.embedding_model;
  }
}

void VectorStore::validate_vector(const std::string &id, const Vector &vector) const {
  if (vector.size() != static_cast<size_t>(options_.dimension)) {
    throw VectorStoreError("Vector embedding size mismatch for unit " + id + ". Expected " +
                           std::to_string(options_.dimension) + " dimensions, got " +
                           std::to_string(vector.size()) + ".");
  }
}

int64_t VectorStore::write_unit_row(sqlite::database &db, const UnitSnapshot &unit,
                                    int64_t embedded_at) {
  int64_t existing_id = -1;
  db << "SELECT id FROM units WHERE uid = ?" << unit.id >> [&](int64_t id) { existing_id = id; };

  if (existing_id != -1) {
    db << "UPDATE units SET content=?, container_uid=?, container_title=?, parent_uid=?, "
          "ancestor_texts=?, last_modified=?, embedded_at=? WHERE id=?"
       << unit.content << unit.container_id << unit.container_title << unit.parent_id
       << ancestors_to_json(unit.ancestor_texts) << unit.last_modified << embedded_at
       << existing_id;
    return existing_id;
  }

  db << "INSERT INTO units (uid, content, container_uid, container_title, parent_uid, "
        "ancestor_texts, last_modified, embedded_at) VALUES (?,?,?,?,?,?,?,?)"
     << unit.id << unit.content << unit.container_id << unit.container_title << unit.parent_id
     << ancestors_to_json(unit.ancestor_texts) << unit.last_modified << embedded_at;
  return db.last_insert_rowid();
}

void VectorStore::write_vector_row(sqlite::database &db, int64_t unit_id, const Vector &vector) {
  db << "INSERT OR REPLACE INTO unit_vectors (unit_id, vector_blob) VALUES (?, ?)" << unit_id
     << vector_to_blob(vector);
}

void VectorStore::upsert(const UnitSnapshot &unit, const Vector &vector) {
  upsert_batch({EmbeddedUnit{unit, vector}});
}

void VectorStore::upsert_batch(const std::vector<EmbeddedUnit> &units) {
  if (units.empty())
    return;

  for (const auto &item : units) {
    if (item.unit.id.empty()) {
      throw VectorStoreError("Cannot upsert a unit without an identifier");
    }
    validate_vector(item.unit.id, item.vector);
  }

  std::vector<std::pair<faiss::idx_t, std::string>> labels;
  std::vector<const Vector *> vectors;
  labels.reserve(units.size());
  vectors.reserve(units.size());

  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, /*immediate*/ true);
    const int64_t now = now_ms();
    for (const auto &item : units) {
      // embedded_at never precedes the modification it covers, even with clock skew
      const int64_t embedded_at = std::max(now, item.unit.last_modified);
      int64_t unit_id = write_unit_row(*conn, item.unit, embedded_at);
      write_vector_row(*conn, unit_id, item.vector);
      labels.emplace_back(static_cast<faiss::idx_t>(unit_id), item.unit.id);
      vectors.push_back(&item.vector);
    }
    record_index_identity(*conn);
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw StoreWriteError(format_db_error("upsert_batch", e));
  } catch (const std::runtime_error &e) {
    // Pool exhaustion or shutdown while acquiring the connection
    throw StoreWriteError(std::string("upsert_batch failed: ") + e.what());
  }

  dimension_recorded_ = true;
  apply_to_index(labels, vectors);
}

void VectorStore::apply_to_index(const std::vector<std::pair<faiss::idx_t, std::string>> &labels,
                                 const std::vector<const Vector *> &vectors) {
  std::lock_guard<std::mutex> lock(index_mutex_);

  // The same identifier can appear twice in one batch; the last write wins.
  std::unordered_map<faiss::idx_t, size_t> latest;
  for (size_t i = 0; i < labels.size(); ++i) {
    latest[labels[i].first] = i;
  }

  std::vector<faiss::idx_t> replaced;
  std::vector<faiss::idx_t> add_ids;
  std::vector<float> add_flat;
  add_ids.reserve(latest.size());
  add_flat.reserve(latest.size() * options_.dimension);
  for (size_t i = 0; i < labels.size(); ++i) {
    const auto label = labels[i].first;
    if (latest[label] != i)
      continue;
    if (label_to_uid_.count(label)) {
      replaced.push_back(label);
    }
    label_to_uid_[label] = labels[i].second;
    add_ids.push_back(label);
    add_flat.insert(add_flat.end(), vectors[i]->begin(), vectors[i]->end());
  }

  if (index_dirty_)
    return;  // the next query reloads everything from the database

  if (!replaced.empty()) {
    if (options_.index_kind == IndexKind::Hnsw) {
      // HNSW graphs do not support removal
      index_dirty_ = true;
      return;
    }
    faiss::IDSelectorBatch selector(replaced.size(), replaced.data());
    faiss_index_->remove_ids(selector);
  }
  faiss_index_->add_with_ids(static_cast<faiss::idx_t>(add_ids.size()), add_flat.data(),
                             add_ids.data());
}

std::optional<UnitRecord> VectorStore::get(const std::string &id) {
  auto rows = query_units("uid = ?", {id});
  if (rows.empty()) {
    return std::nullopt;
  }
  return std::move(rows.front());
}

std::vector<UnitRecord> VectorStore::get_many(const std::vector<std::string> &ids) {
  std::vector<UnitRecord> records;
  for (size_t start = 0; start < ids.size(); start += kMaxBoundParams) {
    const size_t end = std::min(ids.size(), start + kMaxBoundParams);
    std::vector<std::string> slice(ids.begin() + start, ids.begin() + end);
    auto rows = query_units("uid IN (" + placeholders(slice.size()) + ")", slice);
    for (auto &row : rows) {
      records.push_back(std::move(row));
    }
  }
  return records;
}

std::vector<UnitRecord> VectorStore::query_units(const std::string &where_clause,
                                                 const std::vector<std::string> &params) {
  std::vector<UnitRecord> records;
  try {
    PooledConnection conn(db_manager_);
    // Only units that also have a vector are visible
    auto ps = *conn << "SELECT u.uid, u.content, u.container_uid, u.container_title, "
                       "u.parent_uid, u.ancestor_texts, u.last_modified, u.embedded_at "
                       "FROM units u JOIN unit_vectors v ON v.unit_id = u.id WHERE u." +
                           where_clause;
    for (const auto &param : params) {
      ps << param;
    }
    ps >> [&](std::string uid, std::string content, std::optional<std::string> container_uid,
              std::optional<std::string> container_title, std::optional<std::string> parent_uid,
              std::optional<std::string> ancestor_texts, int64_t last_modified,
              std::optional<int64_t> embedded_at) {
      UnitRecord record;
      record.id = std::move(uid);
      record.content = std::move(content);
      if (container_uid)
        record.container_id = *container_uid;
      if (container_title)
        record.container_title = *container_title;
      if (parent_uid)
        record.parent_id = *parent_uid;
      record.ancestor_texts = ancestors_from_json(ancestor_texts);
      record.last_modified = last_modified;
      record.embedded_at = embedded_at;
      records.push_back(std::move(record));
    };
  } catch (const sqlite::sqlite_exception &e) {
    throw VectorStoreError(format_db_error("query_units", e));
  }
  return records;
}

std::vector<Neighbor> VectorStore::knn(const Vector &query_vector, int k) {
  if (query_vector.size() != static_cast<size_t>(options_.dimension)) {
    throw VectorStoreError("Query vector dimension mismatch. Expected " +
                           std::to_string(options_.dimension) + ", got " +
                           std::to_string(query_vector.size()));
  }

  std::lock_guard<std::mutex> lock(index_mutex_);
  if (index_dirty_) {
    rebuild_index_locked();
  }

  const faiss::idx_t total = faiss_index_->ntotal;
  if (k <= 0 || total == 0) {
    return {};
  }

  const faiss::idx_t want = std::min<faiss::idx_t>(k, total);
  faiss::idx_t fetch = want;
  std::vector<float> distances;
  std::vector<faiss::idx_t> labels;
  while (true) {
    distances.assign(fetch, 0.0f);
    labels.assign(fetch, -1);
    try {
      faiss_index_->search(1, query_vector.data(), fetch, distances.data(), labels.data());
    } catch (const faiss::FaissException &e) {
      throw VectorStoreError(std::string("Faiss search failed: ") + e.what());
    }
    // Widen until the tie group straddling position k is fully visible
    if (fetch < total && labels[fetch - 1] != -1 && distances[fetch - 1] == distances[want - 1]) {
      fetch = std::min<faiss::idx_t>(total, fetch * 2);
      continue;
    }
    break;
  }

  std::vector<Neighbor> neighbors;
  neighbors.reserve(fetch);
  for (faiss::idx_t i = 0; i < fetch; ++i) {
    if (labels[i] == -1)
      continue;
    auto it = label_to_uid_.find(labels[i]);
    if (it == label_to_uid_.end()) {
      std::cerr << "[VectorStore] Warning: Faiss returned label " << labels[i]
                << " with no known unit." << std::endl;
      continue;
    }
    neighbors.push_back({it->second, distances[i]});
  }

  std::sort(neighbors.begin(), neighbors.end(), [](const Neighbor &a, const Neighbor &b) {
    if (a.distance != b.distance)
      return a.distance < b.distance;
    return a.id < b.id;
  });
  if (neighbors.size() > static_cast<size_t>(want)) {
    neighbors.resize(want);
  }
  return neighbors;
}

std::set<std::string> VectorStore::all_identifiers() {
  std::set<std::string> ids;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT u.uid FROM units u JOIN unit_vectors v ON v.unit_id = u.id" >>
        [&](std::string uid) { ids.insert(std::move(uid)); };
  } catch (const sqlite::sqlite_exception &e) {
    throw VectorStoreError(format_db_error("all_identifiers", e));
  }
  return ids;
}

size_t VectorStore::count() const {
  std::lock_guard<std::mutex> lock(index_mutex_);
  return label_to_uid_.size();
}

size_t VectorStore::remove(const std::vector<std::string> &ids) {
  if (ids.empty())
    return 0;

  std::vector<faiss::idx_t> removed_labels;
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, true);
    for (size_t start = 0; start < ids.size(); start += kMaxBoundParams) {
      const size_t end = std::min(ids.size(), start + kMaxBoundParams);
      const std::string in_list = "(" + placeholders(end - start) + ")";

      auto select = *conn << "SELECT id FROM units WHERE uid IN " + in_list;
      for (size_t i = start; i < end; ++i) {
        select << ids[i];
      }
      select >> [&](int64_t id) { removed_labels.push_back(static_cast<faiss::idx_t>(id)); };

      auto del = *conn << "DELETE FROM units WHERE uid IN " + in_list;
      for (size_t i = start; i < end; ++i) {
        del << ids[i];
      }
      del.execute();
    }
    // Foreign keys cascade, but keep the vector table consistent without them too
    *conn << "DELETE FROM unit_vectors WHERE unit_id NOT IN (SELECT id FROM units)";
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw StoreWriteError(format_db_error("remove", e));
  }

  std::lock_guard<std::mutex> lock(index_mutex_);
  for (auto label : removed_labels) {
    label_to_uid_.erase(label);
  }
  if (!removed_labels.empty()) {
    if (options_.index_kind == IndexKind::Hnsw) {
      index_dirty_ = true;
    } else if (!index_dirty_) {
      faiss::IDSelectorBatch selector(removed_labels.size(), removed_labels.data());
      faiss_index_->remove_ids(selector);
    }
  }
  return removed_labels.size();
}

void VectorStore::drop_all() {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, true);
    *conn << "DELETE FROM unit_vectors";
    *conn << "DELETE FROM units";
    *conn << "DELETE FROM sync_state";
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw StoreWriteError(format_db_error("drop_all", e));
  }

  std::lock_guard<std::mutex> lock(index_mutex_);
  dimension_recorded_ = false;
  label_to_uid_.clear();
  faiss_index_ = create_base_index();
  index_dirty_ = false;
  std::cout << "[VectorStore] All index data dropped." << std::endl;
}

std::optional<std::string> VectorStore::get_sync_state(const std::string &key) {
  try {
    std::optional<std::string> result;
    PooledConnection conn(db_manager_);
    *conn << "SELECT value FROM sync_state WHERE key = ?" << key >>
        [&](std::string value) { result = std::move(value); };
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw VectorStoreError(format_db_error("get_sync_state", e));
  }
}

void VectorStore::set_sync_state(const std::string &key, const std::string &value) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "INSERT OR REPLACE INTO sync_state (key, value) VALUES (?, ?)" << key << value;
  } catch (const sqlite::sqlite_exception &e) {
    throw StoreWriteError(format_db_error("set_sync_state", e));
  }
}

std::optional<int64_t> VectorStore::last_sync_timestamp() {
  auto value = get_sync_state(sync_keys::kLastSyncTimestamp);
  if (!value) {
    return std::nullopt;
  }
  try {
    return std::stoll(*value);
  } catch (const std::exception &) {
    throw VectorStoreError("Corrupt last_sync_timestamp: " + *value);
  }
}

void VectorStore::set_last_sync_timestamp(int64_t timestamp) {
  set_sync_state(sync_keys::kLastSyncTimestamp, std::to_string(timestamp));
}

SyncStatus VectorStore::sync_status() {
  auto value = get_sync_state(sync_keys::kSyncStatus);
  if (!value) {
    return SyncStatus::NOT_INITIALIZED;
  }
  return sync_status_from_string(*value);
}

void VectorStore::set_sync_status(SyncStatus status) {
  set_sync_state(sync_keys::kSyncStatus, to_string(status));
}

void VectorStore::rebuild_index() {
  std::lock_guard<std::mutex> lock(index_mutex_);
  rebuild_index_locked();
}

void VectorStore::rebuild_index_locked() {
  auto index = create_base_index();
  std::unordered_map<faiss::idx_t, std::string> label_to_uid;
  std::vector<faiss::idx_t> faiss_ids;
  std::vector<float> all_vectors_flat;
  const size_t expected_bytes = static_cast<size_t>(options_.dimension) * sizeof(float);

  try {
    // Scope the connection strictly to the DB fetch
    PooledConnection conn(db_manager_);
    *conn << "SELECT u.id, u.uid, v.vector_blob FROM units u "
             "JOIN unit_vectors v ON v.unit_id = u.id" >>
        [&](int64_t id, std::string uid, std::vector<char> vector_blob) {
          if (vector_blob.size() != expected_bytes) {
            std::cerr << "[VectorStore] Warning: Skipping unit " << uid
                      << " during index rebuild due to mismatched vector dimension. Expected "
                      << expected_bytes << " bytes, got " << vector_blob.size() << " bytes."
                      << std::endl;
            return;
          }
          faiss_ids.push_back(static_cast<faiss::idx_t>(id));
          label_to_uid.emplace(static_cast<faiss::idx_t>(id), std::move(uid));
          const float *vec_ptr = reinterpret_cast<const float *>(vector_blob.data());
          all_vectors_flat.insert(all_vectors_flat.end(), vec_ptr, vec_ptr + options_.dimension);
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw VectorStoreError(format_db_error("rebuild_index", e));
  }

  if (!faiss_ids.empty()) {
    index->add_with_ids(static_cast<faiss::idx_t>(faiss_ids.size()), all_vectors_flat.data(),
                        faiss_ids.data());
  }

  faiss_index_ = std::move(index);
  label_to_uid_ = std::move(label_to_uid);
  index_dirty_ = false;
}

std::unique_ptr<faiss::IndexIDMap> VectorStore::create_base_index() const {
  faiss::Index *base_index = nullptr;
  if (options_.index_kind == IndexKind::Hnsw) {
    auto hnsw = new faiss::IndexHNSWFlat(options_.dimension, options_.hnsw_m);
    hnsw->hnsw.efConstruction = options_.hnsw_ef_construction;
    hnsw->hnsw.efSearch = options_.hnsw_ef_search;
    base_index = hnsw;
  } else {
    base_index = new faiss::IndexFlatL2(options_.dimension);
  }
  // Wrap with IDMap to enable add_with_ids; the wrapper owns the base index
  auto index = std::make_unique<faiss::IndexIDMap>(base_index);
  index->own_fields = true;
  return index;
}

}  // namespace recall_core
