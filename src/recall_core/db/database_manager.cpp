#include "recall_core/db/database_manager.hpp"

#include <stdexcept>

namespace recall_core {

DatabaseManager::DatabaseManager(const std::filesystem::path& db_path,
                                 const std::string& db_key,
                                 int pool_size)
    : db_path_(db_path), db_key_(db_key) {
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path());
  }

  // 1. Perform one-time schema setup before creating the pool
  setup_schema();

  // 2. Create the connection pool shared by the store and the sync path
  pool_ = std::make_unique<ConnectionPool>(db_path_.string(), db_key_, pool_size);

  is_initialized_ = true;
}

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  is_initialized_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_initialized_) {
    throw std::runtime_error("DatabaseManager has been shut down.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_initialized_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema() {
  // Use a temporary, single-use connection just for schema setup.
  auto db = open_keyed_database(db_path_.string(), db_key_);

  // id is the stable integer label the in-memory vector index uses.
  *db << R"(
      CREATE TABLE IF NOT EXISTS units (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          uid TEXT UNIQUE NOT NULL,
          content TEXT NOT NULL,
          container_uid TEXT,
          container_title TEXT,
          parent_uid TEXT,
          ancestor_texts TEXT,
          last_modified INTEGER NOT NULL,
          embedded_at INTEGER
      )
    )";

  *db << R"(
      CREATE TABLE IF NOT EXISTS unit_vectors (
          unit_id INTEGER PRIMARY KEY,
          vector_blob BLOB NOT NULL,
          FOREIGN KEY (unit_id) REFERENCES units(id) ON DELETE CASCADE
      )
    )";

  *db << R"(
      CREATE TABLE IF NOT EXISTS sync_state (
          key TEXT PRIMARY KEY,
          value TEXT NOT NULL
      )
    )";

  *db << R"(
      CREATE INDEX IF NOT EXISTS idx_units_last_modified
      ON units(last_modified)
    )";
}

}  // namespace recall_core
