#define SQLITE_HAS_CODEC 1
#define SQLCIPHER_CRYPTO_OPENSSL 1
#include <sqlcipher/sqlite3.h>
#include "recall_core/db/connection_pool.hpp"
#include <stdexcept>

#include "recall_core/db/sqlite_error_utils.hpp"

namespace recall_core {

std::unique_ptr<sqlite::database> open_keyed_database(const std::string& db_path,
                                                      const std::string& db_key) {
  auto db = std::make_unique<sqlite::database>(db_path);
  sqlite3* handle = db->connection().get();
  if (!handle) {
    throw std::runtime_error("Failed to get native database handle for " + db_path);
  }

  // An empty key leaves the database unencrypted.
  if (!db_key.empty()) {
    if (sqlite3_key(handle, db_key.c_str(), static_cast<int>(db_key.length())) != SQLITE_OK) {
      throw std::runtime_error("Failed to key database: " + std::string(sqlite3_errmsg(handle)));
    }
  }

  // The first read is where SQLCipher notices a wrong key
  try {
    *db << "SELECT count(*) FROM sqlite_master;";
  } catch (const sqlite::sqlite_exception& e) {
    throw std::runtime_error(format_db_error("open " + db_path, e));
  }

  *db << "PRAGMA foreign_keys = ON;";
  *db << "PRAGMA journal_mode = WAL;";
  *db << "PRAGMA synchronous = NORMAL;";
  *db << "PRAGMA busy_timeout = 5000;";
  return db;
}

ConnectionPool::ConnectionPool(const std::string& db_path, const std::string& db_key, int pool_size)
    : db_path_(db_path), db_key_(db_key) {
  if (pool_size <= 0) {
    throw std::invalid_argument("ConnectionPool needs at least one connection.");
  }
  for (int i = 0; i < pool_size; ++i) {
    pool_.push(open_keyed_database(db_path_, db_key_));
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mtx_);
  // Wait until a connection is available or shutdown is requested
  cv_.wait(lock, [this] { return shutting_down_ || !pool_.empty(); });

  if (shutting_down_) {
    throw std::runtime_error("Connection pool is shut down");
  }

  std::unique_ptr<sqlite::database> conn = std::move(pool_.front());
  pool_.pop();
  return conn;
}

void ConnectionPool::return_connection(std::unique_ptr<sqlite::database> conn) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!shutting_down_) {
    pool_.push(std::move(conn));
  }
  // Notify one waiting thread that a connection is available
  cv_.notify_one();
}

void ConnectionPool::shutdown() {
  std::lock_guard<std::mutex> lock(mtx_);
  shutting_down_ = true;
  while (!pool_.empty()) {
    pool_.pop();
  }
  cv_.notify_all();
}

size_t ConnectionPool::available() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return pool_.size();
}

}  // namespace recall_core
