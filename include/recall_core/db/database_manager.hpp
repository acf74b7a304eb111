#pragma once

#include "recall_core/db/connection_pool.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace recall_core {

// Owns the on-disk index database: creates the schema once, then hands out
// pooled connections. One instance per index file.
class DatabaseManager {
public:
    DatabaseManager(const std::filesystem::path& db_path, const std::string& db_key, int pool_size);
    ~DatabaseManager();

    // These methods are used by the PooledConnection guard
    std::unique_ptr<sqlite::database> get_connection();
    void return_connection(std::unique_ptr<sqlite::database> conn);

    void shutdown();
    bool is_open() const { return is_initialized_; }
    const std::filesystem::path& path() const { return db_path_; }

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

private:
    void setup_schema();

    std::filesystem::path db_path_;
    std::string db_key_;
    std::unique_ptr<ConnectionPool> pool_;
    bool is_initialized_ = false;
};

} // namespace recall_core
