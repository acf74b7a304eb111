#pragma once
#include <sqlite_modern_cpp.h>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace recall_core {

// Opens one keyed SQLite handle and applies the connection pragmas.
std::unique_ptr<sqlite::database> open_keyed_database(const std::string& db_path,
                                                      const std::string& db_key);

class ConnectionPool {
public:
    ConnectionPool(const std::string& db_path, const std::string& db_key, int pool_size);

    // Blocks until a connection is free or the pool shuts down.
    std::unique_ptr<sqlite::database> get_connection();

    // Returns a connection to the pool.
    void return_connection(std::unique_ptr<sqlite::database> conn);
    void shutdown();

    size_t available() const;

private:
    bool shutting_down_ = false;
    std::string db_path_;
    std::string db_key_;
    std::queue<std::unique_ptr<sqlite::database>> pool_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace recall_core
