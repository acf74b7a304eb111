#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace recall_core {
class SyncCoordinator;
}

namespace recall_core {
namespace async {

/**
 * @class SyncScheduler
 * @brief Background thread that polls the source graph for changes.
 *
 * The source graph has no change notifications, so the scheduler calls
 * SyncCoordinator::incremental_sync() once per interval. A sync that is
 * already running (for example one started by a search) is simply skipped
 * by the coordinator.
 *
 * Non-copyable and non-movable, it owns its thread.
 */
class SyncScheduler {
 public:
  /**
   * @brief Constructs a scheduler. Nothing runs until start() is called.
   * @param coordinator The coordinator to drive.
   * @param interval Pause between the end of one sync and the start of the next.
   */
  SyncScheduler(std::shared_ptr<SyncCoordinator> coordinator,
                std::chrono::milliseconds interval);

  /**
   * @brief Stops the loop and joins the thread.
   */
  ~SyncScheduler();

  /**
   * @brief Starts polling in a new background thread.
   *
   * Throws std::runtime_error if the scheduler is already running.
   */
  void start();

  /**
   * @brief Signals the loop to exit after the current sync and wakes it if
   * it is waiting. Does not block.
   */
  void stop();

  // Blocks until the background thread has exited.
  void join();

  bool is_running() const {
    return running_.load();
  }

  // Number of sync attempts made so far, failed ones included.
  size_t cycles() const {
    return cycles_.load();
  }

  SyncScheduler(const SyncScheduler &) = delete;
  SyncScheduler &operator=(const SyncScheduler &) = delete;
  SyncScheduler(SyncScheduler &&) = delete;
  SyncScheduler &operator=(SyncScheduler &&) = delete;

 private:
  void run_loop();

  std::shared_ptr<SyncCoordinator> coordinator_;
  std::chrono::milliseconds interval_;

  std::atomic<bool> should_stop_{false};
  std::atomic<bool> running_{false};
  std::atomic<size_t> cycles_{0};
  std::mutex wait_mutex_;
  std::condition_variable wake_;
  std::thread thread_;
};

}  // namespace async
}  // namespace recall_core
