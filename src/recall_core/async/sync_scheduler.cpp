#include "recall_core/async/sync_scheduler.hpp"

#include <iostream>
#include <stdexcept>

#include "recall_core/services/sync_coordinator.hpp"

namespace recall_core {
namespace async {

SyncScheduler::SyncScheduler(std::shared_ptr<SyncCoordinator> coordinator,
                             std::chrono::milliseconds interval)
    : coordinator_(std::move(coordinator)), interval_(interval) {
  if (!coordinator_) {
    throw std::invalid_argument("SyncScheduler requires a coordinator");
  }
  if (interval_.count() <= 0) {
    throw std::invalid_argument("Sync poll interval must be positive");
  }
}

SyncScheduler::~SyncScheduler() {
  stop();
  join();
}

void SyncScheduler::start() {
  if (thread_.joinable()) {
    throw std::runtime_error("SyncScheduler is already running.");
  }
  should_stop_.store(false);
  running_.store(true);
  thread_ = std::thread(&SyncScheduler::run_loop, this);
}

void SyncScheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    should_stop_.store(true);
  }
  wake_.notify_all();
}

void SyncScheduler::join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void SyncScheduler::run_loop() {
  std::cout << "[Scheduler] Polling for changes every " << interval_.count() << "ms"
            << std::endl;

  while (!should_stop_.load()) {
    try {
      SyncResult result = coordinator_->incremental_sync();
      if (result.outcome == SyncOutcome::Completed) {
        std::cout << "[Scheduler] Synced " << result.units_processed << " units" << std::endl;
      }
    } catch (const std::exception &e) {
      // The next cycle retries from the same watermark.
      std::cerr << "[Scheduler] Sync failed: " << e.what() << std::endl;
    }
    cycles_.fetch_add(1);

    std::unique_lock<std::mutex> lock(wait_mutex_);
    wake_.wait_for(lock, interval_, [this] { return should_stop_.load(); });
  }

  running_.store(false);
  std::cout << "[Scheduler] Polling loop terminated." << std::endl;
}

}  // namespace async
}  // namespace recall_core
