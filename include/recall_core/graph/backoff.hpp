#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <iostream>
#include <string>
#include <thread>

namespace recall_core {

struct BackoffPolicy {
  int max_retries = 3;
  std::chrono::milliseconds initial_backoff{1000};
  double multiplier = 2.0;
  std::chrono::milliseconds max_backoff{16000};
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline void sleep_for_backoff(std::chrono::milliseconds duration) {
  std::this_thread::sleep_for(duration);
}

/**
 * @brief Runs fn, retrying exceptions of type Retryable with exponential backoff.
 *
 * fn runs at most policy.max_retries + 1 times. The last Retryable is rethrown
 * once the attempts are used up; any other exception propagates immediately.
 */
template <typename Retryable, typename Fn>
auto retry_with_backoff(const BackoffPolicy &policy, const std::string &label, Fn &&fn,
                        const Sleeper &sleeper = sleep_for_backoff) -> decltype(fn()) {
  auto backoff = policy.initial_backoff;
  for (int attempt = 0;; ++attempt) {
    try {
      return fn();
    } catch (const Retryable &e) {
      if (attempt >= policy.max_retries) {
        std::cerr << "[" << label << "] All " << policy.max_retries + 1
                  << " attempts failed. Last error: " << e.what() << std::endl;
        throw;
      }
      std::cerr << "[" << label << "] Attempt " << attempt + 1 << "/" << policy.max_retries + 1
                << " failed: " << e.what() << ". Retrying in " << backoff.count() << "ms..."
                << std::endl;
      sleeper(backoff);
      auto next = std::chrono::milliseconds(
          static_cast<std::chrono::milliseconds::rep>(backoff.count() * policy.multiplier));
      backoff = std::min(next, policy.max_backoff);
    }
  }
}

}  // namespace recall_core
