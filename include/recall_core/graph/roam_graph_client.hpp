#pragma once

#include <curl/curl.h>

#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "recall_core/graph/backoff.hpp"
#include "recall_core/graph/graph_client.hpp"

namespace recall_core {

class RoamApiError : public GraphSourceError {
 public:
  using GraphSourceError::GraphSourceError;
};

class RoamAuthenticationError : public RoamApiError {
 public:
  using RoamApiError::RoamApiError;
};

class RoamInvalidQueryError : public RoamApiError {
 public:
  using RoamApiError::RoamApiError;
};

class RoamRateLimitError : public RoamApiError {
 public:
  using RoamApiError::RoamApiError;
};

struct RoamConfig {
  std::string graph_name;
  std::string api_token;
  std::string base_url = "https://api.roamresearch.com";
  long timeout_seconds = 30;
  BackoffPolicy connection_backoff{};
  // Roam allows 50 requests a minute, so rate limits back off longer
  BackoffPolicy rate_limit_backoff{3, std::chrono::milliseconds(10000), 2.0,
                                   std::chrono::milliseconds(64000)};
};

// GraphClient over the Roam backend query API.
class RoamGraphClient : public GraphClient {
 public:
  explicit RoamGraphClient(RoamConfig config, Sleeper sleeper = sleep_for_backoff);
  ~RoamGraphClient() override;

  RoamGraphClient(const RoamGraphClient &) = delete;
  RoamGraphClient &operator=(const RoamGraphClient &) = delete;

  std::vector<UnitSnapshot> fetch_all() override;
  std::vector<UnitSnapshot> fetch_modified_since(int64_t timestamp) override;
  std::vector<std::string> fetch_ancestor_chain(const std::string &id) override;

  // Runs a Datalog query and returns its "result" array.
  nlohmann::json run_query(const std::string &query);

  // Rows of [uid, string, edit-time, page-uid, page-title, parent-uid].
  static std::vector<UnitSnapshot> parse_block_rows(const nlohmann::json &rows);
  // Rows of [parent-eid, parent-string, depth]; returned root first.
  static std::vector<std::string> parse_ancestor_rows(const nlohmann::json &rows);

  static std::string sanitize_query_input(const std::string &value);
  static std::optional<std::string> parse_redirect_location(const std::string &location);
  static std::string mask_token(const std::string &token);

  static std::string blocks_query(std::optional<int64_t> modified_after);
  static std::string ancestors_query(const std::string &sanitized_uid);

 protected:
  struct HttpResponse {
    long status = 0;
    std::string body;
    std::string location;
  };

  // One POST without redirects. Throws SourceUnreachableError on transport failure.
  virtual HttpResponse post(const std::string &url, const std::string &body);

 private:
  nlohmann::json call(const std::string &path, const nlohmann::json &body);
  nlohmann::json call_once(const std::string &path, const nlohmann::json &body,
                           int redirects_left);

  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
  static size_t header_callback(char *buffer, size_t size, size_t nitems, std::string *location);

  RoamConfig config_;
  Sleeper sleeper_;
  std::string resolved_base_url_;
  CURL *curl_handle_ = nullptr;
  std::mutex curl_mutex_;
};

}  // namespace recall_core
