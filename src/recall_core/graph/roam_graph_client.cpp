#include "recall_core/graph/roam_graph_client.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <regex>

namespace recall_core {

RoamGraphClient::RoamGraphClient(RoamConfig config, Sleeper sleeper)
    : config_(std::move(config)), sleeper_(std::move(sleeper)) {
  if (config_.api_token.empty()) {
    throw RoamAuthenticationError("Roam API token not provided");
  }
  if (config_.graph_name.empty()) {
    throw RoamAuthenticationError("Roam graph name not provided");
  }
  resolved_base_url_ = config_.base_url;
  curl_handle_ = curl_easy_init();
  if (!curl_handle_) {
    throw GraphSourceError("Failed to initialize CURL");
  }
  std::cout << "[Roam] Initialized client for graph: " << config_.graph_name
            << " (token " << mask_token(config_.api_token) << ")" << std::endl;
}

RoamGraphClient::~RoamGraphClient() {
  if (curl_handle_) {
    curl_easy_cleanup(curl_handle_);
  }
}

std::vector<UnitSnapshot> RoamGraphClient::fetch_all() {
  auto blocks = parse_block_rows(run_query(blocks_query(std::nullopt)));
  std::cout << "[Roam] Fetched " << blocks.size() << " blocks for sync" << std::endl;
  return blocks;
}

std::vector<UnitSnapshot> RoamGraphClient::fetch_modified_since(int64_t timestamp) {
  auto blocks = parse_block_rows(run_query(blocks_query(timestamp)));
  std::cout << "[Roam] Fetched " << blocks.size() << " blocks modified since " << timestamp
            << std::endl;
  return blocks;
}

std::vector<std::string> RoamGraphClient::fetch_ancestor_chain(const std::string &id) {
  return parse_ancestor_rows(run_query(ancestors_query(sanitize_query_input(id))));
}

nlohmann::json RoamGraphClient::run_query(const std::string &query) {
  nlohmann::json body = {{"query", query}};
  return call("/api/graph/" + config_.graph_name + "/q", body);
}

std::string RoamGraphClient::blocks_query(std::optional<int64_t> modified_after) {
  std::string query =
      "[:find ?uid ?string ?edit-time ?page-uid ?page-title ?parent-uid\n"
      " :where\n"
      " [?b :block/uid ?uid]\n"
      " [?b :block/string ?string]\n"
      " [?b :edit/time ?edit-time]\n";
  if (modified_after) {
    query += " [(> ?edit-time " + std::to_string(*modified_after) + ")]\n";
  }
  query +=
      " [?b :block/page ?page]\n"
      " [?page :block/uid ?page-uid]\n"
      " [?page :node/title ?page-title]\n"
      " [?parent :block/children ?b]\n"
      " [?parent :block/uid ?parent-uid]]";
  return query;
}

// Depth is the number of ancestors each parent has itself, so sorting on it
// orders the chain from the page's top-level block down to the direct parent.
std::string RoamGraphClient::ancestors_query(const std::string &sanitized_uid) {
  return "[:find ?parent ?parent-string (count ?grand)\n"
         " :where\n"
         " [?b :block/uid \"" +
         sanitized_uid +
         "\"]\n"
         " [?b :block/parents ?parent]\n"
         " [?parent :block/string ?parent-string]\n"
         " [?parent :block/parents ?grand]]";
}

std::vector<UnitSnapshot> RoamGraphClient::parse_block_rows(const nlohmann::json &rows) {
  std::vector<UnitSnapshot> blocks;
  if (!rows.is_array()) {
    throw RoamApiError("Query result is not an array");
  }
  blocks.reserve(rows.size());
  for (const auto &row : rows) {
    if (!row.is_array() || row.size() < 5 || !row[0].is_string() || !row[1].is_string() ||
        !row[2].is_number()) {
      std::cerr << "[Roam] Skipping malformed block row: " << row.dump() << std::endl;
      continue;
    }
    UnitSnapshot unit;
    unit.id = row[0].get<std::string>();
    unit.content = row[1].get<std::string>();
    unit.last_modified = row[2].get<int64_t>();
    if (row[3].is_string())
      unit.container_id = row[3].get<std::string>();
    if (row[4].is_string())
      unit.container_title = row[4].get<std::string>();
    if (row.size() > 5 && row[5].is_string())
      unit.parent_id = row[5].get<std::string>();
    blocks.push_back(std::move(unit));
  }
  return blocks;
}

std::vector<std::string> RoamGraphClient::parse_ancestor_rows(const nlohmann::json &rows) {
  struct Ancestor {
    int64_t depth;
    int64_t eid;
    std::string text;
  };
  std::vector<Ancestor> ancestors;
  if (!rows.is_array()) {
    throw RoamApiError("Query result is not an array");
  }
  for (const auto &row : rows) {
    if (!row.is_array() || row.size() < 3 || !row[1].is_string() || !row[2].is_number()) {
      std::cerr << "[Roam] Skipping malformed ancestor row: " << row.dump() << std::endl;
      continue;
    }
    int64_t eid = row[0].is_number() ? row[0].get<int64_t>() : 0;
    ancestors.push_back({row[2].get<int64_t>(), eid, row[1].get<std::string>()});
  }
  std::sort(ancestors.begin(), ancestors.end(), [](const Ancestor &a, const Ancestor &b) {
    if (a.depth != b.depth)
      return a.depth < b.depth;
    return a.eid < b.eid;
  });
  std::vector<std::string> chain;
  chain.reserve(ancestors.size());
  for (auto &ancestor : ancestors) {
    chain.push_back(std::move(ancestor.text));
  }
  return chain;
}

// Uids are interpolated into EDN string literals, so reject anything that
// looks like a Datalog clause and escape the rest.
std::string RoamGraphClient::sanitize_query_input(const std::string &value) {
  if (value.find('\0') != std::string::npos) {
    throw RoamInvalidQueryError("Input contains null bytes");
  }
  static const std::regex suspicious(R"((\[:find|\[:where|\[\?[a-z]))", std::regex::icase);
  if (std::regex_search(value, suspicious)) {
    throw RoamInvalidQueryError("Input contains a Datalog clause: " + value);
  }
  std::string sanitized;
  sanitized.reserve(value.size());
  for (char c : value) {
    if (c == '"' || c == '\\') {
      sanitized += '\\';
    }
    sanitized += c;
  }
  return sanitized;
}

std::optional<std::string> RoamGraphClient::parse_redirect_location(const std::string &location) {
  static const std::regex peer_pattern(R"(https://(peer-\d+).*?:(\d+))");
  std::smatch match;
  if (!std::regex_search(location, match, peer_pattern)) {
    return std::nullopt;
  }
  return "https://" + match[1].str() + ".api.roamresearch.com:" + match[2].str();
}

std::string RoamGraphClient::mask_token(const std::string &token) {
  if (token.size() > 8) {
    return token.substr(0, 4) + "..." + token.substr(token.size() - 4);
  }
  return "***";
}

nlohmann::json RoamGraphClient::call(const std::string &path, const nlohmann::json &body) {
  return retry_with_backoff<RoamRateLimitError>(
      config_.rate_limit_backoff, "Roam",
      [&]() { return call_once(path, body, /*redirects_left*/ 2); }, sleeper_);
}

nlohmann::json RoamGraphClient::call_once(const std::string &path, const nlohmann::json &body,
                                          int redirects_left) {
  const std::string url = resolved_base_url_ + path;
  const std::string payload = body.dump();

  HttpResponse resp = retry_with_backoff<SourceUnreachableError>(
      config_.connection_backoff, "Roam", [&]() { return post(url, payload); }, sleeper_);

  if (resp.status == 301 || resp.status == 302 || resp.status == 307 || resp.status == 308) {
    if (resp.location.empty()) {
      throw RoamInvalidQueryError("Redirect without Location header");
    }
    auto peer_url = parse_redirect_location(resp.location);
    if (!peer_url) {
      throw RoamInvalidQueryError("Could not parse redirect URL: " + resp.location);
    }
    if (redirects_left <= 0) {
      throw RoamApiError("Too many redirects, last: " + resp.location);
    }
    std::cout << "[Roam] Cached redirect URL: " << *peer_url << std::endl;
    resolved_base_url_ = *peer_url;
    return call_once(path, body, redirects_left - 1);
  }

  if (resp.status < 200 || resp.status >= 300) {
    std::cerr << "[Roam] Error response status: " << resp.status << std::endl;
    switch (resp.status) {
      case 400:
        throw RoamInvalidQueryError("Bad request (HTTP 400): " + resp.body);
      case 401:
        throw RoamAuthenticationError("Authentication error (HTTP 401): Invalid token");
      case 429:
        throw RoamRateLimitError("Rate limit exceeded (HTTP 429): " + resp.body);
      case 500:
        throw RoamApiError("Server error (HTTP 500): " + resp.body);
      default:
        throw RoamApiError("Service unavailable (HTTP " + std::to_string(resp.status) +
                           "): the graph may not be ready yet, please retry.");
    }
  }

  try {
    auto parsed = nlohmann::json::parse(resp.body);
    return parsed.value("result", nlohmann::json::array());
  } catch (const nlohmann::json::exception &e) {
    throw RoamApiError(std::string("Malformed response body: ") + e.what());
  }
}

RoamGraphClient::HttpResponse RoamGraphClient::post(const std::string &url,
                                                    const std::string &body) {
  std::lock_guard<std::mutex> lock(curl_mutex_);
  curl_easy_reset(curl_handle_);

  HttpResponse response;
  const std::string bearer = "Bearer " + config_.api_token;
  struct curl_slist *headers = nullptr;
  headers = curl_slist_append(headers, "Content-Type: application/json; charset=utf-8");
  headers = curl_slist_append(headers, ("Authorization: " + bearer).c_str());
  headers = curl_slist_append(headers, ("x-authorization: " + bearer).c_str());

  curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_POST, 1L);
  curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl_handle_, CURLOPT_FOLLOWLOCATION, 0L);
  curl_easy_setopt(curl_handle_, CURLOPT_TIMEOUT, config_.timeout_seconds);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl_handle_, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl_handle_, CURLOPT_HEADERDATA, &response.location);

  CURLcode res = curl_easy_perform(curl_handle_);
  curl_slist_free_all(headers);

  if (res != CURLE_OK) {
    throw SourceUnreachableError(std::string("Request to ") + url +
                                 " failed: " + curl_easy_strerror(res));
  }
  curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &response.status);
  return response;
}

size_t RoamGraphClient::write_callback(void *contents, size_t size, size_t nmemb,
                                       std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

size_t RoamGraphClient::header_callback(char *buffer, size_t size, size_t nitems,
                                        std::string *location) {
  const size_t length = size * nitems;
  std::string line(buffer, length);
  const std::string prefix = "location:";
  if (line.size() > prefix.size()) {
    std::string head = line.substr(0, prefix.size());
    std::transform(head.begin(), head.end(), head.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (head == prefix) {
      std::string value = line.substr(prefix.size());
      auto first = value.find_first_not_of(" \t");
      auto last = value.find_last_not_of(" \t\r\n");
      *location = (first == std::string::npos) ? "" : value.substr(first, last - first + 1);
    }
  }
  return length;
}

}  // namespace recall_core
