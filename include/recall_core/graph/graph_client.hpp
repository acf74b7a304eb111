#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "recall_core/types/unit.hpp"

namespace recall_core {

// Any failure talking to the source graph.
class GraphSourceError : public std::exception {
 public:
  explicit GraphSourceError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Transport failure that outlived the client's own retries.
class SourceUnreachableError : public GraphSourceError {
 public:
  using GraphSourceError::GraphSourceError;
};

// Pull-based view of the source graph. Implementations own their retry policy.
class GraphClient {
 public:
  virtual ~GraphClient() = default;

  virtual std::vector<UnitSnapshot> fetch_all() = 0;

  // Units whose last_modified is strictly greater than timestamp.
  virtual std::vector<UnitSnapshot> fetch_modified_since(int64_t timestamp) = 0;

  // Ancestor texts of one unit, root first.
  virtual std::vector<std::string> fetch_ancestor_chain(const std::string &id) = 0;
};

}  // namespace recall_core
