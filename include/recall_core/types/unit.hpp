#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace recall_core {

using Vector = std::vector<float>;

// A block as the source graph reports it. Timestamps are epoch milliseconds.
struct UnitSnapshot {
  std::string id;
  std::string content;
  std::string container_id;
  std::string container_title;
  std::string parent_id;
  std::vector<std::string> ancestor_texts;  // root first, immediate parent last
  int64_t last_modified = 0;
};

// A block as the index stores it.
struct UnitRecord : public UnitSnapshot {
  std::optional<int64_t> embedded_at;

  bool is_stale() const {
    return !embedded_at.has_value() || last_modified > *embedded_at;
  }
};

struct EmbeddedUnit {
  UnitSnapshot unit;
  Vector vector;
};

}  // namespace recall_core
