#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "recall_core/llm/ollama_client.hpp"
#include "recall_core/types/unit.hpp"

namespace recall_core {

class EmbeddingError : public std::exception {
 public:
  explicit EmbeddingError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// The model cannot be loaded. Fatal to the running sync or search; never retried per item.
class ModelUnavailableError : public EmbeddingError {
 public:
  using EmbeddingError::EmbeddingError;
};

struct EmbeddingConfig {
  int dimension = 1024;
  size_t batch_size = 64;
};

class EmbeddingService {
 public:
  EmbeddingService(std::shared_ptr<OllamaClient> ollama_client, EmbeddingConfig config);

  Vector embed(const std::string &text);

  // Same order and length as the input. Each item goes through the same
  // request as embed(), so batched and single results are identical.
  std::vector<Vector> embed_batch(const std::vector<std::string> &texts);

  Vector embed_unit(const UnitSnapshot &unit);

  // "Page: <title>\nPath: <a > b>\nContent: <content>", empty parts omitted.
  static std::string format_unit_text(const std::string &content,
                                      const std::string &container_title,
                                      const std::vector<std::string> &ancestor_texts);
  static std::string format_unit_text(const UnitSnapshot &unit);

  // Throws ModelUnavailableError when the server or the model is missing.
  void ensure_ready();

  int dimension() const {
    return config_.dimension;
  }
  size_t batch_size() const {
    return config_.batch_size;
  }
  const std::string &model_name() const {
    return ollama_client_->model_name();
  }

 private:
  Vector embed_one(const std::string &text);

  std::shared_ptr<OllamaClient> ollama_client_;
  EmbeddingConfig config_;
  std::mutex ready_mutex_;
  bool ready_ = false;
};

}  // namespace recall_core
