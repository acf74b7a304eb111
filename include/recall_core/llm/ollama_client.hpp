#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace recall_core {

class OllamaError : public std::exception {
 public:
  explicit OllamaError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class OllamaClient {
 public:
  OllamaClient(const std::string &ollama_url, const std::string &embedding_model);
  virtual ~OllamaClient() = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  // Get embedding for text
  virtual std::vector<float> get_embedding(const std::string &text);

  virtual bool is_server_available();

  // Asks the server to load the model. False when the server does not have it.
  virtual bool load_model();

  const std::string &model_name() const {
    return embedding_model_;
  }

 private:
  std::string ollama_url_;
  std::string embedding_model_;
};

}  // namespace recall_core
