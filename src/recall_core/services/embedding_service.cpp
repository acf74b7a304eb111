#include "recall_core/services/embedding_service.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace recall_core {

EmbeddingService::EmbeddingService(std::shared_ptr<OllamaClient> ollama_client,
                                   EmbeddingConfig config)
    : ollama_client_(std::move(ollama_client)), config_(config) {
  if (!ollama_client_) {
    throw std::invalid_argument("EmbeddingService requires an Ollama client");
  }
  if (config_.dimension <= 0) {
    throw std::invalid_argument("Embedding dimension must be positive");
  }
  if (config_.batch_size == 0) {
    throw std::invalid_argument("Embedding batch size must be at least 1");
  }
}

void EmbeddingService::ensure_ready() {
  std::lock_guard<std::mutex> lock(ready_mutex_);
  if (ready_) {
    return;
  }
  try {
    if (!ollama_client_->is_server_available()) {
      throw ModelUnavailableError("Embedding server is not reachable for model " +
                                  ollama_client_->model_name());
    }
    std::cout << "[Embedding] Loading embedding model: " << ollama_client_->model_name()
              << std::endl;
    if (!ollama_client_->load_model()) {
      throw ModelUnavailableError("Embedding model " + ollama_client_->model_name() +
                                  " could not be loaded");
    }
  } catch (const OllamaError &e) {
    throw ModelUnavailableError(e.what());
  }
  ready_ = true;
  std::cout << "[Embedding] Embedding model loaded successfully" << std::endl;
}

Vector EmbeddingService::embed(const std::string &text) {
  ensure_ready();
  return embed_one(text);
}

std::vector<Vector> EmbeddingService::embed_batch(const std::vector<std::string> &texts) {
  std::vector<Vector> vectors;
  if (texts.empty()) {
    return vectors;
  }
  ensure_ready();
  vectors.reserve(texts.size());

  // batch_size bounds how many vectors one request round holds at a time
  for (size_t start = 0; start < texts.size(); start += config_.batch_size) {
    const size_t end = std::min(texts.size(), start + config_.batch_size);
    for (size_t i = start; i < end; ++i) {
      vectors.push_back(embed_one(texts[i]));
    }
  }
  return vectors;
}

Vector EmbeddingService::embed_unit(const UnitSnapshot &unit) {
  return embed(format_unit_text(unit));
}

Vector EmbeddingService::embed_one(const std::string &text) {
  Vector vector;
  try {
    vector = ollama_client_->get_embedding(text);
  } catch (const OllamaError &e) {
    throw EmbeddingError(e.what());
  }
  if (vector.size() != static_cast<size_t>(config_.dimension)) {
    throw EmbeddingError("Model " + ollama_client_->model_name() + " returned " +
                         std::to_string(vector.size()) + " dimensions, expected " +
                         std::to_string(config_.dimension));
  }
  return vector;
}

std::string EmbeddingService::format_unit_text(const std::string &content,
                                               const std::string &container_title,
                                               const std::vector<std::string> &ancestor_texts) {
  std::string text;
  if (!container_title.empty()) {
    text += "Page: " + container_title + "\n";
  }
  if (!ancestor_texts.empty()) {
    text += "Path: ";
    for (size_t i = 0; i < ancestor_texts.size(); ++i) {
      if (i > 0)
        text += " > ";
      text += ancestor_texts[i];
    }
    text += "\n";
  }
  text += "Content: " + content;
  return text;
}

std::string EmbeddingService::format_unit_text(const UnitSnapshot &unit) {
  return format_unit_text(unit.content, unit.container_title, unit.ancestor_texts);
}

}  // namespace recall_core
