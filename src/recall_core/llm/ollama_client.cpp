#include "recall_core/llm/ollama_client.hpp"
#include "ollama.hpp"

namespace recall_core {

OllamaClient::OllamaClient(const std::string &ollama_url, const std::string &embedding_model)
    : ollama_url_(ollama_url), embedding_model_(embedding_model) {
  // No connection attempt here; readiness is checked lazily by the caller.
  ollama::setServerURL(ollama_url_);
}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  nlohmann::json json_response;
  try {
    json_response = ollama::generate_embeddings(embedding_model_, text).as_json();
  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding generation failed: " + std::string(e.what()));
  }

  if (!json_response.contains("embeddings") || !json_response["embeddings"].is_array()) {
    throw OllamaError("Response from " + embedding_model_ + " has no embeddings array");
  }
  const auto &embeddings = json_response["embeddings"];
  if (embeddings.empty()) {
    throw OllamaError("Model " + embedding_model_ + " returned no embedding");
  }

  try {
    // /api/embed answers with one vector per input; older servers return a bare vector
    const auto &vector = embeddings[0].is_array() ? embeddings[0] : embeddings;
    return vector.get<std::vector<float>>();
  } catch (const nlohmann::json::exception &e) {
    throw OllamaError("Malformed embedding from " + embedding_model_ + ": " + e.what());
  }
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

bool OllamaClient::load_model() {
  try {
    return ollama::load_model(embedding_model_);
  } catch (const ollama::exception &e) {
    throw OllamaError("Loading model " + embedding_model_ + " failed: " + e.what());
  }
}

}  // namespace recall_core
