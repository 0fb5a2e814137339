#include "sage_core/llm/ollama_client.hpp"

#include <ollama.hpp>

#include <iostream>

#include "sage_core/errors.hpp"

namespace sage_core {

OllamaClient::OllamaClient(const std::string &ollama_url,
                           const std::string &embedding_model,
                           const std::string &generation_model)
    : ollama_url_(ollama_url),
      embedding_model_(embedding_model),
      generation_model_(generation_model) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  ollama::setServerURL(ollama_url_);
  if (!ollama::is_running()) {
    throw ModelError("Ollama server is not running at " + ollama_url_);
  }

  // The width is a property of the model; probe it once so the index can be checked against it.
  dimension_ = get_embedding(DIMENSION_PROBE_TEXT).size();
  if (dimension_ == 0) {
    throw ModelError("Embedding model '" + embedding_model_ + "' returned an empty vector");
  }
  std::clog << "[ollama] Embedding model " << embedding_model_ << " ready (dimension "
            << dimension_ << ")" << std::endl;
}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);
    auto json_response = response.as_json();

    if (!json_response.contains("embeddings")) {
      throw ModelError("Response does not contain embeddings field");
    }

    // /api/embed answers with an array of arrays; older servers with a flat array.
    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array()) {
      throw ModelError("Embeddings field is not an array");
    }
    if (embeddings.size() > 0 && embeddings[0].is_array()) {
      return embeddings[0].get<std::vector<float>>();
    }
    return embeddings.get<std::vector<float>>();
  } catch (const ollama::exception &e) {
    throw ModelError("Embedding generation failed: " + std::string(e.what()));
  }
}

// The Ollama api supports batch input, but ollama-hpp only exposes single-text requests.
std::vector<std::vector<float>> OllamaClient::embed(const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> out;
  out.reserve(texts.size());
  for (const auto &text : texts) {
    std::vector<float> vec = get_embedding(text);
    if (dimension_ != 0 && vec.size() != dimension_) {
      throw DimensionMismatchError("Embedding model returned " + std::to_string(vec.size()) +
                                   " dimensions, expected " + std::to_string(dimension_));
    }
    out.push_back(std::move(vec));
  }
  return out;
}

std::string OllamaClient::generate(const std::string &prompt, const GenerationOptions &options) {
  try {
    ollama::options request_options;
    request_options["num_predict"] = options.max_tokens;
    request_options["temperature"] = options.temperature;

    ollama::response response = ollama::generate(generation_model_, prompt, request_options);
    return response.as_simple_string();
  } catch (const ollama::exception &e) {
    throw ModelError("Text generation failed: " + std::string(e.what()));
  }
}

}  // namespace sage_core
