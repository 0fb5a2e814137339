#pragma once

#include <string>
#include <vector>

#include "sage_core/embedding/embedder.hpp"
#include "sage_core/llm/text_generator.hpp"

namespace sage_core {

/**
 * @brief Embedding and generation backed by a local Ollama server.
 *
 * The constructor checks that the server is reachable and probes the embedding width once;
 * both are fixed for the lifetime of the client. Backend failures are reported as ModelError.
 */
class OllamaClient : public Embedder, public TextGenerator {
 public:
  OllamaClient(const std::string &ollama_url,
               const std::string &embedding_model,
               const std::string &generation_model);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<std::vector<float>> embed(const std::vector<std::string> &texts) override;
  size_t dimension() const override {
    return dimension_;
  }
  std::string model_name() const override {
    return embedding_model_;
  }

  std::string generate(const std::string &prompt, const GenerationOptions &options) override;

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  std::string generation_model_;
  size_t dimension_ = 0;

  static constexpr const char *DIMENSION_PROBE_TEXT = "dimension probe";

  // Helper methods
  void setup_server_connection();
  std::vector<float> get_embedding(const std::string &text);
};

}  // namespace sage_core
