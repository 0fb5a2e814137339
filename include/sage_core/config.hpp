#pragma once

#include <cstddef>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "sage_core/errors.hpp"

namespace sage_core {

class Config {
 public:
  std::string data_dir;

  // "hashing" (offline) or "ollama"
  std::string embedder;
  // "extractive" (offline) or "llm"
  std::string summarizer;

  std::string ollama_url;
  std::string embedding_model;
  std::string generation_model;
  // Only used by the hashing embedder; Ollama reports its own width
  size_t embedding_dimension;

  size_t chunk_size;
  size_t chunk_overlap;
  int top_k;
  size_t snippet_chars;
  size_t answer_min_words;
  size_t answer_max_words;
  int compression_level;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw InvalidConfigurationError("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const nlohmann::json::exception& e) {
      throw InvalidConfigurationError(std::string("Failed to parse JSON in config file '") +
                                      filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw InvalidConfigurationError("Configuration must be a JSON object");
    }

    Config config;
    try {
      // Apply defaults when keys are missing
      config.data_dir = json_config.value("data_dir", std::string("./data"));
      config.embedder = json_config.value("embedder", std::string("hashing"));
      config.summarizer = json_config.value("summarizer", std::string("extractive"));
      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model = json_config.value("embedding_model", std::string("all-minilm"));
      config.generation_model = json_config.value("generation_model", std::string("llama3.2"));
      config.embedding_dimension = read_size(json_config, "embedding_dimension", 384);

      config.chunk_size = read_size(json_config, "chunk_size", 400);
      config.chunk_overlap = read_size(json_config, "chunk_overlap", 50);
      config.top_k = json_config.value("top_k", 5);
      config.snippet_chars = read_size(json_config, "snippet_chars", 200);
      config.answer_min_words = read_size(json_config, "answer_min_words", 30);
      config.answer_max_words = read_size(json_config, "answer_max_words", 130);
      config.compression_level = json_config.value("compression_level", 3);
    } catch (const nlohmann::json::exception& e) {
      throw InvalidConfigurationError(std::string("Invalid configuration value: ") + e.what());
    }

    config.validate();
    return config;
  }

 private:
  // Negative numbers would wrap around when read straight into size_t
  static size_t read_size(const nlohmann::json& json_config, const char* key, size_t fallback) {
    if (!json_config.contains(key)) {
      return fallback;
    }
    const auto& value = json_config.at(key);
    if (!value.is_number_integer() || value.get<long long>() < 0) {
      throw InvalidConfigurationError(std::string(key) + " must be a non-negative integer");
    }
    return value.get<size_t>();
  }

  void validate() const {
    if (data_dir.empty()) {
      throw InvalidConfigurationError("data_dir cannot be empty");
    }
    if (embedder != "hashing" && embedder != "ollama") {
      throw InvalidConfigurationError("embedder must be \"hashing\" or \"ollama\", got \"" +
                                      embedder + "\"");
    }
    if (summarizer != "extractive" && summarizer != "llm") {
      throw InvalidConfigurationError("summarizer must be \"extractive\" or \"llm\", got \"" +
                                      summarizer + "\"");
    }
    if ((embedder == "ollama" || summarizer == "llm") && ollama_url.empty()) {
      throw InvalidConfigurationError("ollama_url cannot be empty");
    }
    if (embedder == "ollama" && embedding_model.empty()) {
      throw InvalidConfigurationError("embedding_model cannot be empty");
    }
    if (summarizer == "llm" && generation_model.empty()) {
      throw InvalidConfigurationError("generation_model cannot be empty");
    }
    if (embedding_dimension == 0) {
      throw InvalidConfigurationError("embedding_dimension must be greater than 0");
    }
    if (chunk_size == 0) {
      throw InvalidConfigurationError("chunk_size must be greater than 0");
    }
    if (chunk_overlap >= chunk_size) {
      throw InvalidConfigurationError("chunk_overlap must be smaller than chunk_size");
    }
    if (top_k <= 0) {
      throw InvalidConfigurationError("top_k must be greater than 0");
    }
    if (snippet_chars == 0) {
      throw InvalidConfigurationError("snippet_chars must be greater than 0");
    }
    if (answer_max_words == 0 || answer_min_words > answer_max_words) {
      throw InvalidConfigurationError("answer_min_words must not exceed answer_max_words");
    }
    if (compression_level < 1 || compression_level > 22) {
      throw InvalidConfigurationError("compression_level must be between 1 and 22");
    }
  }
};

}  // namespace sage_core
