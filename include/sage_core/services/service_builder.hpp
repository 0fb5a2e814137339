#pragma once

#include <memory>

#include "sage_core/config.hpp"
#include "sage_core/services/retrieval_service.hpp"

namespace sage_core {

// Settings the retrieval service takes from the configuration.
RetrievalSettings settings_from_config(const Config &config);

/**
 * @brief Wires the embedder, summarizer and state store named by `config` into a service.
 *
 * Creates `data_dir` if needed. Connecting to Ollama happens here, so an unreachable server
 * fails the build with ModelError. The returned service still needs initialize().
 */
std::unique_ptr<RetrievalService> build_retrieval_service(const Config &config);

}  // namespace sage_core
