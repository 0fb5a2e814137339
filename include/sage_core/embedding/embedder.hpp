#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace sage_core {

/**
 * @brief Maps text to fixed-width dense vectors.
 *
 * Implementations load or connect to their model once, at construction, and keep it for
 * the lifetime of the process. `embed` returns exactly one vector per input text, in input
 * order, each of `dimension()` floats. The same text embedded twice by the same model
 * version yields the same vector up to floating point noise.
 */
class Embedder {
 public:
  virtual ~Embedder() = default;

  virtual std::vector<std::vector<float>> embed(const std::vector<std::string> &texts) = 0;

  virtual size_t dimension() const = 0;

  // Identifies the model version; persisted next to the index so a model change is detected.
  virtual std::string model_name() const = 0;
};

}  // namespace sage_core
