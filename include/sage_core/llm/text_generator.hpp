#pragma once

#include <string>

namespace sage_core {

struct GenerationOptions {
  int max_tokens = 256;
  float temperature = 0.0f;
};

class TextGenerator {
 public:
  virtual ~TextGenerator() = default;

  virtual std::string generate(const std::string &prompt, const GenerationOptions &options) = 0;
};

}  // namespace sage_core
