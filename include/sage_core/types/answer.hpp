#pragma once

#include <string>
#include <vector>

namespace sage_core {

struct Source {
  std::string document_id;
  std::string snippet;
};

struct Answer {
  std::string text;
  std::vector<Source> sources;  // rank order, nearest passage first
};

}  // namespace sage_core
