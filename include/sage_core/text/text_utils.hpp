#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace sage_core::text {

// Lowercased word terms: runs of ASCII alphanumerics or non-ASCII bytes. A trailing "s" is
// dropped from terms longer than three characters so "leaves" and "leave" match.
std::vector<std::string> tokenize_terms(const std::string &text);

// First `max_chars` code points of `text`. Invalid UTF-8 is cut on a byte boundary.
std::string truncate_chars(const std::string &text, size_t max_chars);

// At most `max_words` whitespace-separated words, joined by single spaces.
std::string truncate_words(const std::string &text, size_t max_words);

size_t count_words(const std::string &text);

std::string trim(const std::string &text);

}  // namespace sage_core::text
