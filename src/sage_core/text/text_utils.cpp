#include "sage_core/text/text_utils.hpp"

#include <utf8.h>

#include <cctype>
#include <sstream>

namespace sage_core::text {

namespace {

bool is_term_byte(unsigned char c) {
  return c >= 0x80 || std::isalnum(c);
}

void push_term(std::vector<std::string> &terms, std::string &term) {
  if (term.empty())
    return;
  if (term.size() > 3 && term.back() == 's')
    term.pop_back();
  terms.push_back(term);
  term.clear();
}

}  // namespace

std::vector<std::string> tokenize_terms(const std::string &text) {
  std::vector<std::string> terms;
  std::string term;
  for (char ch : text) {
    unsigned char c = static_cast<unsigned char>(ch);
    if (is_term_byte(c)) {
      term += c < 0x80 ? static_cast<char>(std::tolower(c)) : ch;
    } else {
      push_term(terms, term);
    }
  }
  push_term(terms, term);
  return terms;
}

std::string truncate_chars(const std::string &text, size_t max_chars) {
  if (!utf8::is_valid(text.begin(), text.end())) {
    return text.substr(0, max_chars);
  }
  auto it = text.begin();
  for (size_t i = 0; i < max_chars && it != text.end(); ++i) {
    utf8::next(it, text.end());
  }
  return std::string(text.begin(), it);
}

std::string truncate_words(const std::string &text, size_t max_words) {
  std::istringstream in(text);
  std::string word;
  std::string out;
  size_t count = 0;
  while (count < max_words && in >> word) {
    if (!out.empty())
      out += ' ';
    out += word;
    ++count;
  }
  return out;
}

size_t count_words(const std::string &text) {
  std::istringstream in(text);
  std::string word;
  size_t count = 0;
  while (in >> word) {
    ++count;
  }
  return count;
}

std::string trim(const std::string &text) {
  const char *whitespace = " \t\r\n\f\v";
  size_t first = text.find_first_not_of(whitespace);
  if (first == std::string::npos)
    return "";
  size_t last = text.find_last_not_of(whitespace);
  return text.substr(first, last - first + 1);
}

}  // namespace sage_core::text
