#include "scanner.h"

#include <cctype>

#include "../util/string_util.h"
#include "syntax_error.h"

namespace sceneql {

namespace {

bool is_quote(char c) { return c == '\'' || c == '"'; }

}  // namespace

size_t ScanState::feed(const std::string& text, size_t i) {
  char c = text[i];
  if (in_quote()) {
    if (c == quote) {
      // WHY: a doubled quote is an escaped quote, not a terminator.
      if (i + 1 < text.size() && text[i + 1] == quote) return i + 2;
      quote = '\0';
    }
    return i + 1;
  }
  if (is_quote(c)) {
    quote = c;
  } else if (c == '(') {
    ++depth;
  } else if (c == ')') {
    --depth;
    if (depth < 0) negative_depth = true;
  }
  return i + 1;
}

std::vector<Word> top_level_words(const std::string& text) {
  std::vector<Word> out;
  ScanState state;
  size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
      ++i;
    }
    if (i >= text.size()) break;
    Word word;
    word.start = i;
    while (i < text.size()) {
      char c = text[i];
      if (state.top_level() && std::isspace(static_cast<unsigned char>(c))) break;
      if (is_quote(c) || c == '(' || c == ')') word.bare = false;
      i = state.feed(text, i);
    }
    word.end = i;
    word.text = text.substr(word.start, word.end - word.start);
    out.push_back(std::move(word));
  }
  return out;
}

std::vector<std::string> split_top_level(const std::string& text,
                                         char delimiter,
                                         const std::string& context) {
  std::vector<std::string> parts;
  ScanState state;
  size_t part_start = 0;
  size_t i = 0;
  while (i < text.size()) {
    if (state.top_level() && text[i] == delimiter) {
      parts.push_back(util::trim_ws(text.substr(part_start, i - part_start)));
      part_start = i + 1;
      ++i;
      continue;
    }
    i = state.feed(text, i);
    if (state.negative_depth) {
      throw SyntaxError("Mismatched parentheses in " + context);
    }
  }
  if (state.in_quote()) {
    throw SyntaxError("Unclosed quote in " + context);
  }
  if (state.depth != 0) {
    throw SyntaxError("Mismatched parentheses in " + context);
  }
  parts.push_back(util::trim_ws(text.substr(part_start)));
  return parts;
}

bool has_balanced_parentheses(const std::string& text) {
  ScanState state;
  size_t i = 0;
  while (i < text.size()) {
    i = state.feed(text, i);
    if (state.negative_depth) return false;
  }
  return state.depth == 0;
}

bool has_balanced_quotes(const std::string& text) {
  ScanState state;
  size_t i = 0;
  while (i < text.size()) {
    i = state.feed(text, i);
  }
  return !state.in_quote();
}

bool is_keyword(const Word& word, const char* keyword) {
  return word.bare && util::iequals(word.text, keyword);
}

}  // namespace sceneql
