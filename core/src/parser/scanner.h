#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace sceneql {

/// Tracks quote and parenthesis state while walking query text.
/// MUST be fed every character in order; feed() returns the index of the next character.
struct ScanState {
  char quote = '\0';
  int depth = 0;
  bool negative_depth = false;

  bool in_quote() const { return quote != '\0'; }
  bool top_level() const { return !in_quote() && depth == 0; }
  size_t feed(const std::string& text, size_t i);
};

/// A whitespace-separated run of query text.
/// Quoted strings and parenthesized groups never break a word.
struct Word {
  std::string text;
  size_t start = 0;
  size_t end = 0;
  /// False when the word contains a quote or a parenthesis; only bare words can be keywords.
  bool bare = true;
};

/// Splits text into top-level words.
/// MUST treat doubled quote characters inside a string as an escaped quote.
std::vector<Word> top_level_words(const std::string& text);

/// Splits text on a delimiter outside quotes and parentheses; parts are trimmed.
/// MUST throw SyntaxError("Mismatched parentheses in <context>") or
/// SyntaxError("Unclosed quote in <context>") on malformed input.
std::vector<std::string> split_top_level(const std::string& text,
                                         char delimiter,
                                         const std::string& context);

/// True when every '(' outside quotes has a matching ')'.
bool has_balanced_parentheses(const std::string& text);
/// True when every quoted string is closed.
bool has_balanced_quotes(const std::string& text);

/// True when the word is bare and equals the keyword case-insensitively.
bool is_keyword(const Word& word, const char* keyword);

}  // namespace sceneql
