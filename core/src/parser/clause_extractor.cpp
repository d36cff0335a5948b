#include "../query_parser.h"

#include <optional>

#include "../util/string_util.h"
#include "scanner.h"

namespace sceneql {

namespace {

const char* kShapeError = "missing SELECT...FROM: expected SELECT fields FROM table";

enum class ClauseKind { Select, From, Where, GroupBy, OrderBy, Limit };

struct KeywordHit {
  ClauseKind kind;
  /// Offset where the keyword starts.
  size_t start = 0;
  /// Offset where the clause body starts.
  size_t body_start = 0;
};

std::string strip_terminator(const std::string& query) {
  std::string out = util::trim_ws(query);
  while (!out.empty() && out.back() == ';') {
    out.pop_back();
    out = util::trim_ws(out);
  }
  return out;
}

/// Finds the first occurrence of each clause keyword among top-level words.
/// MUST treat GROUP BY and ORDER BY as two words separated by any whitespace.
std::vector<KeywordHit> find_keywords(const std::vector<Word>& words) {
  std::vector<KeywordHit> hits;
  auto seen = [&](ClauseKind kind) {
    for (const auto& hit : hits) {
      if (hit.kind == kind) return true;
    }
    return false;
  };
  for (size_t i = 0; i < words.size(); ++i) {
    const Word& word = words[i];
    std::optional<ClauseKind> kind;
    size_t body_start = word.end;
    if (is_keyword(word, "SELECT")) {
      kind = ClauseKind::Select;
    } else if (is_keyword(word, "FROM")) {
      kind = ClauseKind::From;
    } else if (is_keyword(word, "WHERE")) {
      kind = ClauseKind::Where;
    } else if (is_keyword(word, "LIMIT")) {
      kind = ClauseKind::Limit;
    } else if ((is_keyword(word, "GROUP") || is_keyword(word, "ORDER")) && i + 1 < words.size() &&
               is_keyword(words[i + 1], "BY")) {
      kind = is_keyword(word, "GROUP") ? ClauseKind::GroupBy : ClauseKind::OrderBy;
      body_start = words[i + 1].end;
    }
    if (!kind.has_value() || seen(*kind)) continue;
    hits.push_back(KeywordHit{*kind, word.start, body_start});
  }
  return hits;
}

}  // namespace

QueryClauses extract_clauses(const std::string& query) {
  std::string text = strip_terminator(query);
  if (text.empty()) {
    throw SyntaxError("Empty query");
  }
  std::vector<Word> words = top_level_words(text);
  if (words.empty() || !is_keyword(words.front(), "SELECT")) {
    throw SyntaxError(kShapeError);
  }
  std::vector<KeywordHit> hits = find_keywords(words);

  QueryClauses clauses;
  bool has_from = false;
  for (size_t i = 0; i < hits.size(); ++i) {
    size_t body_end = i + 1 < hits.size() ? hits[i + 1].start : text.size();
    std::string body = util::trim_ws(text.substr(hits[i].body_start, body_end - hits[i].body_start));
    switch (hits[i].kind) {
      case ClauseKind::Select:
        clauses.select = body;
        break;
      case ClauseKind::From:
        clauses.from = body;
        has_from = true;
        break;
      case ClauseKind::Where:
        clauses.where = body;
        break;
      case ClauseKind::GroupBy:
        clauses.group_by = body;
        break;
      case ClauseKind::OrderBy:
        clauses.order_by = body;
        break;
      case ClauseKind::Limit:
        clauses.limit = body;
        break;
    }
  }
  if (!has_from || clauses.from.empty()) {
    throw SyntaxError(kShapeError);
  }
  if (!util::is_identifier(clauses.from)) {
    throw SyntaxError("FROM clause must name a single table, got: " + clauses.from);
  }
  return clauses;
}

}  // namespace sceneql
