#include "../query_parser.h"

#include <cerrno>
#include <cstdlib>

#include "../util/string_util.h"

namespace sceneql {

namespace {

/// Parses a strict int64; rejects partial parses and overflow.
std::optional<int64_t> parse_int64(const std::string& text) {
  if (text.empty()) return std::nullopt;
  errno = 0;
  char* end = nullptr;
  long long value = std::strtoll(text.c_str(), &end, 10);
  if (errno == ERANGE || end != text.c_str() + text.size()) return std::nullopt;
  return static_cast<int64_t>(value);
}

/// Parses a strict decimal or exponent double.
std::optional<double> parse_double(const std::string& text) {
  if (text.empty()) return std::nullopt;
  // WHY: strtod also accepts hex, inf and nan spellings that are not SQL numbers.
  for (char c : text) {
    bool ok = (c >= '0' && c <= '9') || c == '.' || c == 'e' || c == 'E' || c == '+' || c == '-';
    if (!ok) return std::nullopt;
  }
  char* end = nullptr;
  double value = std::strtod(text.c_str(), &end);
  if (end != text.c_str() + text.size()) return std::nullopt;
  return value;
}

}  // namespace

std::optional<Value> parse_number(const std::string& text) {
  std::string token = util::trim_ws(text);
  bool looks_float = token.find_first_of(".eE") != std::string::npos;
  if (!looks_float) {
    if (auto i = parse_int64(token)) return Value::integer(*i);
  }
  if (auto d = parse_double(token)) return Value::floating(*d);
  return std::nullopt;
}

std::string unescape_string(const std::string& body) {
  std::string out;
  out.reserve(body.size());
  for (size_t i = 0; i < body.size(); ++i) {
    char c = body[i];
    if ((c == '\'' || c == '"') && i + 1 < body.size() && body[i + 1] == c) {
      out.push_back(c);
      ++i;
      continue;
    }
    if (c == '\\' && i + 1 < body.size()) {
      char next = body[i + 1];
      if (next == 'n') {
        out.push_back('\n');
        ++i;
        continue;
      }
      if (next == 't') {
        out.push_back('\t');
        ++i;
        continue;
      }
      if (next == 'r') {
        out.push_back('\r');
        ++i;
        continue;
      }
      if (next == '\\') {
        out.push_back('\\');
        ++i;
        continue;
      }
    }
    out.push_back(c);
  }
  return out;
}

Value parse_literal(const std::string& text) {
  std::string token = util::trim_ws(text);
  if (token.empty()) return Value::string("");
  if (util::iequals(token, "NULL")) return Value::null();
  if (util::iequals(token, "TRUE")) return Value::boolean(true);
  if (util::iequals(token, "FALSE")) return Value::boolean(false);
  if (token.size() >= 2 && (token.front() == '\'' || token.front() == '"') &&
      token.back() == token.front()) {
    return Value::string(unescape_string(token.substr(1, token.size() - 2)));
  }
  if (auto number = parse_number(token)) return *number;
  return Value::string(token);
}

}  // namespace sceneql
