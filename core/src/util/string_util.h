#pragma once

#include <string>
#include <vector>

namespace sceneql::util {

/// Converts a string to lowercase for case-insensitive comparisons.
/// MUST avoid locale-sensitive behavior to keep parsing deterministic.
std::string to_lower(const std::string& s);
/// Converts a string to uppercase for keyword matching.
/// MUST avoid locale-sensitive behavior to keep parsing deterministic.
std::string to_upper(const std::string& s);
/// Trims leading and trailing ASCII whitespace.
/// MUST preserve internal whitespace and MUST not modify the input.
std::string trim_ws(const std::string& s);
/// ASCII case-insensitive equality.
bool iequals(const std::string& a, const std::string& b);
/// True for `[A-Za-z_][A-Za-z0-9_]*`.
bool is_identifier(const std::string& s);
/// True for one or more identifiers joined by single dots.
bool is_field_path(const std::string& s);
/// Joins parts with a separator.
std::string join(const std::vector<std::string>& parts, const std::string& sep);

}  // namespace sceneql::util
