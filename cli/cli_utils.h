#pragma once

#include <cstddef>
#include <string>
#include <utility>

namespace sceneql::cli {

/// Converts a byte offset into a 1-based (line, column) pair.
/// MUST clamp offsets past the end to the last position.
std::pair<size_t, size_t> line_col_from_offset(const std::string& text, size_t offset);
/// Checks that text is well-formed UTF-8 (no overlongs, no surrogates).
bool is_valid_utf8(const std::string& text);

}  // namespace sceneql::cli
