#pragma once

#include <stdexcept>
#include <string>

namespace sceneql {

/// Raised by the clause parsers for malformed query text.
class SyntaxError : public std::runtime_error {
 public:
  explicit SyntaxError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace sceneql
