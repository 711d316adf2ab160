#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace jsp {

struct Error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Grammar violation in a path expression.
class ParseError : public Error {
 public:
  explicit ParseError(std::string message, std::optional<size_t> position = std::nullopt);

  const std::string& message() const { return message_; }
  std::optional<size_t> position() const { return position_; }

 private:
  std::string message_;
  std::optional<size_t> position_;
};

// Malformed JSON text.
class JsonError : public Error {
 public:
  JsonError(const std::string& message, size_t position);

  size_t position() const { return position_; }

 private:
  size_t position_;
};

// A configured traversal budget was exceeded.
struct LimitError : Error {
  explicit LimitError(const std::string& message) : Error(message) {}
};

// A broken internal invariant, never a problem with the caller's input.
struct InternalError : std::logic_error {
  using std::logic_error::logic_error;
};

}  // namespace jsp
