#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace jsp {

// Scan position over a path expression. Cheap to copy; parsing functions take
// a Cursor by value and hand back the advanced copy alongside what they read.
class Cursor {
 public:
  explicit Cursor(std::string_view source, size_t position = 0);

  std::optional<char> peek() const;
  bool at_end() const { return position_ >= source_.size(); }
  size_t position() const { return position_; }
  std::string_view source() const { return source_; }

  // Throws InternalError when already at the end.
  void advance();

  bool match(char c);

  // Throws ParseError "Expected '<c>' <context>" unless match(c) succeeds.
  void consume(char c, std::string_view context);

 private:
  std::string_view source_;
  size_t position_;
};

template <typename T>
struct Parsed {
  T value;
  Cursor rest;
};

}  // namespace jsp
