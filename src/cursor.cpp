#include "jsp/cursor.hpp"

#include <string>

#include "jsp/error.hpp"

namespace jsp {

Cursor::Cursor(std::string_view source, size_t position) : source_(source), position_(position) {
  if (position_ > source_.size()) {
    throw InternalError("cursor position " + std::to_string(position_) + " past end of source");
  }
}

std::optional<char> Cursor::peek() const {
  if (at_end()) {
    return std::nullopt;
  }
  return source_[position_];
}

void Cursor::advance() {
  if (at_end()) {
    throw InternalError("advance past end of path at position " + std::to_string(position_));
  }
  ++position_;
}

bool Cursor::match(char c) {
  if (peek() == c) {
    ++position_;
    return true;
  }
  return false;
}

void Cursor::consume(char c, std::string_view context) {
  if (!match(c)) {
    throw ParseError("Expected '" + std::string(1, c) + "' " + std::string(context), position_);
  }
}

}  // namespace jsp
