#include "jsp/error.hpp"

#include <utility>

namespace jsp {
namespace {

std::string render(const std::string& message, std::optional<size_t> position) {
  if (!position) {
    return message;
  }
  return message + " at position " + std::to_string(*position);
}

}  // namespace

ParseError::ParseError(std::string message, std::optional<size_t> position)
    : Error(render(message, position)), message_(std::move(message)), position_(position) {}

JsonError::JsonError(const std::string& message, size_t position)
    : Error(render(message, position)), position_(position) {}

}  // namespace jsp
