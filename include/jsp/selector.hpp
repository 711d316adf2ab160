#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace jsp {

namespace selectors {

struct Key {
  std::string name;
};

struct Wildcard {};

// Half-open [start, end) with an optional stride. Omitted bounds span the
// whole array in the direction of the step.
struct Slice {
  std::optional<int64_t> start;
  std::optional<int64_t> end;
  std::optional<int64_t> step;
};

using Target = std::variant<Key, Wildcard, Slice>;

// `..` prefix: applies the target at every node of each subtree.
struct RecursiveDescent {
  Target target;
};

}  // namespace selectors

using Selector = std::variant<
  selectors::Key,
  selectors::Wildcard,
  selectors::Slice,
  selectors::RecursiveDescent
>;

}  // namespace jsp
