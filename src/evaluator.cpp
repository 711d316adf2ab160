#include "jsp/evaluator.hpp"

#include <algorithm>
#include <cstdint>

namespace jsp {
namespace {

int64_t clamp_int64(int64_t value, int64_t min_value, int64_t max_value) {
  return std::max(min_value, std::min(value, max_value));
}

}  // namespace

void append_children(const Json& node, NodeList& out) {
  if (node.is_array()) {
    for (const auto& child : node.as_array()) {
      out.push_back(child.get());
    }
  } else if (node.is_object()) {
    for (const auto& entry : node.as_object()) {
      out.push_back(entry.second.get());
    }
  }
}

void append_slice(const Json::Array& array, const selectors::Slice& slice, NodeList& out) {
  int64_t size = static_cast<int64_t>(array.size());
  int64_t step = slice.step.value_or(1);
  if (step == 0) {
    return;
  }
  auto normalize = [&](int64_t idx) {
    return idx >= 0 ? idx : size + idx;
  };
  int64_t start = slice.start.has_value() ? normalize(*slice.start) : (step > 0 ? 0 : size - 1);
  int64_t end = slice.end.has_value() ? normalize(*slice.end) : (step > 0 ? size : -1);

  if (step > 0) {
    start = clamp_int64(start, 0, size);
    end = clamp_int64(end, 0, size);
    for (int64_t i = start; i < end; i += step) {
      out.push_back(array[static_cast<size_t>(i)].get());
    }
  } else {
    start = clamp_int64(start, -1, size - 1);
    end = clamp_int64(end, -1, size - 1);
    for (int64_t i = start; i > end; i += step) {
      out.push_back(array[static_cast<size_t>(i)].get());
    }
  }
}

NodeList apply_key(const NodeList& input, const selectors::Key& key) {
  NodeList out;
  for (const auto* node : input) {
    if (!node->is_object()) {
      continue;
    }
    if (const Json* value = node->as_object().find(key.name)) {
      out.push_back(value);
    }
  }
  return out;
}

NodeList apply_wildcard(const NodeList& input) {
  NodeList out;
  for (const auto* node : input) {
    append_children(*node, out);
  }
  return out;
}

NodeList apply_slice(const NodeList& input, const selectors::Slice& slice) {
  NodeList out;
  for (const auto* node : input) {
    if (node->is_array()) {
      append_slice(node->as_array(), slice, out);
    }
  }
  return out;
}

}  // namespace jsp
