#include "jsp/descent.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <variant>

#include "jsp/error.hpp"

namespace jsp {
namespace {

// Pushes the children of `node` so that the first child is popped first.
void schedule_children(const Json& node, NodeList& todo) {
  size_t mark = todo.size();
  append_children(node, todo);
  std::reverse(todo.begin() + static_cast<std::ptrdiff_t>(mark), todo.end());
}

struct VisitNode {
  const Json& node;
  NodeList& out;
  NodeList& todo;

  void operator()(const selectors::Wildcard&) const {
    append_children(node, out);
    schedule_children(node, todo);
  }

  void operator()(const selectors::Key& key) const {
    if (node.is_object()) {
      if (const Json* value = node.as_object().find(key.name)) {
        out.push_back(value);
      }
    }
    schedule_children(node, todo);
  }

  void operator()(const selectors::Slice& slice) const {
    if (node.is_array()) {
      append_slice(node.as_array(), slice, out);
    }
    schedule_children(node, todo);
  }
};

}  // namespace

NodeList recursive_descent(const NodeList& input, const selectors::Target& target, size_t max_nodes) {
  NodeList out;
  NodeList todo(input.rbegin(), input.rend());
  size_t visited = 0;
  while (!todo.empty()) {
    const Json* node = todo.back();
    todo.pop_back();
    if (max_nodes != 0 && ++visited > max_nodes) {
      throw LimitError("Recursive descent visited more than " + std::to_string(max_nodes) +
                       " nodes");
    }
    std::visit(VisitNode{*node, out, todo}, target);
  }
  return out;
}

}  // namespace jsp
