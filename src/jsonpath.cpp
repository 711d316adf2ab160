#include "jsp/jsonpath.hpp"

#include <variant>

#include "jsp/cursor.hpp"
#include "jsp/descent.hpp"
#include "jsp/evaluator.hpp"
#include "jsp/parser.hpp"

namespace jsp {
namespace {

struct ApplySelector {
  const NodeList& input;
  const QueryOptions& options;

  NodeList operator()(const selectors::Key& key) const { return apply_key(input, key); }

  NodeList operator()(const selectors::Wildcard&) const { return apply_wildcard(input); }

  NodeList operator()(const selectors::Slice& slice) const { return apply_slice(input, slice); }

  NodeList operator()(const selectors::RecursiveDescent& descent) const {
    return recursive_descent(input, descent.target, options.max_nodes);
  }
};

}  // namespace

std::vector<const Json*> query(const Json& data, std::string_view path, const QueryOptions& options) {
  NodeList results{&data};
  Cursor cursor = parse_root(Cursor(path));
  while (!cursor.at_end()) {
    auto segment = parse_segment(cursor);
    cursor = segment.rest;
    results = std::visit(ApplySelector{results, options}, segment.value);
  }
  return results;
}

void parse(std::string_view path) {
  Json placeholder{Json::Object{}};
  query(placeholder, path);
}

}  // namespace jsp
