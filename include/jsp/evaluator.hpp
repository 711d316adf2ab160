#pragma once

#include <vector>

#include "jsp/json.hpp"
#include "jsp/selector.hpp"

namespace jsp {

// Borrowed pointers into the caller's document, in match order.
using NodeList = std::vector<const Json*>;

NodeList apply_key(const NodeList& input, const selectors::Key& key);

NodeList apply_wildcard(const NodeList& input);

NodeList apply_slice(const NodeList& input, const selectors::Slice& slice);

// Building blocks shared with the recursive-descent engine.
void append_children(const Json& node, NodeList& out);

void append_slice(const Json::Array& array, const selectors::Slice& slice, NodeList& out);

}  // namespace jsp
