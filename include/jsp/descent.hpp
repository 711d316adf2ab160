#pragma once

#include <cstddef>

#include "jsp/evaluator.hpp"
#include "jsp/selector.hpp"

namespace jsp {

// Applies `target` at every node of every input subtree, visiting depth-first
// in pre-order: each input is exhausted before the next one starts, object
// values follow key order and array items follow index order.
//
// A wildcard collects every node's children, a key collects the member of
// every object that has it, a slice collects from every array. Results come
// out in discovery order.
//
// `max_nodes` caps the number of visited nodes (0 is unbounded); exceeding it
// throws LimitError.
NodeList recursive_descent(const NodeList& input, const selectors::Target& target,
                           size_t max_nodes = 0);

}  // namespace jsp
