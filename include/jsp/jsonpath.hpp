#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include "jsp/json.hpp"

namespace jsp {

struct QueryOptions {
  // Per `..` segment cap on visited nodes; 0 means unbounded.
  size_t max_nodes = 0;
};

// Evaluates `path` against `data` and returns the matched values in order.
// The returned pointers borrow from `data`. Throws ParseError on a malformed
// path, LimitError when `options.max_nodes` is exceeded.
std::vector<const Json*> query(const Json& data, std::string_view path,
                               const QueryOptions& options = {});

// Checks that `path` is well formed; throws ParseError otherwise.
void parse(std::string_view path);

}  // namespace jsp
