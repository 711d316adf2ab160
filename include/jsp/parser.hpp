#pragma once

#include <cstdint>
#include <optional>

#include "jsp/cursor.hpp"
#include "jsp/selector.hpp"

namespace jsp {

// Largest accepted magnitude of a numeral in a path: 2^53 - 1.
constexpr int64_t kMaxIndex = 9007199254740991LL;

// Optional '-' followed by ASCII digits. Yields nothing, without consuming,
// when no digit is present.
Parsed<std::optional<int64_t>> parse_num(Cursor at);

// start[:end[:step]] or a bare index. A bare index n becomes [n, n + 1),
// except -1 which becomes [-1, end) so that it selects the last element.
// Yields nothing, without consuming, when neither a number nor ':' is present.
Parsed<std::optional<selectors::Slice>> parse_slice(Cursor at);

// Consumes the leading '$'.
Cursor parse_root(Cursor at);

// One `.key`, `..target` or `[...]` segment.
Parsed<Selector> parse_segment(Cursor at);

}  // namespace jsp
