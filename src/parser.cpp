#include "jsp/parser.hpp"

#include <string>
#include <utility>

#include "jsp/error.hpp"

namespace jsp {
namespace {

bool is_digit(std::optional<char> c) {
  return c && *c >= '0' && *c <= '9';
}

std::string quoted(char c) {
  return std::string("'") + c + "'";
}

Selector to_selector(selectors::Target target) {
  return std::visit([](auto&& t) -> Selector { return Selector{std::move(t)}; }, std::move(target));
}

// Dot-notation key: a slice or index if one parses, `*`, or a literal name
// running up to the next '.' or '['.
Parsed<selectors::Target> parse_key(Cursor at) {
  if (at.at_end()) {
    throw ParseError("Expected key at the end of path", at.position());
  }
  char first = *at.peek();
  if (first == '.' || first == '$' || first == '[') {
    throw ParseError("Key name can't start with " + quoted(first), at.position());
  }

  auto slice = parse_slice(at);
  if (slice.value) {
    return {std::move(*slice.value), slice.rest};
  }

  size_t start = at.position();
  while (!at.at_end() && at.peek() != '.' && at.peek() != '[') {
    char c = *at.peek();
    if (c == '\'' || c == '"') {
      throw ParseError("Forbidden character " + quoted(c) + " in key name", at.position());
    }
    at.advance();
  }
  std::string name(at.source().substr(start, at.position() - start));
  if (name == "*") {
    return {selectors::Wildcard{}, at};
  }
  return {selectors::Key{std::move(name)}, at};
}

// Body of a bracket selector; `at` sits just past the '['.
Parsed<selectors::Target> parse_bracket(Cursor at) {
  if (at.match('*')) {
    at.consume(']', "after '*'");
    return {selectors::Wildcard{}, at};
  }

  if (at.peek() == '\'' || at.peek() == '"') {
    char quote = *at.peek();
    size_t opened = at.position();
    at.advance();
    size_t start = at.position();
    while (!at.at_end() && at.peek() != quote) {
      at.advance();
    }
    if (at.at_end()) {
      throw ParseError("Quoted key opened with " + quoted(quote) + " was not closed", opened);
    }
    std::string name(at.source().substr(start, at.position() - start));
    at.advance();
    at.consume(']', "after closing " + quoted(quote));
    return {selectors::Key{std::move(name)}, at};
  }

  auto slice = parse_slice(at);
  if (!slice.value) {
    throw ParseError("Expected a subscript or a slice after '['", at.position());
  }
  Cursor rest = slice.rest;
  rest.consume(']', "after numerical subscript or slice");
  return {std::move(*slice.value), rest};
}

}  // namespace

Parsed<std::optional<int64_t>> parse_num(Cursor at) {
  Cursor scan = at;
  bool negative = scan.match('-');
  if (!is_digit(scan.peek())) {
    return {std::nullopt, at};
  }
  int64_t value = 0;
  while (is_digit(scan.peek())) {
    int64_t digit = *scan.peek() - '0';
    if (value > (kMaxIndex - digit) / 10) {
      throw ParseError("Integer out of range", at.position());
    }
    value = value * 10 + digit;
    scan.advance();
  }
  return {negative ? -value : value, scan};
}

Parsed<std::optional<selectors::Slice>> parse_slice(Cursor at) {
  auto start = parse_num(at);
  Cursor cur = start.rest;
  if (cur.match(':')) {
    auto end = parse_num(cur);
    cur = end.rest;
    std::optional<int64_t> step;
    if (cur.match(':')) {
      size_t step_at = cur.position();
      auto parsed_step = parse_num(cur);
      cur = parsed_step.rest;
      step = parsed_step.value;
      if (step == 0) {
        throw ParseError("Slice step cannot be zero", step_at);
      }
    }
    return {selectors::Slice{start.value, end.value, step}, cur};
  }
  if (!start.value) {
    return {std::nullopt, at};
  }
  int64_t index = *start.value;
  if (index == -1) {
    return {selectors::Slice{index, std::nullopt, std::nullopt}, cur};
  }
  return {selectors::Slice{index, index + 1, std::nullopt}, cur};
}

Cursor parse_root(Cursor at) {
  at.consume('$', "at the beginning of path");
  return at;
}

Parsed<Selector> parse_segment(Cursor at) {
  if (at.match('.')) {
    if (at.match('.')) {
      auto target = at.match('[') ? parse_bracket(at) : parse_key(at);
      return {selectors::RecursiveDescent{std::move(target.value)}, target.rest};
    }
    auto key = parse_key(at);
    return {to_selector(std::move(key.value)), key.rest};
  }
  if (at.match('[')) {
    auto bracket = parse_bracket(at);
    return {to_selector(std::move(bracket.value)), bracket.rest};
  }
  if (at.at_end()) {
    throw ParseError("Expected '.' or '[' at the end of path", at.position());
  }
  throw ParseError("Expected '.' or '[' but found " + quoted(*at.peek()), at.position());
}

}  // namespace jsp
