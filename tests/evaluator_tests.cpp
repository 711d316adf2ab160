#include "jsp/evaluator.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>

namespace {

namespace sel = jsp::selectors;

std::string slice_of(const char* array, std::optional<int64_t> start, std::optional<int64_t> end,
                     std::optional<int64_t> step = std::nullopt) {
  auto doc = jsp::parse_json(array);
  return jsp::dump_json(jsp::apply_slice({&doc}, sel::Slice{start, end, step}));
}

}  // namespace

TEST(ApplyKey, SelectsFromObjectsOnly) {
  auto doc = jsp::parse_json(R"([{"a": 1}, {"b": 2}, [{"a": 3}], "a", null, {"a": {"x": 4}}])");
  jsp::NodeList input;
  jsp::append_children(doc, input);
  EXPECT_EQ(jsp::dump_json(jsp::apply_key(input, sel::Key{"a"})), R"([1, {"x": 4}])");
  EXPECT_TRUE(jsp::apply_key(input, sel::Key{"missing"}).empty());
}

TEST(ApplyKey, ReturnsBorrowedNodes) {
  auto doc = jsp::parse_json(R"({"a": [1, 2]})");
  auto out = jsp::apply_key({&doc}, sel::Key{"a"});
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0], doc.as_object().find("a"));
}

TEST(ApplyWildcard, ExpandsObjectsAndArraysInOrder) {
  auto object = jsp::parse_json(R"({"b": 1, "a": 2, "c": [3]})");
  auto array = jsp::parse_json(R"([true, "x"])");
  auto scalar = jsp::parse_json("7");
  EXPECT_EQ(jsp::dump_json(jsp::apply_wildcard({&object, &scalar, &array})), R"([1, 2, [3], true, "x"])");
  EXPECT_TRUE(jsp::apply_wildcard({&scalar}).empty());
}

TEST(AppendChildren, BorrowsObjectValuesInKeyOrder) {
  auto doc = jsp::parse_json(R"({"z": 1, "a": [2], "m": null})");
  jsp::NodeList out;
  jsp::append_children(doc, out);
  ASSERT_EQ(out.size(), 3u);
  EXPECT_EQ(out[0], doc.as_object().find("z"));
  EXPECT_EQ(out[1], doc.as_object().find("a"));
  EXPECT_EQ(out[2], doc.as_object().find("m"));
}

TEST(ApplySlice, HalfOpenRanges) {
  EXPECT_EQ(slice_of("[1, 2, 3, 4, 5]", 1, 3), "[2, 3]");
  EXPECT_EQ(slice_of("[1, 2, 3, 4, 5]", std::nullopt, 2), "[1, 2]");
  EXPECT_EQ(slice_of("[1, 2, 3, 4, 5]", 3, std::nullopt), "[4, 5]");
  EXPECT_EQ(slice_of("[1, 2, 3, 4, 5]", std::nullopt, std::nullopt), "[1, 2, 3, 4, 5]");
}

TEST(ApplySlice, EqualBoundsAreEmpty) {
  for (int64_t i = -5; i <= 5; ++i) {
    EXPECT_EQ(slice_of("[1, 2, 3, 4]", i, i), "[]") << i;
  }
}

TEST(ApplySlice, NegativeIndices) {
  EXPECT_EQ(slice_of("[1, 2, 3, 4, 5]", -2, std::nullopt), "[4, 5]");
  EXPECT_EQ(slice_of("[1, 2, 3, 4, 5]", -3, -1), "[3, 4]");
  EXPECT_EQ(slice_of("[1, 2, 3]", -1, std::nullopt), "[3]");
  EXPECT_EQ(slice_of("[]", -1, std::nullopt), "[]");
}

TEST(ApplySlice, ClampsOutOfRange) {
  EXPECT_EQ(slice_of("[1, 2, 3]", 10, 20), "[]");
  EXPECT_EQ(slice_of("[1, 2, 3]", -10, 2), "[1, 2]");
  EXPECT_EQ(slice_of("[1, 2, 3]", 1, 100), "[2, 3]");
  EXPECT_EQ(slice_of("[1, 2, 3]", 5, 6), "[]");
}

TEST(ApplySlice, Steps) {
  EXPECT_EQ(slice_of("[1, 2, 3, 4, 5, 6]", std::nullopt, std::nullopt, 2), "[1, 3, 5]");
  EXPECT_EQ(slice_of("[1, 2, 3, 4, 5, 6]", 4, 1, -2), "[5, 3]");
  EXPECT_EQ(slice_of("[1, 2, 3]", std::nullopt, std::nullopt, -1), "[3, 2, 1]");
  EXPECT_EQ(slice_of("[1, 2, 3]", 10, std::nullopt, -1), "[3, 2, 1]");
  EXPECT_EQ(slice_of("[1, 2, 3]", 0, 3, -1), "[]");
}

TEST(ApplySlice, SkipsNonArrays) {
  auto object = jsp::parse_json(R"({"0": 1})");
  auto array = jsp::parse_json("[1, 2]");
  auto text = jsp::parse_json(R"("abc")");
  auto out = jsp::apply_slice({&object, &array, &text, &array}, sel::Slice{0, 1, std::nullopt});
  EXPECT_EQ(jsp::dump_json(out), "[1, 1]");
}
