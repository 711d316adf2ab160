#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace jsp {

struct Json;

// Key/value pairs in insertion order.
class JsonObject {
 public:
  using Entry = std::pair<std::string, std::shared_ptr<Json>>;
  using const_iterator = std::vector<Entry>::const_iterator;

  // Replaces the value of an existing key in place, otherwise appends.
  void set(std::string key, std::shared_ptr<Json> value);

  const Json* find(std::string_view key) const;

  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  const_iterator begin() const { return entries_.begin(); }
  const_iterator end() const { return entries_.end(); }

 private:
  std::vector<Entry> entries_;
  std::unordered_map<std::string, size_t> index_;
};

struct Json {
  using Object = JsonObject;
  using Array = std::vector<std::shared_ptr<Json>>;
  using Value = std::variant<std::nullptr_t, bool, int64_t, double, std::string, Array, Object>;

  Value value;

  Json() : value(nullptr) {}
  explicit Json(std::nullptr_t) : value(nullptr) {}
  explicit Json(bool b) : value(b) {}
  explicit Json(int i) : value(static_cast<int64_t>(i)) {}
  explicit Json(int64_t i) : value(i) {}
  explicit Json(double n) : value(n) {}
  explicit Json(std::string s) : value(std::move(s)) {}
  explicit Json(const char* s) : value(std::string(s)) {}
  explicit Json(Array a) : value(std::move(a)) {}
  explicit Json(Object o) : value(std::move(o)) {}

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(value); }
  bool is_bool() const { return std::holds_alternative<bool>(value); }
  bool is_integer() const { return std::holds_alternative<int64_t>(value); }
  bool is_double() const { return std::holds_alternative<double>(value); }
  bool is_number() const { return is_integer() || is_double(); }
  bool is_string() const { return std::holds_alternative<std::string>(value); }
  bool is_array() const { return std::holds_alternative<Array>(value); }
  bool is_object() const { return std::holds_alternative<Object>(value); }

  bool as_bool() const { return std::get<bool>(value); }
  int64_t as_integer() const { return std::get<int64_t>(value); }
  double as_number() const {
    return is_integer() ? static_cast<double>(std::get<int64_t>(value)) : std::get<double>(value);
  }
  const std::string& as_string() const { return std::get<std::string>(value); }
  const Array& as_array() const { return std::get<Array>(value); }
  const Object& as_object() const { return std::get<Object>(value); }
  Array& as_array() { return std::get<Array>(value); }
  Object& as_object() { return std::get<Object>(value); }
};

Json parse_json(std::string_view input);

std::string dump_json(const Json& value);

std::string dump_json(const std::vector<const Json*>& values);

bool json_equal(const Json& lhs, const Json& rhs);

}  // namespace jsp
