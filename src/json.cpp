#include "jsp/json.hpp"

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <cstring>

#include "jsp/error.hpp"

namespace jsp {
namespace {

// Nesting cap for arrays and objects. Parsing, writing and destroying a tree
// all recurse once per level, so this also bounds their stack use.
constexpr size_t kMaxDepth = 1000;

class Parser {
 public:
  explicit Parser(std::string_view input) : input_(input), pos_(0), depth_(0) {}

  Json parse() {
    Json value = parse_value();
    skip_ws();
    if (pos_ != input_.size()) {
      throw error("Unexpected trailing characters");
    }
    return value;
  }

 private:
  std::string_view input_;
  size_t pos_;
  size_t depth_;

  class Nested {
   public:
    explicit Nested(Parser& parser) : parser_(parser) {
      if (parser_.depth_ >= kMaxDepth) {
        throw parser_.error("Maximum nesting depth exceeded");
      }
      ++parser_.depth_;
    }
    ~Nested() { --parser_.depth_; }

    Nested(const Nested&) = delete;
    Nested& operator=(const Nested&) = delete;

   private:
    Parser& parser_;
  };

  void skip_ws() {
    while (pos_ < input_.size()) {
      char c = input_[pos_];
      if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
        ++pos_;
      } else {
        break;
      }
    }
  }

  char peek() const {
    if (pos_ >= input_.size()) {
      return '\0';
    }
    return input_[pos_];
  }

  char get() {
    if (pos_ >= input_.size()) {
      throw error("Unexpected end of input");
    }
    return input_[pos_++];
  }

  Json parse_value() {
    skip_ws();
    char c = peek();
    if (c == '{') {
      return parse_object();
    }
    if (c == '[') {
      return parse_array();
    }
    if (c == '"') {
      return Json(parse_string());
    }
    if (c == 't') {
      expect("true");
      return Json(true);
    }
    if (c == 'f') {
      expect("false");
      return Json(false);
    }
    if (c == 'n') {
      expect("null");
      return Json(nullptr);
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
      return parse_number();
    }
    throw error("Invalid JSON value");
  }

  Json parse_object() {
    Nested nested(*this);
    get();
    skip_ws();
    Json::Object obj;
    if (peek() == '}') {
      get();
      return Json(std::move(obj));
    }
    while (true) {
      skip_ws();
      if (peek() != '"') {
        throw error("Expected string key");
      }
      std::string key = parse_string();
      skip_ws();
      if (get() != ':') {
        throw error("Expected ':' after key");
      }
      Json value = parse_value();
      obj.set(std::move(key), std::make_shared<Json>(std::move(value)));
      skip_ws();
      char c = get();
      if (c == '}') {
        break;
      }
      if (c != ',') {
        throw error("Expected ',' or '}' in object");
      }
    }
    return Json(std::move(obj));
  }

  Json parse_array() {
    Nested nested(*this);
    get();
    skip_ws();
    Json::Array arr;
    if (peek() == ']') {
      get();
      return Json(std::move(arr));
    }
    while (true) {
      Json value = parse_value();
      arr.push_back(std::make_shared<Json>(std::move(value)));
      skip_ws();
      char c = get();
      if (c == ']') {
        break;
      }
      if (c != ',') {
        throw error("Expected ',' or ']' in array");
      }
    }
    return Json(std::move(arr));
  }

  void expect(const char* keyword) {
    size_t len = std::strlen(keyword);
    if (input_.substr(pos_, len) != keyword) {
      throw error("Unexpected token");
    }
    pos_ += len;
  }

  uint32_t parse_hex4() {
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
      char c = get();
      value <<= 4;
      if (c >= '0' && c <= '9') {
        value |= static_cast<uint32_t>(c - '0');
      } else if (c >= 'a' && c <= 'f') {
        value |= static_cast<uint32_t>(c - 'a' + 10);
      } else if (c >= 'A' && c <= 'F') {
        value |= static_cast<uint32_t>(c - 'A' + 10);
      } else {
        throw error("Invalid hex escape");
      }
    }
    return value;
  }

  void append_utf8(std::string& out, uint32_t codepoint) const {
    if (codepoint <= 0x7F) {
      out.push_back(static_cast<char>(codepoint));
    } else if (codepoint <= 0x7FF) {
      out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
      out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else if (codepoint <= 0xFFFF) {
      out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
      out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else if (codepoint <= 0x10FFFF) {
      out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
      out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else {
      throw error("Invalid Unicode codepoint");
    }
  }

  std::string parse_string() {
    if (get() != '"') {
      throw error("Expected string");
    }
    std::string out;
    while (true) {
      char c = get();
      if (c == '"') {
        break;
      }
      if (c == '\\') {
        char e = get();
        switch (e) {
          case '"': out.push_back('"'); break;
          case '\\': out.push_back('\\'); break;
          case '/': out.push_back('/'); break;
          case 'b': out.push_back('\b'); break;
          case 'f': out.push_back('\f'); break;
          case 'n': out.push_back('\n'); break;
          case 'r': out.push_back('\r'); break;
          case 't': out.push_back('\t'); break;
          case 'u': {
            uint32_t codepoint = parse_hex4();
            if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
              if (get() != '\\' || get() != 'u') {
                throw error("Invalid surrogate pair");
              }
              uint32_t low = parse_hex4();
              if (low < 0xDC00 || low > 0xDFFF) {
                throw error("Invalid low surrogate");
              }
              codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
            } else if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
              throw error("Unpaired low surrogate");
            }
            append_utf8(out, codepoint);
            break;
          }
          default:
            throw error("Invalid escape sequence");
        }
      } else {
        if (static_cast<unsigned char>(c) < 0x20) {
          throw error("Control character in string");
        }
        out.push_back(c);
      }
    }
    return out;
  }

  Json parse_number() {
    size_t start = pos_;
    bool integral = true;
    if (peek() == '-') {
      ++pos_;
    }
    if (peek() == '0') {
      ++pos_;
    } else {
      if (!std::isdigit(static_cast<unsigned char>(peek()))) {
        throw error("Invalid number");
      }
      while (std::isdigit(static_cast<unsigned char>(peek()))) {
        ++pos_;
      }
    }
    if (peek() == '.') {
      integral = false;
      ++pos_;
      if (!std::isdigit(static_cast<unsigned char>(peek()))) {
        throw error("Invalid number");
      }
      while (std::isdigit(static_cast<unsigned char>(peek()))) {
        ++pos_;
      }
    }
    if (peek() == 'e' || peek() == 'E') {
      integral = false;
      ++pos_;
      if (peek() == '+' || peek() == '-') {
        ++pos_;
      }
      if (!std::isdigit(static_cast<unsigned char>(peek()))) {
        throw error("Invalid number");
      }
      while (std::isdigit(static_cast<unsigned char>(peek()))) {
        ++pos_;
      }
    }

    std::string num_str(input_.substr(start, pos_ - start));
    if (integral) {
      int64_t integer = 0;
      auto [ptr, ec] = std::from_chars(num_str.data(), num_str.data() + num_str.size(), integer);
      if (ec == std::errc() && ptr == num_str.data() + num_str.size()) {
        return Json(integer);
      }
    }
    char* end_ptr = nullptr;
    errno = 0;
    double value = std::strtod(num_str.c_str(), &end_ptr);
    if (end_ptr == num_str.c_str() || (errno == ERANGE && std::isinf(value))) {
      throw error("Invalid number");
    }
    return Json(value);
  }

  JsonError error(const char* message) const {
    return JsonError(message, pos_);
  }
};

class Writer {
 public:
  std::string take() { return std::move(out_); }

  void write(const Json& value) {
    if (value.is_null()) {
      out_ += "null";
    } else if (value.is_bool()) {
      out_ += value.as_bool() ? "true" : "false";
    } else if (value.is_integer()) {
      out_ += std::to_string(value.as_integer());
    } else if (value.is_double()) {
      write_double(value.as_number());
    } else if (value.is_string()) {
      write_string(value.as_string());
    } else if (value.is_array()) {
      out_.push_back('[');
      bool first = true;
      for (const auto& item : value.as_array()) {
        if (!first) {
          out_ += ", ";
        }
        first = false;
        write(*item);
      }
      out_.push_back(']');
    } else {
      out_.push_back('{');
      bool first = true;
      for (const auto& [key, item] : value.as_object()) {
        if (!first) {
          out_ += ", ";
        }
        first = false;
        write_string(key);
        out_ += ": ";
        write(*item);
      }
      out_.push_back('}');
    }
  }

  void write_list(const std::vector<const Json*>& values) {
    out_.push_back('[');
    for (size_t i = 0; i < values.size(); ++i) {
      if (i > 0) {
        out_ += ", ";
      }
      write(*values[i]);
    }
    out_.push_back(']');
  }

 private:
  std::string out_;

  void write_double(double value) {
    if (std::isnan(value)) {
      out_ += "NaN";
      return;
    }
    if (std::isinf(value)) {
      out_ += value < 0 ? "-Infinity" : "Infinity";
      return;
    }
    // Shortest round-trip digits, positional for decimal exponents in
    // [-4, 16) and scientific otherwise.
    char buf[32];
    auto [sci_end, sci_ec] = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::scientific);
    if (sci_ec != std::errc()) {
      throw InternalError("double does not fit the formatting buffer");
    }
    std::string_view sci(buf, static_cast<size_t>(sci_end - buf));
    int exponent = decimal_exponent(sci);
    if (exponent < -4 || exponent >= 16) {
      out_ += sci;
      return;
    }
    auto [fixed_end, fixed_ec] = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed);
    if (fixed_ec != std::errc()) {
      throw InternalError("double does not fit the formatting buffer");
    }
    std::string text(buf, fixed_end);
    if (text.find('.') == std::string::npos) {
      text += ".0";
    }
    out_ += text;
  }

  static int decimal_exponent(std::string_view scientific) {
    size_t e = scientific.find('e');
    if (e == std::string_view::npos || e + 2 > scientific.size()) {
      throw InternalError("scientific notation without an exponent");
    }
    size_t digits = e + 1;
    bool negative = scientific[digits] == '-';
    if (scientific[digits] == '+' || negative) {
      ++digits;
    }
    int exponent = 0;
    auto [ptr, ec] = std::from_chars(scientific.data() + digits, scientific.data() + scientific.size(), exponent);
    if (ec != std::errc() || ptr != scientific.data() + scientific.size()) {
      throw InternalError("malformed exponent in scientific notation");
    }
    return negative ? -exponent : exponent;
  }

  void write_escape(uint32_t unit) {
    static const char kHex[] = "0123456789abcdef";
    out_ += "\\u";
    for (int shift = 12; shift >= 0; shift -= 4) {
      out_.push_back(kHex[(unit >> shift) & 0xF]);
    }
  }

  // Decodes one UTF-8 sequence starting at i; malformed bytes map to U+FFFD.
  static uint32_t next_codepoint(const std::string& s, size_t& i) {
    unsigned char lead = static_cast<unsigned char>(s[i++]);
    size_t extra = 0;
    uint32_t codepoint = 0;
    if (lead < 0x80) {
      return lead;
    } else if ((lead & 0xE0) == 0xC0) {
      extra = 1;
      codepoint = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      extra = 2;
      codepoint = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      extra = 3;
      codepoint = lead & 0x07;
    } else {
      return 0xFFFD;
    }
    for (size_t k = 0; k < extra; ++k) {
      if (i >= s.size() || (static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) {
        return 0xFFFD;
      }
      codepoint = (codepoint << 6) | (static_cast<unsigned char>(s[i++]) & 0x3F);
    }
    return codepoint;
  }

  void write_string(const std::string& s) {
    out_.push_back('"');
    size_t i = 0;
    while (i < s.size()) {
      uint32_t c = next_codepoint(s, i);
      switch (c) {
        case '"': out_ += "\\\""; break;
        case '\\': out_ += "\\\\"; break;
        case '\b': out_ += "\\b"; break;
        case '\f': out_ += "\\f"; break;
        case '\n': out_ += "\\n"; break;
        case '\r': out_ += "\\r"; break;
        case '\t': out_ += "\\t"; break;
        default:
          if (c < 0x20 || (c >= 0x7F && c <= 0xFFFF)) {
            write_escape(c);
          } else if (c > 0xFFFF) {
            uint32_t v = c - 0x10000;
            write_escape(0xD800 + (v >> 10));
            write_escape(0xDC00 + (v & 0x3FF));
          } else {
            out_.push_back(static_cast<char>(c));
          }
      }
    }
    out_.push_back('"');
  }
};

bool json_equal_impl(const Json& lhs, const Json& rhs) {
  if (lhs.is_number() && rhs.is_number()) {
    if (lhs.is_integer() && rhs.is_integer()) {
      return lhs.as_integer() == rhs.as_integer();
    }
    return lhs.as_number() == rhs.as_number();
  }
  if (lhs.value.index() != rhs.value.index()) {
    return false;
  }
  if (lhs.is_null()) {
    return true;
  }
  if (lhs.is_bool()) {
    return lhs.as_bool() == rhs.as_bool();
  }
  if (lhs.is_string()) {
    return lhs.as_string() == rhs.as_string();
  }
  if (lhs.is_array()) {
    const auto& a = lhs.as_array();
    const auto& b = rhs.as_array();
    if (a.size() != b.size()) {
      return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
      if (!json_equal_impl(*a[i], *b[i])) {
        return false;
      }
    }
    return true;
  }
  const auto& a = lhs.as_object();
  const auto& b = rhs.as_object();
  if (a.size() != b.size()) {
    return false;
  }
  for (const auto& [key, value] : a) {
    const Json* other = b.find(key);
    if (other == nullptr || !json_equal_impl(*value, *other)) {
      return false;
    }
  }
  return true;
}

}  // namespace

void JsonObject::set(std::string key, std::shared_ptr<Json> value) {
  auto it = index_.find(key);
  if (it != index_.end()) {
    entries_[it->second].second = std::move(value);
    return;
  }
  index_.emplace(key, entries_.size());
  entries_.emplace_back(std::move(key), std::move(value));
}

const Json* JsonObject::find(std::string_view key) const {
  auto it = index_.find(std::string(key));
  if (it == index_.end()) {
    return nullptr;
  }
  return entries_[it->second].second.get();
}

Json parse_json(std::string_view input) {
  Parser parser(input);
  return parser.parse();
}

std::string dump_json(const Json& value) {
  Writer writer;
  writer.write(value);
  return writer.take();
}

std::string dump_json(const std::vector<const Json*>& values) {
  Writer writer;
  writer.write_list(values);
  return writer.take();
}

bool json_equal(const Json& lhs, const Json& rhs) {
  return json_equal_impl(lhs, rhs);
}

}  // namespace jsp
