#include "jsp/cli.hpp"

#include <charconv>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "jsp/error.hpp"
#include "jsp/json.hpp"
#include "jsp/jsonpath.hpp"

namespace jsp {
namespace {

constexpr const char* kUsage = "usage: jsp [-h] [--max-nodes N] JSONPath";

struct Arguments {
  bool help = false;
  std::string path;
  QueryOptions options;
};

std::optional<size_t> parse_count(std::string_view text) {
  size_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size() || text.empty()) {
    return std::nullopt;
  }
  return value;
}

// Returns an error message on bad usage.
std::optional<std::string> parse_arguments(const std::vector<std::string>& args, Arguments& parsed) {
  std::optional<std::string> path;
  bool options_done = false;
  for (size_t i = 0; i < args.size(); ++i) {
    std::string_view arg = args[i];
    if (!options_done && (arg == "-h" || arg == "--help")) {
      parsed.help = true;
      return std::nullopt;
    }
    if (!options_done && arg == "--") {
      options_done = true;
      continue;
    }
    if (!options_done && (arg == "--max-nodes" || arg.rfind("--max-nodes=", 0) == 0)) {
      std::string_view value;
      if (arg == "--max-nodes") {
        if (i + 1 >= args.size()) {
          return std::string("argument --max-nodes: expected one argument");
        }
        value = args[++i];
      } else {
        value = arg.substr(std::string_view("--max-nodes=").size());
      }
      auto count = parse_count(value);
      if (!count) {
        return "argument --max-nodes: invalid count '" + std::string(value) + "'";
      }
      parsed.options.max_nodes = *count;
      continue;
    }
    if (!options_done && arg.size() > 1 && arg[0] == '-') {
      return "unrecognized argument: " + std::string(arg);
    }
    if (path) {
      return "unrecognized argument: " + std::string(arg);
    }
    path = std::string(arg);
  }
  if (!path) {
    return std::string("the following arguments are required: JSONPath");
  }
  parsed.path = std::move(*path);
  return std::nullopt;
}

}  // namespace

int run_cli(const std::vector<std::string>& args, std::istream& in, std::ostream& out,
            std::ostream& err) {
  Arguments parsed;
  if (auto usage_error = parse_arguments(args, parsed)) {
    err << kUsage << "\n";
    err << "jsp: error: " << *usage_error << std::endl;
    return 2;
  }
  if (parsed.help) {
    out << kUsage << "\n\n"
        << "Evaluates a JSONPath expression against the JSON document on standard input.\n\n"
        << "positional arguments:\n"
        << "  JSONPath         path expression, starting with '$'\n\n"
        << "options:\n"
        << "  -h, --help       show this help message and exit\n"
        << "  --max-nodes N    limit nodes visited by each '..' segment (0: no limit)"
        << std::endl;
    return 0;
  }

  std::string input((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  try {
    Json data = parse_json(input);
    auto results = query(data, parsed.path, parsed.options);
    out << dump_json(results) << std::endl;
  } catch (const JsonError& e) {
    out << "ERROR: invalid JSON input: " << e.what() << std::endl;
    return 1;
  } catch (const Error& e) {
    out << "ERROR: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}

}  // namespace jsp
