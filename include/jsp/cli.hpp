#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace jsp {

// `jsp [-h] [--max-nodes N] JSONPath`: reads a JSON document from `in`,
// prints the matches as a JSON array to `out`, or an `ERROR:` line to `out`
// on a bad path or bad input. Usage errors go to `err`. Returns the process
// exit code: 0 on success, 1 on a bad path or bad input, 2 on bad usage.
// `args` excludes the program name.
int run_cli(const std::vector<std::string>& args, std::istream& in, std::ostream& out,
            std::ostream& err);

}  // namespace jsp
