#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace ext2vm {
namespace cli {

/**
 * Run the ext2vm command line.
 *
 * `args` excludes the program name. Results go to `out`; usage text and
 * "Error: <message>" lines go to `err`. Returns the process exit status:
 * 0 on success, 1 on any error (exceptions are reported, not propagated).
 */
int run(const std::string& program, const std::vector<std::string>& args,
        std::ostream& out, std::ostream& err);

void print_usage(const std::string& program, std::ostream& err);
void print_procedures(std::ostream& out);

} // namespace cli
} // namespace ext2vm
