/**
 * ext2vm - Quadratic extension procedure runner
 *
 * Applies one extension-field procedure to an operand stack loaded from a
 * JSON inputs file and prints (and optionally writes) the resulting stack.
 *
 * Usage:
 *   ./ext2vm mul --input mul.inputs --output mul.outputs
 *   ./ext2vm ext2::mul_base --input scale.inputs
 *   ./ext2vm --list
 *
 * --cross-term is accepted only for mul.
 *
 * An inputs file holding a "stacks" array is run as a batch, one
 * independent stack per entry.
 *
 * Environment Variables:
 *   EXT2VM_DEBUG   - Trace each procedure call to stderr
 *   EXT2VM_PROFILE - Print timing
 *   EXT2VM_THREADS - Number of OpenMP threads for batch runs (default: auto)
 */

#include <iostream>
#include <string>
#include <vector>

#include "cli/cli.hpp"

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    return ext2vm::cli::run(argv[0], args, std::cout, std::cerr);
}
