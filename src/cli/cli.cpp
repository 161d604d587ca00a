#include "cli/cli.hpp"
#include "common/debug_control.hpp"
#include "ext2/batch.hpp"
#include "ext2/procedures.hpp"
#include "io/stack_files.hpp"
#include <chrono>
#include <optional>
#include <stdexcept>

namespace ext2vm {
namespace cli {

namespace {

struct Options {
    std::string procedure_name;
    std::optional<std::string> input_path;
    std::optional<std::string> output_path;
    std::optional<ext2::CrossTerm> cross_term;
};

int run_procedure(const Options& options, std::ostream& out, std::ostream& err) {
    const ext2::ProcedureInfo& info = ext2::find_procedure(options.procedure_name);

    // Only mul has a cross term
    if (options.cross_term && info.id != ext2::Procedure::Mul) {
        throw std::invalid_argument(std::string("--cross-term applies only to ext2::mul, not ext2::") +
                                    info.name);
    }
    const ext2::CrossTerm cross_term = options.cross_term.value_or(ext2::CrossTerm::Standard);

    std::optional<std::string> resolved = io::resolve_inputs_path(options.input_path, info.name);
    if (!resolved) {
        err << "Error: no --input given and `" << info.name << ".inputs` not found" << std::endl;
        return 1;
    }
    io::InputsFile inputs = io::read_inputs_file(*resolved);

    if (inputs.batch) {
        int threads = ext2::configure_threads_from_env();
        EXT2VM_PROFILE_COUT("Batch threads: " << threads << std::endl);

        ext2::run_batch(info.id, inputs.stacks, cross_term);
        out << "Processed " << inputs.stacks.size() << " stacks with ext2::" << info.name << std::endl;

        if (options.output_path) {
            io::write_batch_outputs(inputs.stacks, *options.output_path);
        }
        return 0;
    }

    OpStack& stack = inputs.stacks.front();

    auto start = std::chrono::high_resolution_clock::now();
    ext2::execute(info.id, stack, cross_term);
    auto end = std::chrono::high_resolution_clock::now();
    EXT2VM_PROFILE_COUT("ext2::" << info.name << " ("
                        << ext2::cross_term_name(cross_term) << "): "
                        << (std::chrono::duration<double, std::micro>(end - start).count())
                        << " us" << std::endl);

    out << "Output stack: " << stack.to_string() << std::endl;

    if (options.output_path) {
        io::write_outputs(stack, *options.output_path);
    }
    return 0;
}

int parse_and_run(const std::string& program, const std::vector<std::string>& args,
                  std::ostream& out, std::ostream& err) {
    Options options;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(program, err);
            return 0;
        } else if (arg == "--list") {
            print_procedures(out);
            return 0;
        } else if (arg == "--input") {
            if (i + 1 >= args.size()) {
                err << "Error: --input requires FILE argument" << std::endl;
                return 1;
            }
            options.input_path = args[++i];
        } else if (arg == "--output") {
            if (i + 1 >= args.size()) {
                err << "Error: --output requires FILE argument" << std::endl;
                return 1;
            }
            options.output_path = args[++i];
        } else if (arg == "--cross-term") {
            if (i + 1 >= args.size()) {
                err << "Error: --cross-term requires MODE argument" << std::endl;
                return 1;
            }
            options.cross_term = ext2::parse_cross_term(args[++i]);
        } else if (!arg.empty() && arg[0] == '-') {
            err << "Error: Unknown option: " << arg << std::endl;
            print_usage(program, err);
            return 1;
        } else if (options.procedure_name.empty()) {
            options.procedure_name = arg;
        } else {
            err << "Error: Unexpected argument: " << arg << std::endl;
            return 1;
        }
    }

    if (options.procedure_name.empty()) {
        print_usage(program, err);
        return 1;
    }

    return run_procedure(options, out, err);
}

} // namespace

void print_usage(const std::string& program, std::ostream& err) {
    err << "Usage: " << program << " PROCEDURE [OPTIONS]" << std::endl;
    err << "       " << program << " --list" << std::endl;
    err << std::endl;
    err << "Options:" << std::endl;
    err << "  --input FILE          Inputs file (default: PROCEDURE.inputs if present)" << std::endl;
    err << "  --output FILE         Write the resulting stack(s) to FILE" << std::endl;
    err << "  --cross-term MODE     mul cross term: standard (default) or legacy" << std::endl;
    err << "  --list                List available procedures" << std::endl;
    err << "  --help                Show this help message" << std::endl;
    err << std::endl;
    err << "Environment Variables:" << std::endl;
    err << "  EXT2VM_DEBUG          Trace procedure calls" << std::endl;
    err << "  EXT2VM_PROFILE        Print timing" << std::endl;
    err << "  EXT2VM_THREADS        OpenMP threads for batch inputs" << std::endl;
}

void print_procedures(std::ostream& out) {
    for (const auto& info : ext2::procedure_table()) {
        out << "ext2::" << info.name << "  inputs=" << info.num_inputs
            << " outputs=" << info.num_outputs << std::endl;
    }
}

int run(const std::string& program, const std::vector<std::string>& args,
        std::ostream& out, std::ostream& err) {
    try {
        return parse_and_run(program, args, out, err);
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << std::endl;
        return 1;
    }
}

} // namespace cli
} // namespace ext2vm
