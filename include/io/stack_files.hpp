#pragma once

#include "vm/op_stack.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ext2vm {
namespace io {

/**
 * JSON stack files.
 *
 * Inputs file:  { "stack_init": ["3", "5", ...] }
 * Outputs file: { "stack": ["41", "1", ...] }
 * Batch file:   { "stacks": [["5", "3", ...], ...] }  (inputs and outputs)
 *
 * Values are listed top first, as decimal strings or unsigned integers, and
 * must be canonical field elements (< p).
 */

/**
 * Parse a JSON array of stack values. `context` names the source in errors.
 */
OpStack parse_stack(const nlohmann::json& values, const std::string& context);

/**
 * Serialize a stack as a JSON array of decimal strings, top first.
 */
nlohmann::json stack_to_json(const OpStack& stack);

OpStack read_inputs(const std::string& path);
OpStack read_outputs(const std::string& path);
void write_outputs(const OpStack& stack, const std::string& path);

/**
 * Contents of an inputs file: one stack ("stack_init") or a batch ("stacks").
 */
struct InputsFile {
    std::vector<OpStack> stacks;
    bool batch = false;
};

/**
 * Read either inputs form, parsing the file once.
 */
InputsFile read_inputs_file(const std::string& path);

std::vector<OpStack> read_batch_inputs(const std::string& path);
void write_batch_outputs(const std::vector<OpStack>& stacks, const std::string& path);

/**
 * Resolve the inputs path: the explicit path if given, otherwise
 * "<procedure>.inputs" in the working directory if that file exists.
 */
std::optional<std::string> resolve_inputs_path(const std::optional<std::string>& explicit_path,
                                               const std::string& procedure_name);

} // namespace io
} // namespace ext2vm
