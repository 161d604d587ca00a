#include "io/stack_files.hpp"
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace ext2vm {
namespace io {

namespace {

uint64_t parse_decimal(const std::string& text, const std::string& context) {
    if (text.empty() || text.size() > 20) {
        throw std::runtime_error(context + ": invalid stack value '" + text + "'");
    }
    for (char ch : text) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            throw std::runtime_error(context + ": invalid stack value '" + text + "'");
        }
    }
    try {
        return std::stoull(text, nullptr, 10);
    } catch (const std::out_of_range&) {
        throw std::runtime_error(context + ": stack value out of range '" + text + "'");
    }
}

nlohmann::json load_json(const std::string& path, const std::string& kind) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open " + kind + " file `" + path + "`");
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to deserialize " + kind + " data from `" + path +
                                 "` - " + e.what());
    }
}

void save_json(const nlohmann::json& json, const std::string& path) {
    std::cout << "Creating output file `" << path << "`" << std::endl;

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create output file `" + path + "`");
    }
    file << json.dump(2) << std::endl;
    if (!file) {
        throw std::runtime_error("Failed to write output data to `" + path + "`");
    }
}

OpStack read_stack_field(const std::string& path, const std::string& kind,
                         const std::string& field) {
    std::cout << "Reading " << kind << " file `" << path << "`" << std::endl;
    nlohmann::json json = load_json(path, kind);
    if (!json.is_object() || !json.contains(field)) {
        throw std::runtime_error(kind + " file `" + path + "` missing '" + field + "' field");
    }
    return parse_stack(json[field], path + ": " + field);
}

} // namespace

OpStack parse_stack(const nlohmann::json& values, const std::string& context) {
    if (!values.is_array()) {
        throw std::runtime_error(context + ": expected an array of stack values");
    }

    std::vector<BFieldElement> top_first;
    top_first.reserve(values.size());
    for (const auto& entry : values) {
        uint64_t value = 0;
        if (entry.is_string()) {
            value = parse_decimal(entry.get<std::string>(), context);
        } else if (entry.is_number_unsigned()) {
            value = entry.get<uint64_t>();
        } else {
            throw std::runtime_error(context + ": invalid stack value " + entry.dump());
        }
        if (!BFieldElement::is_canonical(value)) {
            throw std::runtime_error(context + ": stack value " + std::to_string(value) +
                                     " is not a field element");
        }
        top_first.push_back(BFieldElement(value));
    }
    return OpStack::from_top_first(top_first);
}

nlohmann::json stack_to_json(const OpStack& stack) {
    nlohmann::json values = nlohmann::json::array();
    for (const auto& word : stack.to_top_first()) {
        values.push_back(word.to_string());
    }
    return values;
}

OpStack read_inputs(const std::string& path) {
    return read_stack_field(path, "input", "stack_init");
}

OpStack read_outputs(const std::string& path) {
    return read_stack_field(path, "output", "stack");
}

void write_outputs(const OpStack& stack, const std::string& path) {
    nlohmann::json json;
    json["stack"] = stack_to_json(stack);
    save_json(json, path);
}

InputsFile read_inputs_file(const std::string& path) {
    std::cout << "Reading input file `" << path << "`" << std::endl;
    nlohmann::json json = load_json(path, "input");
    if (!json.is_object()) {
        throw std::runtime_error("input file `" + path + "` is not a JSON object");
    }

    InputsFile inputs;
    if (json.contains("stacks")) {
        const nlohmann::json& entries = json["stacks"];
        if (!entries.is_array()) {
            throw std::runtime_error("input file `" + path + "` 'stacks' is not an array");
        }
        inputs.batch = true;
        inputs.stacks.reserve(entries.size());
        for (size_t i = 0; i < entries.size(); ++i) {
            inputs.stacks.push_back(parse_stack(entries[i], path + ": stacks[" + std::to_string(i) + "]"));
        }
    } else if (json.contains("stack_init")) {
        inputs.stacks.push_back(parse_stack(json["stack_init"], path + ": stack_init"));
    } else {
        throw std::runtime_error("input file `" + path + "` missing 'stack_init' or 'stacks' field");
    }
    return inputs;
}

std::vector<OpStack> read_batch_inputs(const std::string& path) {
    InputsFile inputs = read_inputs_file(path);
    if (!inputs.batch) {
        throw std::runtime_error("input file `" + path + "` missing 'stacks' array");
    }
    return std::move(inputs.stacks);
}

void write_batch_outputs(const std::vector<OpStack>& stacks, const std::string& path) {
    nlohmann::json json;
    json["stacks"] = nlohmann::json::array();
    for (const auto& stack : stacks) {
        json["stacks"].push_back(stack_to_json(stack));
    }
    save_json(json, path);
}

std::optional<std::string> resolve_inputs_path(const std::optional<std::string>& explicit_path,
                                               const std::string& procedure_name) {
    if (explicit_path) {
        return explicit_path;
    }
    std::string fallback = procedure_name + ".inputs";
    if (std::filesystem::exists(fallback)) {
        return fallback;
    }
    return std::nullopt;
}

} // namespace io
} // namespace ext2vm
