#include "ext2/procedures.hpp"
#include "common/debug_control.hpp"
#include <stdexcept>

namespace ext2vm {
namespace ext2 {

namespace {

const std::array<ProcedureInfo, 4> PROCEDURES = {{
    {Procedure::Add, "add", 4, 2},
    {Procedure::Sub, "sub", 4, 2},
    {Procedure::Mul, "mul", 4, 2},
    {Procedure::MulBase, "mul_base", 3, 2},
}};

constexpr const char* MODULE_PREFIX = "ext2::";

} // namespace

const char* cross_term_name(CrossTerm cross_term) {
    switch (cross_term) {
        case CrossTerm::Standard: return "standard";
        case CrossTerm::OmitHighProduct: return "legacy";
    }
    return "unknown";
}

CrossTerm parse_cross_term(const std::string& name) {
    if (name == "standard") return CrossTerm::Standard;
    if (name == "legacy") return CrossTerm::OmitHighProduct;
    throw std::invalid_argument("Unknown cross term '" + name + "', expected standard or legacy");
}

Ext2Words add(BFieldElement a1, BFieldElement a0, BFieldElement b1, BFieldElement b0) {
    return {a1 + b1, a0 + b0};
}

Ext2Words sub(BFieldElement a1, BFieldElement a0, BFieldElement b1, BFieldElement b0) {
    return {a1 - b1, a0 - b0};
}

Ext2Words mul(BFieldElement a1, BFieldElement a0, BFieldElement b1, BFieldElement b0,
              CrossTerm cross_term) {
    const BFieldElement t0 = a0 * b0;
    const BFieldElement t1 = a1 * b1;
    const BFieldElement t2 = (a0 + a1) * (b0 + b1);

    // beta * t1 with beta = -2
    const BFieldElement c0 = t0 - t1.doubled();

    BFieldElement c1 = t2 - t0;
    if (cross_term == CrossTerm::Standard) {
        c1 -= t1;
    }
    return {c1, c0};
}

Ext2Words mul_base(BFieldElement x, BFieldElement a1, BFieldElement a0) {
    return {x * a1, x * a0};
}

const std::array<ProcedureInfo, 4>& procedure_table() {
    return PROCEDURES;
}

const ProcedureInfo& procedure_info(Procedure procedure) {
    for (const auto& info : PROCEDURES) {
        if (info.id == procedure) return info;
    }
    throw std::invalid_argument("Unknown procedure id");
}

const ProcedureInfo& find_procedure(const std::string& name) {
    std::string local = name;
    if (local.rfind(MODULE_PREFIX, 0) == 0) {
        local = local.substr(std::char_traits<char>::length(MODULE_PREFIX));
    }
    for (const auto& info : PROCEDURES) {
        if (local == info.name) return info;
    }
    throw std::invalid_argument("Unknown procedure: " + name);
}

void execute(Procedure procedure, OpStack& stack, CrossTerm cross_term) {
    const ProcedureInfo& info = procedure_info(procedure);
    // Check before popping so a short stack is never partially consumed
    stack.ensure_depth(info.num_inputs);

    const size_t depth_before = stack.size();
    const std::vector<BFieldElement> in = stack.pop(info.num_inputs);

    Ext2Words out;
    switch (procedure) {
        case Procedure::Add:
            out = add(in[0], in[1], in[2], in[3]);
            break;
        case Procedure::Sub:
            out = sub(in[0], in[1], in[2], in[3]);
            break;
        case Procedure::Mul:
            out = mul(in[0], in[1], in[2], in[3], cross_term);
            break;
        case Procedure::MulBase:
            out = mul_base(in[0], in[1], in[2]);
            break;
    }

    stack.push(out.c0);
    stack.push(out.c1);

    EXT2VM_DEBUG_CERR("[ext2::" << info.name << "] depth " << depth_before << " -> "
                      << stack.size() << ", top [" << out.c1 << ", " << out.c0 << "]"
                      << std::endl);
}

} // namespace ext2
} // namespace ext2vm
