#pragma once

#include "types/b_field_element.hpp"
#include "vm/op_stack.hpp"
#include <array>
#include <string>

namespace ext2vm {
namespace ext2 {

/**
 * Cross term of the three-multiplication product.
 *
 * Standard:        c1 = (a0+a1)(b0+b1) - a0*b0 - a1*b1  (the extension product)
 * OmitHighProduct: c1 = (a0+a1)(b0+b1) - a0*b0           (legacy host routine)
 *
 * OmitHighProduct is not a ring multiplication; it exists so that traces of
 * hosts running the legacy routine can be reproduced exactly.
 */
enum class CrossTerm { Standard, OmitHighProduct };

const char* cross_term_name(CrossTerm cross_term);
CrossTerm parse_cross_term(const std::string& name);

/**
 * Two-word procedure result, in stack order: c1 on top, c0 below.
 */
struct Ext2Words {
    BFieldElement c1;
    BFieldElement c0;

    bool operator==(const Ext2Words& rhs) const { return c1 == rhs.c1 && c0 == rhs.c0; }
    bool operator!=(const Ext2Words& rhs) const { return !(*this == rhs); }
};

// Stack prefix transforms. Parameters are listed top first, exactly as the
// words sit on the operand stack: [a1, a0, b1, b0, ...] and [x, a1, a0, ...].

// [a1, a0, b1, b0] -> [a1+b1, a0+b0]
Ext2Words add(BFieldElement a1, BFieldElement a0, BFieldElement b1, BFieldElement b0);

// [a1, a0, b1, b0] -> [a1-b1, a0-b0]
Ext2Words sub(BFieldElement a1, BFieldElement a0, BFieldElement b1, BFieldElement b0);

// [a1, a0, b1, b0] -> [c1, c0] with c = a*b, using three base multiplications
Ext2Words mul(BFieldElement a1, BFieldElement a0, BFieldElement b1, BFieldElement b0,
              CrossTerm cross_term = CrossTerm::Standard);

// [x, a1, a0] -> [x*a1, x*a0]
Ext2Words mul_base(BFieldElement x, BFieldElement a1, BFieldElement a0);

enum class Procedure { Add, Sub, Mul, MulBase };

struct ProcedureInfo {
    Procedure id;
    const char* name;
    size_t num_inputs;
    size_t num_outputs;
};

/**
 * Static table of all procedures, in declaration order.
 */
const std::array<ProcedureInfo, 4>& procedure_table();

const ProcedureInfo& procedure_info(Procedure procedure);

/**
 * Look up a procedure by name ("mul" or "ext2::mul").
 * Throws std::invalid_argument for unknown names.
 */
const ProcedureInfo& find_procedure(const std::string& name);

/**
 * Apply a procedure to the top of the stack: pop its inputs, push its outputs.
 * Throws StackUnderflowError, leaving the stack untouched, if the stack is
 * too shallow.
 */
void execute(Procedure procedure, OpStack& stack, CrossTerm cross_term = CrossTerm::Standard);

} // namespace ext2
} // namespace ext2vm
