#pragma once

#include "types/b_field_element.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace ext2vm {

/**
 * Raised when an operation needs more words than the stack holds.
 * The stack is left unchanged.
 */
class StackUnderflowError : public std::runtime_error {
public:
    StackUnderflowError(size_t required, size_t available)
        : std::runtime_error("OpStack underflow: required " + std::to_string(required) +
                             ", have " + std::to_string(available)),
          required_(required), available_(available) {}

    explicit StackUnderflowError(const std::string& message)
        : std::runtime_error(message), required_(0), available_(0) {}

    size_t required() const { return required_; }
    size_t available() const { return available_; }

private:
    size_t required_;
    size_t available_;
};

/**
 * OpStack - Operand stack of BFieldElements
 *
 * Depth 0 is the top. Procedures only touch a fixed-size prefix; everything
 * below it is left in place.
 */
class OpStack {
public:
    OpStack() = default;

    /**
     * Build a stack from values listed top first.
     */
    static OpStack from_top_first(const std::vector<BFieldElement>& values);
    static OpStack from_top_first(const std::vector<uint64_t>& values);

    /**
     * Push a value onto the stack
     */
    void push(BFieldElement value);

    /**
     * Pop n words from the stack, returned top first
     */
    std::vector<BFieldElement> pop(size_t n);

    /**
     * Pop a single word
     */
    BFieldElement pop();

    /**
     * Peek at element at depth (0 = top)
     */
    BFieldElement peek_at(size_t depth) const;

    /**
     * Throw StackUnderflowError unless at least `required` words are present
     */
    void ensure_depth(size_t required) const;

    size_t size() const { return stack_.size(); }
    bool empty() const { return stack_.empty(); }

    /**
     * All elements, top first (for output files and tracing)
     */
    std::vector<BFieldElement> to_top_first() const;

    bool operator==(const OpStack& rhs) const { return stack_ == rhs.stack_; }
    bool operator!=(const OpStack& rhs) const { return !(*this == rhs); }

    std::string to_string() const;

    void clear() { stack_.clear(); }

private:
    // Bottom first; stack_.back() is the top.
    std::vector<BFieldElement> stack_;
};

} // namespace ext2vm
