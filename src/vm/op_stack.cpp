#include "vm/op_stack.hpp"
#include <sstream>

namespace ext2vm {

OpStack OpStack::from_top_first(const std::vector<BFieldElement>& values) {
    OpStack stack;
    stack.stack_.assign(values.rbegin(), values.rend());
    return stack;
}

OpStack OpStack::from_top_first(const std::vector<uint64_t>& values) {
    OpStack stack;
    stack.stack_.reserve(values.size());
    for (auto it = values.rbegin(); it != values.rend(); ++it) {
        stack.stack_.push_back(BFieldElement(*it));
    }
    return stack;
}

void OpStack::ensure_depth(size_t required) const {
    if (stack_.size() < required) {
        throw StackUnderflowError(required, stack_.size());
    }
}

void OpStack::push(BFieldElement value) {
    stack_.push_back(value);
}

std::vector<BFieldElement> OpStack::pop(size_t n) {
    ensure_depth(n);

    std::vector<BFieldElement> result(stack_.rbegin(), stack_.rbegin() + static_cast<long>(n));
    stack_.resize(stack_.size() - n);
    return result;
}

BFieldElement OpStack::pop() {
    ensure_depth(1);
    BFieldElement value = stack_.back();
    stack_.pop_back();
    return value;
}

BFieldElement OpStack::peek_at(size_t depth) const {
    ensure_depth(depth + 1);
    return stack_[stack_.size() - 1 - depth];
}

std::vector<BFieldElement> OpStack::to_top_first() const {
    return std::vector<BFieldElement>(stack_.rbegin(), stack_.rend());
}

std::string OpStack::to_string() const {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < stack_.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << stack_[stack_.size() - 1 - i];
    }
    oss << "]";
    return oss.str();
}

} // namespace ext2vm
