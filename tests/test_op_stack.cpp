#include <gtest/gtest.h>
#include "vm/op_stack.hpp"

using namespace ext2vm;

class OpStackTest : public ::testing::Test {};

TEST_F(OpStackTest, PushPop) {
    OpStack stack;
    stack.push(BFieldElement(1));
    stack.push(BFieldElement(2));
    EXPECT_EQ(stack.size(), 2u);
    EXPECT_EQ(stack.pop().value(), 2ULL);
    EXPECT_EQ(stack.pop().value(), 1ULL);
    EXPECT_TRUE(stack.empty());
}

TEST_F(OpStackTest, FromTopFirst) {
    auto stack = OpStack::from_top_first(std::vector<uint64_t>{5, 3, 2, 7});
    EXPECT_EQ(stack.peek_at(0).value(), 5ULL);
    EXPECT_EQ(stack.peek_at(3).value(), 7ULL);

    auto words = stack.to_top_first();
    ASSERT_EQ(words.size(), 4u);
    EXPECT_EQ(words[1].value(), 3ULL);
    EXPECT_EQ(stack.to_string(), "[5, 3, 2, 7]");
}

TEST_F(OpStackTest, PopManyReturnsTopFirst) {
    auto stack = OpStack::from_top_first(std::vector<uint64_t>{1, 2, 3, 4, 5});
    auto popped = stack.pop(3);
    ASSERT_EQ(popped.size(), 3u);
    EXPECT_EQ(popped[0].value(), 1ULL);
    EXPECT_EQ(popped[2].value(), 3ULL);
    EXPECT_EQ(stack, OpStack::from_top_first(std::vector<uint64_t>{4, 5}));
}

TEST_F(OpStackTest, UnderflowThrowsAndLeavesStack) {
    auto stack = OpStack::from_top_first(std::vector<uint64_t>{1, 2});
    auto before = stack;

    try {
        stack.pop(3);
        FAIL() << "expected StackUnderflowError";
    } catch (const StackUnderflowError& e) {
        EXPECT_EQ(e.required(), 3u);
        EXPECT_EQ(e.available(), 2u);
    }
    EXPECT_EQ(stack, before);

    EXPECT_THROW(stack.peek_at(2), StackUnderflowError);
    OpStack empty;
    EXPECT_THROW(empty.pop(), StackUnderflowError);
}
