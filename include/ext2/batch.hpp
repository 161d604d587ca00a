#pragma once

#include "ext2/procedures.hpp"
#include "vm/op_stack.hpp"
#include <vector>

namespace ext2vm {
namespace ext2 {

/**
 * Apply one procedure to every stack in `stacks`.
 *
 * Stacks are independent, so the loop runs in parallel under OpenMP once the
 * batch is larger than PARALLEL_THRESHOLD. Stacks too shallow for the
 * procedure are left unchanged; after all others have been processed a
 * StackUnderflowError naming the first such index is thrown.
 */
void run_batch(Procedure procedure, std::vector<OpStack>& stacks,
               CrossTerm cross_term = CrossTerm::Standard);

constexpr size_t PARALLEL_THRESHOLD = 256;

/**
 * Configure the OpenMP thread count from EXT2VM_THREADS, if set.
 * Returns the thread count that batch runs will use (1 without OpenMP).
 */
int configure_threads_from_env();

} // namespace ext2
} // namespace ext2vm
