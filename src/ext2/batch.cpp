#include "ext2/batch.hpp"
#include "common/debug_control.hpp"
#include <chrono>
#include <cstdlib>
#include <string>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace ext2vm {
namespace ext2 {

void run_batch(Procedure procedure, std::vector<OpStack>& stacks, CrossTerm cross_term) {
    const ProcedureInfo& info = procedure_info(procedure);
    const size_t count = stacks.size();
    auto start = std::chrono::high_resolution_clock::now();

    // 1 = stack too shallow; skipped so the parallel loop never throws
    std::vector<char> underflow(count, 0);

    #pragma omp parallel for schedule(static) if(count > PARALLEL_THRESHOLD)
    for (size_t i = 0; i < count; ++i) {
        if (stacks[i].size() < info.num_inputs) {
            underflow[i] = 1;
            continue;
        }
        execute(procedure, stacks[i], cross_term);
    }

    auto end = std::chrono::high_resolution_clock::now();
    EXT2VM_PROFILE_PRINT("[batch] ext2::%s over %zu stacks: %.3f ms\n", info.name, count,
                         std::chrono::duration<double, std::milli>(end - start).count());

    for (size_t i = 0; i < count; ++i) {
        if (underflow[i]) {
            throw StackUnderflowError("Batch stack " + std::to_string(i) + " underflow: ext2::" +
                                      info.name + " requires " + std::to_string(info.num_inputs) +
                                      ", have " + std::to_string(stacks[i].size()));
        }
    }
}

int configure_threads_from_env() {
#ifdef _OPENMP
    const char* threads_env = std::getenv("EXT2VM_THREADS");
    if (threads_env) {
        int threads = std::atoi(threads_env);
        if (threads > 0) {
            omp_set_num_threads(threads);
        }
    }
    return omp_get_max_threads();
#else
    return 1;
#endif
}

} // namespace ext2
} // namespace ext2vm
