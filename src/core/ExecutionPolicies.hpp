#pragma once

/**
 * @file ExecutionPolicies.hpp
 * @brief Policy tags selecting sequential or TBB row-sharded convolution
 */

namespace shake {

struct SequentialPolicy {};

/**
 * @brief Output rows are split across TBB workers; max_threads 0 = TBB default
 */
struct ParallelPolicy {
    int max_threads = 0;
};

} // namespace shake
