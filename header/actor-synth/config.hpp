#pragma once

#include <cstddef>

#if !defined(__cplusplus) || __cplusplus < 202002L
#if !defined(_MSVC_LANG) || _MSVC_LANG < 202002L
#error "actor-synth requires C++20 (-std=c++20)"
#endif
#endif

#define ACTOR_SYNTH_CACHE_LINE_SIZE 64

namespace actor_synth {

    /// @brief Settings consumed by actor_runtime when it starts its scheduler
    struct runtime_config {
        /// Scheduler threads. Zero means one thread per hardware core.
        std::size_t num_worker_threads = 0;
        /// Messages a worker may handle before yielding its thread.
        std::size_t max_throughput = 64;
    };

} // namespace actor_synth
