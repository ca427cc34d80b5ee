#pragma once

#include <cstddef>

namespace actor_synth { namespace scheduler {

    struct job_ptr;

    template<class Policy>
    class scheduler_t;

    template<class Policy>
    class worker;

    class work_sharing;

}} // namespace actor_synth::scheduler
