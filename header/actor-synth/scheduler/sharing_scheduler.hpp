#pragma once

#include <actor-synth/scheduler/policy/work_sharing.hpp>
#include <actor-synth/scheduler/scheduler.hpp>

namespace actor_synth { namespace scheduler {

    using sharing_scheduler = scheduler_t<work_sharing>;

}} // namespace actor_synth::scheduler
