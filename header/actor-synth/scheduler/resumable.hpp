#pragma once

#include <cstddef>

namespace actor_synth { namespace scheduler {

    enum class resume_result {
        /// more work pending, enqueue again
        resume,
        /// mailbox empty, the next push schedules the job
        awaiting,
        /// the job terminated
        done,
        /// the executing thread must exit
        shutdown
    };

    struct resume_info {
        resume_result result;
        std::size_t messages_processed;

        resume_info() noexcept
            : result(resume_result::done)
            , messages_processed(0) {
        }

        resume_info(resume_result r, std::size_t processed = 0) noexcept
            : result(r)
            , messages_processed(processed) {
        }

        operator resume_result() const noexcept {
            return result;
        }
    };

}} // namespace actor_synth::scheduler
