#pragma once

#include <cstddef>
#include <thread>

#include <actor-synth/scheduler/forwards.hpp>
#include <actor-synth/scheduler/job_ptr.hpp>

namespace actor_synth { namespace scheduler {

    /// @brief One scheduler thread: dequeue a job, resume it, repeat
    template<class Policy>
    class worker final {
    public:
        using coordinator_ptr = scheduler_t<Policy>*;
        using policy_data = typename Policy::worker_data;

        worker(coordinator_ptr worker_parent, const policy_data& init, std::size_t throughput)
            : max_throughput_(throughput)
            , parent_(worker_parent)
            , data_(init) {
        }

        worker(const worker&) = delete;
        worker& operator=(const worker&) = delete;

        void start() {
            this_thread_ = std::thread([this] { run(); });
        }

        void external_enqueue(job_ptr job) {
            policy_.external_enqueue(this, job);
        }

        std::thread& get_thread() noexcept {
            return this_thread_;
        }

        coordinator_ptr parent() noexcept {
            return parent_;
        }

        policy_data& data() noexcept {
            return data_;
        }

    private:
        void run() {
            for (;;) {
                auto job = policy_.dequeue(this);
                auto res = job.resume(max_throughput_);
                switch (res.result) {
                    case resume_result::resume:
                        policy_.resume_job_later(this, job);
                        break;
                    case resume_result::done:
                    case resume_result::awaiting:
                        break;
                    case resume_result::shutdown:
                        return;
                }
            }
        }

        std::size_t max_throughput_;
        coordinator_ptr parent_;
        policy_data data_;
        Policy policy_;
        std::thread this_thread_;
    };

}} // namespace actor_synth::scheduler
