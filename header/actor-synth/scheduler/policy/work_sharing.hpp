#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

#include <actor-synth/scheduler/forwards.hpp>
#include <actor-synth/scheduler/job_ptr.hpp>

namespace actor_synth { namespace scheduler {

    /// @brief All threads share one central job queue
    class work_sharing {
    public:
        using queue_type = std::deque<job_ptr>;

        struct coordinator_data {
            template<typename Scheduler>
            explicit coordinator_data(Scheduler*) {}
            queue_type queue;
            std::mutex lock;
            std::condition_variable cv;
        };

        struct worker_data {
            template<typename Scheduler>
            explicit worker_data(Scheduler*) {}
        };

        template<class Coordinator>
        void enqueue(Coordinator* self, job_ptr job) {
            std::unique_lock<std::mutex> guard(cast(self).lock);
            cast(self).queue.push_back(job);
            guard.unlock();
            cast(self).cv.notify_one();
        }

        template<class Coordinator>
        void central_enqueue(Coordinator* self, job_ptr job) {
            enqueue(self, job);
        }

        template<class Worker>
        void external_enqueue(Worker* self, job_ptr job) {
            enqueue(self->parent(), job);
        }

        template<class Worker>
        void resume_job_later(Worker* self, job_ptr job) {
            enqueue(self->parent(), job);
        }

        template<class Worker>
        job_ptr dequeue(Worker* self) {
            auto& parent_data = cast(self->parent());
            std::unique_lock<std::mutex> guard(parent_data.lock);
            parent_data.cv.wait(guard, [&] { return !parent_data.queue.empty(); });
            auto job = parent_data.queue.front();
            parent_data.queue.pop_front();
            return job;
        }

        template<class Coordinator, class UnaryFunction>
        void foreach_central_resumable(Coordinator* self, UnaryFunction f) {
            std::unique_lock<std::mutex> guard(cast(self).lock);
            auto& queue = cast(self).queue;
            while (!queue.empty()) {
                auto job = queue.front();
                queue.pop_front();
                f(job);
            }
        }

    private:
        template<class WorkerOrCoordinator>
        static auto cast(WorkerOrCoordinator* self) -> decltype(self->data()) {
            return self->data();
        }
    };

}} // namespace actor_synth::scheduler
