#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include <actor-synth/scheduler/job_ptr.hpp>
#include <actor-synth/scheduler/worker.hpp>

namespace actor_synth { namespace scheduler {

    /// @brief Thread pool whose job distribution is decided by Policy
    template<class Policy>
    class scheduler_t {
    public:
        using policy_data = typename Policy::coordinator_data;
        using worker_type = worker<Policy>;

        scheduler_t(std::size_t num_worker_threads, std::size_t max_throughput_param)
            : max_throughput_(std::max<std::size_t>(max_throughput_param, 1))
            , num_workers_(std::max<std::size_t>(num_worker_threads, 1))
            , data_(this) {
        }

        scheduler_t(const scheduler_t&) = delete;
        scheduler_t& operator=(const scheduler_t&) = delete;

        ~scheduler_t() {
            stop();
        }

        inline std::size_t max_throughput() const {
            return max_throughput_;
        }

        inline std::size_t num_workers() const {
            return num_workers_;
        }

        worker_type* worker_by_id(std::size_t x) {
            return workers_[x].get();
        }

        policy_data& data() {
            return data_;
        }

        void start() {
            if (started_.exchange(true)) {
                return;
            }
            typename worker_type::policy_data init{this};
            workers_.reserve(num_workers_);

            for (std::size_t i = 0; i < num_workers_; ++i) {
                workers_.emplace_back(new worker_type(this, init, max_throughput_));
            }

            for (auto& w : workers_) {
                w->start();
            }
        }

        /// @brief Lets every thread finish its current job, then joins them
        ///
        /// Jobs still queued are dropped; job_ptr does not own its target.
        void stop() {
            if (!started_.load() || stopped_.exchange(true)) {
                return;
            }

            class shutdown_helper {
            public:
                resume_info resume(std::size_t) {
                    std::unique_lock<std::mutex> guard(mtx);
                    ++completed_count;
                    cv.notify_all();
                    return resume_info(resume_result::shutdown, 0);
                }

                void wait_for_completion() {
                    std::unique_lock<std::mutex> guard(mtx);
                    cv.wait(guard, [this] { return completed_count > 0; });
                    --completed_count;
                }

                std::mutex mtx;
                std::condition_variable cv;
                std::size_t completed_count = 0;
            };

            shutdown_helper sh;
            std::set<worker_type*> alive_workers;
            for (std::size_t i = 0; i < workers_.size(); ++i) {
                alive_workers.insert(worker_by_id(i));
            }
            while (!alive_workers.empty()) {
                auto it = alive_workers.begin();
                (*it)->external_enqueue(job_ptr::make(&sh));
                sh.wait_for_completion();
                alive_workers.erase(it);
            }

            for (auto& w : workers_) {
                w->get_thread().join();
            }

            policy_.foreach_central_resumable(this, [](job_ptr) {});
        }

        void enqueue(job_ptr job) {
            policy_.central_enqueue(this, job);
        }

        template<typename T>
        void enqueue(T* resumable) {
            enqueue(job_ptr::make(resumable));
        }

    private:
        std::size_t max_throughput_;
        std::size_t num_workers_;
        std::atomic<bool> started_{false};
        std::atomic<bool> stopped_{false};
        std::vector<std::unique_ptr<worker_type>> workers_;
        policy_data data_;
        Policy policy_;
    };

}} // namespace actor_synth::scheduler
