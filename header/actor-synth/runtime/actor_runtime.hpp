#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include <actor-synth/config.hpp>
#include <actor-synth/detail/actor_core.hpp>
#include <actor-synth/detail/intrusive_ptr.hpp>
#include <actor-synth/log.hpp>
#include <actor-synth/runtime/actor_handle.hpp>
#include <actor-synth/runtime/actor_worker.hpp>
#include <actor-synth/scheduler/job_ptr.hpp>
#include <actor-synth/scheduler/sharing_scheduler.hpp>

namespace actor_synth {

    /// @brief Registry of running actors on top of one scheduler
    ///
    /// The runtime owns every worker it spawned. A worker is destroyed by
    /// collect() once it finished, or by shutdown(), which closes all
    /// mailboxes, drops queued messages and joins the scheduler.
    template<class Scheduler>
    class basic_actor_runtime final {
    public:
        using scheduler_type = Scheduler;

        explicit basic_actor_runtime(runtime_config config = runtime_config{})
            : config_(config)
            , scheduler_(resolve_workers(config.num_worker_threads), config.max_throughput) {
            scheduler_.start();
            log::debug("runtime started: {} worker thread(s), max throughput {}",
                       resolve_workers(config.num_worker_threads), config.max_throughput);
        }

        basic_actor_runtime(const basic_actor_runtime&) = delete;
        basic_actor_runtime& operator=(const basic_actor_runtime&) = delete;

        ~basic_actor_runtime() {
            shutdown();
        }

        /// @brief Creates the mailbox, binds a new Processor to it and schedules the worker
        ///
        /// After shutdown() the returned handle is closed: every call fails with send_failed.
        template<class Processor, class Message, class... Args>
        actor_handle<Message> spawn(Args&&... args) {
            using worker_type = actor_worker<Processor, Message>;

            std::unique_lock<std::mutex> guard(mutex_);
            auto core = detail::make_counted<detail::actor_core<Message>>(++last_id_);
            if (shut_down_) {
                guard.unlock();
                core->mailbox().close();
                log::warn("spawn after shutdown: actor {} is closed", core->id());
                return actor_handle<Message>(std::move(core));
            }

            auto worker = std::make_unique<worker_type>(core, std::forward<Args>(args)...);
            auto* raw = worker.get();
            core->attach(&scheduler_, scheduler::job_ptr::make(raw));
            workers_.emplace(core->id(), std::move(worker));
            guard.unlock();

            log::debug("spawned actor {}", core->id());
            actor_handle<Message> handle(std::move(core));
            scheduler_.enqueue(raw);
            return handle;
        }

        /// @brief Destroys finished workers
        /// @return number of workers removed
        std::size_t collect() {
            std::lock_guard<std::mutex> guard(mutex_);
            std::size_t removed = 0;
            for (auto it = workers_.begin(); it != workers_.end();) {
                if (it->second->finished()) {
                    it = workers_.erase(it);
                    ++removed;
                } else {
                    ++it;
                }
            }
            return removed;
        }

        /// @brief Closes every mailbox, stops the scheduler and destroys all workers; idempotent
        void shutdown() {
            std::unordered_map<actor_id, std::unique_ptr<worker_base>> workers;
            {
                std::lock_guard<std::mutex> guard(mutex_);
                if (shut_down_) {
                    return;
                }
                shut_down_ = true;
                for (auto& entry : workers_) {
                    entry.second->terminate();
                }
            }
            scheduler_.stop();
            {
                std::lock_guard<std::mutex> guard(mutex_);
                workers.swap(workers_);
            }
            log::debug("runtime shut down, {} worker(s) released", workers.size());
        }

        std::size_t size() const {
            std::lock_guard<std::mutex> guard(mutex_);
            return workers_.size();
        }

        bool contains(actor_id id) const {
            std::lock_guard<std::mutex> guard(mutex_);
            return workers_.find(id) != workers_.end();
        }

        bool is_shut_down() const {
            std::lock_guard<std::mutex> guard(mutex_);
            return shut_down_;
        }

        const runtime_config& config() const noexcept {
            return config_;
        }

        Scheduler& get_scheduler() noexcept {
            return scheduler_;
        }

    private:
        static std::size_t resolve_workers(std::size_t requested) {
            if (requested != 0) {
                return requested;
            }
            return std::max<std::size_t>(std::thread::hardware_concurrency(), 1);
        }

        runtime_config config_;
        Scheduler scheduler_;
        mutable std::mutex mutex_;
        actor_id last_id_ = 0;
        bool shut_down_ = false;
        std::unordered_map<actor_id, std::unique_ptr<worker_base>> workers_;
    };

    using actor_runtime = basic_actor_runtime<scheduler::sharing_scheduler>;

} // namespace actor_synth
