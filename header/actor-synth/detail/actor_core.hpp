#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <utility>

#include <actor-synth/config.hpp>
#include <actor-synth/detail/ref_counted.hpp>
#include <actor-synth/runtime/mailbox.hpp>
#include <actor-synth/scheduler/job_ptr.hpp>

namespace actor_synth {

    using actor_id = std::uint64_t;

    namespace detail {

        /// @brief State shared by every handle of one actor and its worker
        ///
        /// Owns the mailbox and the link that puts the worker back on its
        /// scheduler. The link is cleared when the worker terminates, after
        /// which schedule() is a no-op.
        template<class Message>
        class actor_core final : public ref_counted {
        public:
            using mailbox_type = mailbox::mailbox_t<Message>;

            explicit actor_core(actor_id id)
                : id_(id) {}

            actor_id id() const noexcept {
                return id_;
            }

            mailbox_type& mailbox() noexcept {
                return mailbox_;
            }

            const mailbox_type& mailbox() const noexcept {
                return mailbox_;
            }

            template<class Executor>
            void attach(Executor* executor, scheduler::job_ptr job) {
                std::lock_guard<std::mutex> guard(link_mutex_);
                executor_ = executor;
                enqueue_ = [](void* ptr, scheduler::job_ptr j) {
                    static_cast<Executor*>(ptr)->enqueue(j);
                };
                job_ = job;
            }

            void detach() noexcept {
                std::lock_guard<std::mutex> guard(link_mutex_);
                executor_ = nullptr;
                enqueue_ = nullptr;
                job_ = scheduler::job_ptr();
            }

            void schedule() {
                std::lock_guard<std::mutex> guard(link_mutex_);
                if (executor_ != nullptr) {
                    enqueue_(executor_, job_);
                }
            }

            /// @return false if the mailbox is closed; the message is destroyed then
            bool push(Message&& message) {
                switch (mailbox_.push_back(std::move(message))) {
                    case mailbox::enqueue_result::success:
                        return true;
                    case mailbox::enqueue_result::unblocked_reader:
                        schedule();
                        return true;
                    case mailbox::enqueue_result::queue_closed:
                        return false;
                }
                return false;
            }

            void close() {
                if (mailbox_.close()) {
                    schedule();
                }
            }

            void add_sender() noexcept {
                senders_.fetch_add(1, std::memory_order_relaxed);
            }

            /// the last sender going away closes the mailbox
            void remove_sender() {
                if (senders_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
                    close();
                }
            }

        private:
            const actor_id id_;
            mailbox_type mailbox_;
            alignas(ACTOR_SYNTH_CACHE_LINE_SIZE) std::atomic<std::size_t> senders_{0};
            mutable std::mutex link_mutex_;
            void* executor_ = nullptr;
            void (*enqueue_)(void*, scheduler::job_ptr) = nullptr;
            scheduler::job_ptr job_;
        };

    } // namespace detail
} // namespace actor_synth
