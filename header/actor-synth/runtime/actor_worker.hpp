#pragma once

#include <atomic>
#include <cstddef>
#include <exception>
#include <optional>
#include <utility>

#include <actor-synth/detail/actor_core.hpp>
#include <actor-synth/detail/intrusive_ptr.hpp>
#include <actor-synth/log.hpp>
#include <actor-synth/runtime/message_traits.hpp>
#include <actor-synth/scheduler/resumable.hpp>

namespace actor_synth {

    /// @brief Type-independent view of a worker, as kept by the runtime registry
    class worker_base {
    public:
        virtual ~worker_base() = default;

        virtual actor_id id() const noexcept = 0;

        /// @brief True once the run loop ended; the scheduler holds no job for it anymore
        virtual bool finished() const noexcept = 0;

        /// @brief Closes the mailbox and drops queued messages, abandoning their replies
        virtual void terminate() = 0;
    };

    /// @brief Owns one processor and runs its handler over the mailbox, one message at a time
    template<class Processor, class Message>
    class actor_worker final : public worker_base {
    public:
        static_assert(message_processor<Processor, Message>, "processor must provide process(Message&)");

        using core_ptr = detail::intrusive_ptr<detail::actor_core<Message>>;
        using processor_type = Processor;
        using message_type = Message;

        template<class... Args>
        actor_worker(core_ptr core, Args&&... args)
            : core_(std::move(core)) {
            processor_.emplace(std::forward<Args>(args)...);
        }

        actor_worker(const actor_worker&) = delete;
        actor_worker& operator=(const actor_worker&) = delete;

        ~actor_worker() override = default;

        actor_id id() const noexcept override {
            return core_->id();
        }

        bool finished() const noexcept override {
            return finished_.load(std::memory_order_acquire);
        }

        void terminate() override {
            core_->mailbox().close_and_drain();
            core_->detach();
        }

        scheduler::resume_info resume(std::size_t max_throughput) {
            if (finished()) {
                return scheduler::resume_info(scheduler::resume_result::done, 0);
            }
            auto& box = core_->mailbox();
            std::size_t handled = 0;
            while (handled < max_throughput) {
                auto next = box.pop_front();
                if (!next) {
                    if (box.closed()) {
                        finish();
                        return scheduler::resume_info(scheduler::resume_result::done, handled);
                    }
                    if (box.try_block()) {
                        return scheduler::resume_info(scheduler::resume_result::awaiting, handled);
                    }
                    continue;
                }
                try {
                    processor_->process(*next);
                } catch (const std::exception& e) {
                    // close before `next` releases its reply slot
                    log::error("actor {}: handler threw, worker terminates: {}", core_->id(), e.what());
                    fail();
                    return scheduler::resume_info(scheduler::resume_result::done, handled);
                }
                ++handled;
            }
            return scheduler::resume_info(scheduler::resume_result::resume, handled);
        }

    private:
        void fail() {
            auto dropped = core_->mailbox().close_and_drain();
            if (dropped != 0) {
                log::debug("actor {}: {} queued message(s) abandoned", core_->id(), dropped);
            }
            finish();
        }

        void finish() {
            core_->detach();
            processor_.reset();
            log::trace("actor {}: worker finished", core_->id());
            finished_.store(true, std::memory_order_release);
        }

        core_ptr core_;
        std::optional<Processor> processor_;
        std::atomic<bool> finished_{false};
    };

} // namespace actor_synth
