#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace actor_synth { namespace mailbox {

    enum class enqueue_result {
        /// message queued, the reader was not waiting
        success,
        /// message queued, the reader was blocked and must be scheduled
        unblocked_reader,
        /// the mailbox is closed, the message was not queued
        queue_closed
    };

    /// @brief Unbounded MPSC message queue with a blocked flag for the reader
    ///
    /// The reader calls try_block() when it finds the queue empty. The first
    /// push after a successful try_block() returns unblocked_reader, which
    /// is the signal to put the reader back on the scheduler.
    template<class Message>
    class mailbox_t final {
    public:
        using value_type = Message;

        mailbox_t() = default;
        mailbox_t(const mailbox_t&) = delete;
        mailbox_t& operator=(const mailbox_t&) = delete;

        enqueue_result push_back(Message&& message) {
            std::lock_guard<std::mutex> guard(mutex_);
            if (closed_) {
                return enqueue_result::queue_closed;
            }
            queue_.push_back(std::move(message));
            if (blocked_) {
                blocked_ = false;
                return enqueue_result::unblocked_reader;
            }
            return enqueue_result::success;
        }

        std::optional<Message> pop_front() {
            std::lock_guard<std::mutex> guard(mutex_);
            if (queue_.empty()) {
                return std::nullopt;
            }
            std::optional<Message> message(std::in_place, std::move(queue_.front()));
            queue_.pop_front();
            return message;
        }

        /// @brief Marks the reader as blocked; fails if messages arrived or the mailbox is closed
        bool try_block() {
            std::lock_guard<std::mutex> guard(mutex_);
            if (closed_ || !queue_.empty()) {
                return false;
            }
            blocked_ = true;
            return true;
        }

        bool blocked() const {
            std::lock_guard<std::mutex> guard(mutex_);
            return blocked_;
        }

        bool closed() const {
            std::lock_guard<std::mutex> guard(mutex_);
            return closed_;
        }

        /// @brief Rejects further pushes; queued messages stay readable
        /// @return true if the reader was blocked and must be scheduled to observe the close
        bool close() {
            std::lock_guard<std::mutex> guard(mutex_);
            if (closed_) {
                return false;
            }
            closed_ = true;
            const bool was_blocked = blocked_;
            blocked_ = false;
            return was_blocked;
        }

        /// @brief Closes and destroys every queued message
        /// @return number of discarded messages
        std::size_t close_and_drain() {
            std::deque<Message> dropped;
            {
                std::lock_guard<std::mutex> guard(mutex_);
                closed_ = true;
                blocked_ = false;
                dropped.swap(queue_);
            }
            return dropped.size();
        }

        std::size_t size() const {
            std::lock_guard<std::mutex> guard(mutex_);
            return queue_.size();
        }

        bool empty() const {
            return size() == 0;
        }

    private:
        mutable std::mutex mutex_;
        std::deque<Message> queue_;
        bool closed_ = false;
        bool blocked_ = false;
    };

}} // namespace actor_synth::mailbox
