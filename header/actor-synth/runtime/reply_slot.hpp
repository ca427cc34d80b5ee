#pragma once

/// @file reply_slot.hpp
/// @brief Single-use value transfer from the worker to one waiting caller
///
/// make_reply_pair() creates a response_sender / response_receiver pair over
/// one shared state. The sender writes at most once; destroying it unwritten
/// abandons the state and the receiver observes
/// operation_errc::mailbox_closed_or_abandoned. Destroying the receiver first
/// turns the later write into a no-op.
///
/// reply_slot<T> is the runtime value of a variant's `resp` field. It is
/// either `fire` (no-wait call, nobody listens) or carries the sender of a
/// waiting call.

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include <actor-synth/detail/intrusive_ptr.hpp>
#include <actor-synth/detail/ref_counted.hpp>
#include <actor-synth/runtime/result.hpp>

namespace actor_synth {

    namespace detail {

        enum class reply_status : uint8_t {
            pending = 0,
            ready,
            consumed,
            abandoned
        };

        template<typename T>
        class reply_state final : public ref_counted {
        public:
            reply_state() = default;

            /// @return false if nobody listens anymore (the value is still stored)
            bool set_value(T&& value) {
                std::unique_lock<std::mutex> guard(mutex_);
                if (status_ != reply_status::pending) {
                    return false;
                }
                value_.emplace(std::move(value));
                status_ = reply_status::ready;
                const bool listening = receiver_attached_;
                guard.unlock();
                cv_.notify_all();
                return listening;
            }

            void abandon() noexcept {
                std::unique_lock<std::mutex> guard(mutex_);
                if (status_ != reply_status::pending) {
                    return;
                }
                status_ = reply_status::abandoned;
                guard.unlock();
                cv_.notify_all();
            }

            void detach_receiver() noexcept {
                std::lock_guard<std::mutex> guard(mutex_);
                receiver_attached_ = false;
            }

            bool available() const noexcept {
                std::lock_guard<std::mutex> guard(mutex_);
                return status_ != reply_status::pending;
            }

            result<T> take() {
                std::unique_lock<std::mutex> guard(mutex_);
                cv_.wait(guard, [this] { return status_ != reply_status::pending; });
                return consume_locked();
            }

            template<class Rep, class Period>
            std::optional<result<T>> take_for(const std::chrono::duration<Rep, Period>& timeout) {
                std::unique_lock<std::mutex> guard(mutex_);
                if (!cv_.wait_for(guard, timeout, [this] { return status_ != reply_status::pending; })) {
                    return std::nullopt;
                }
                return consume_locked();
            }

        private:
            result<T> consume_locked() {
                if (status_ == reply_status::ready) {
                    status_ = reply_status::consumed;
                    return result<T>(std::move(*value_));
                }
                return result<T>(operation_errc::mailbox_closed_or_abandoned);
            }

            mutable std::mutex mutex_;
            std::condition_variable cv_;
            reply_status status_ = reply_status::pending;
            bool receiver_attached_ = true;
            std::optional<T> value_;
        };

    } // namespace detail

    template<typename T>
    class response_sender final {
        using state_ptr = detail::intrusive_ptr<detail::reply_state<T>>;

    public:
        response_sender() noexcept = default;

        explicit response_sender(state_ptr state) noexcept
            : state_(std::move(state)) {}

        response_sender(const response_sender&) = delete;
        response_sender& operator=(const response_sender&) = delete;

        response_sender(response_sender&& other) noexcept = default;

        response_sender& operator=(response_sender&& other) noexcept {
            if (this != &other) {
                abandon();
                state_ = std::move(other.state_);
            }
            return *this;
        }

        ~response_sender() {
            abandon();
        }

        bool valid() const noexcept {
            return static_cast<bool>(state_);
        }

        /// @brief Writes the reply and consumes the sender
        /// @return false when the caller stopped listening
        bool send(T value) {
            assert(state_ && "send() on empty response_sender");
            state_ptr state = std::move(state_);
            return state->set_value(std::move(value));
        }

    private:
        void abandon() noexcept {
            if (state_) {
                state_->abandon();
                state_.reset();
            }
        }

        state_ptr state_;
    };

    template<typename T>
    class response_receiver final {
        using state_ptr = detail::intrusive_ptr<detail::reply_state<T>>;

    public:
        response_receiver() noexcept = default;

        explicit response_receiver(state_ptr state) noexcept
            : state_(std::move(state)) {}

        response_receiver(const response_receiver&) = delete;
        response_receiver& operator=(const response_receiver&) = delete;

        response_receiver(response_receiver&& other) noexcept = default;

        response_receiver& operator=(response_receiver&& other) noexcept {
            if (this != &other) {
                detach();
                state_ = std::move(other.state_);
            }
            return *this;
        }

        ~response_receiver() {
            detach();
        }

        bool valid() const noexcept {
            return static_cast<bool>(state_);
        }

        /// @brief True once get() would not block
        bool available() const noexcept {
            assert(state_ && "available() on empty response_receiver");
            return state_->available();
        }

        /// @brief Blocks until the value arrives or the sender is abandoned
        result<T> get() {
            assert(state_ && "get() on empty response_receiver");
            state_ptr state = std::move(state_);
            auto value = state->take();
            state->detach_receiver();
            return value;
        }

        /// @brief get() bounded by a timeout; std::nullopt keeps the receiver usable
        template<class Rep, class Period>
        std::optional<result<T>> get_for(const std::chrono::duration<Rep, Period>& timeout) {
            assert(state_ && "get_for() on empty response_receiver");
            auto value = state_->take_for(timeout);
            if (value) {
                detach();
            }
            return value;
        }

    private:
        void detach() noexcept {
            if (state_) {
                state_->detach_receiver();
                state_.reset();
            }
        }

        state_ptr state_;
    };

    template<typename T>
    std::pair<response_sender<T>, response_receiver<T>> make_reply_pair() {
        static_assert(!std::is_void_v<T>, "reply value type must not be void");
        static_assert(std::is_move_constructible_v<T>, "reply value type must be movable");
        auto state = detail::make_counted<detail::reply_state<T>>();
        response_sender<T> sender(state);
        response_receiver<T> receiver(std::move(state));
        return {std::move(sender), std::move(receiver)};
    }

    /// @brief Runtime value of a `resp` field: fire, or the sender of a waiting call
    template<typename T>
    class reply_slot final {
    public:
        using value_type = T;

        /// @brief Fire state: the call does not wait for a reply
        reply_slot() noexcept = default;

        explicit reply_slot(response_sender<T> sender) noexcept
            : call_(std::in_place_type<response_sender<T>>, std::move(sender)) {}

        reply_slot(reply_slot&&) noexcept = default;
        reply_slot& operator=(reply_slot&&) noexcept = default;

        static reply_slot fire() noexcept {
            return reply_slot();
        }

        static reply_slot wait(response_sender<T> sender) noexcept {
            return reply_slot(std::move(sender));
        }

        bool wants_reply() const noexcept {
            const auto* sender = std::get_if<response_sender<T>>(&call_);
            return sender != nullptr && sender->valid();
        }

        /// @brief Delivers the reply of a waiting call; no-op for fire calls
        /// @return true if a caller received the value
        bool reply(T value) {
            if (!wants_reply()) {
                return false;
            }
            auto sender = take();
            return sender.send(std::move(value));
        }

        /// @brief Moves the sender out to reply later; the slot becomes fire
        response_sender<T> take() noexcept {
            response_sender<T> sender;
            if (auto* held = std::get_if<response_sender<T>>(&call_)) {
                sender = std::move(*held);
            }
            call_.template emplace<std::monostate>();
            return sender;
        }

    private:
        std::variant<std::monostate, response_sender<T>> call_;
    };

} // namespace actor_synth
