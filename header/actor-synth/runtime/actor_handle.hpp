#pragma once

#include <utility>
#include <variant>

#include <actor-synth/detail/actor_core.hpp>
#include <actor-synth/detail/intrusive_ptr.hpp>
#include <actor-synth/error.hpp>
#include <actor-synth/runtime/message_traits.hpp>
#include <actor-synth/runtime/reply_slot.hpp>
#include <actor-synth/runtime/result.hpp>

namespace actor_synth {

    /// @brief Producer end of an actor's mailbox
    ///
    /// Copies share the same actor. The mailbox closes when the last copy is
    /// destroyed or when any copy calls close(); the worker then handles what
    /// is already queued and terminates.
    template<class Message>
    class actor_handle final {
    public:
        using message_type = Message;
        using core_type = detail::actor_core<Message>;
        using core_ptr = detail::intrusive_ptr<core_type>;

        actor_handle() noexcept = default;

        explicit actor_handle(core_ptr core)
            : core_(std::move(core)) {
            if (core_) {
                core_->add_sender();
            }
        }

        actor_handle(const actor_handle& other)
            : core_(other.core_) {
            if (core_) {
                core_->add_sender();
            }
        }

        actor_handle(actor_handle&& other) noexcept = default;

        actor_handle& operator=(const actor_handle& other) {
            actor_handle tmp(other);
            swap(tmp);
            return *this;
        }

        actor_handle& operator=(actor_handle&& other) noexcept {
            actor_handle tmp(std::move(other));
            swap(tmp);
            return *this;
        }

        ~actor_handle() {
            if (core_) {
                core_->remove_sender();
            }
        }

        void swap(actor_handle& other) noexcept {
            core_.swap(other.core_);
        }

        bool valid() const noexcept {
            return static_cast<bool>(core_);
        }

        explicit operator bool() const noexcept {
            return valid();
        }

        actor_id id() const noexcept {
            return core_ ? core_->id() : actor_id{0};
        }

        /// @brief Sends a wait-form call and returns the receiver without blocking
        template<class V>
        result<response_receiver<response_type_t<V>>> request(Message message) {
            static_assert(is_alternative_v<V, Message>, "V is not an alternative of the message type");
            using value_type = response_type_t<V>;

            auto* payload = std::get_if<V>(&message);
            if (payload == nullptr) {
                return operation_errc::wrong_variant;
            }
            if (!core_ || core_->mailbox().closed()) {
                return operation_errc::send_failed;
            }
            auto pair = make_reply_pair<value_type>();
            payload->resp = reply_slot<value_type>::wait(std::move(pair.first));
            if (!core_->push(std::move(message))) {
                return operation_errc::send_failed;
            }
            return std::move(pair.second);
        }

        /// @brief Sends a wait-form call and blocks until the reply arrives
        template<class V>
        result<response_type_t<V>> call(Message message) {
            auto receiver = request<V>(std::move(message));
            if (!receiver) {
                return receiver.error();
            }
            return std::move(receiver).value().get();
        }

        /// @brief Sends the call with no reply requested; returns once it is queued
        template<class V>
        result<void> call_no_wait(Message message) {
            static_assert(is_alternative_v<V, Message>, "V is not an alternative of the message type");
            using value_type = response_type_t<V>;

            auto* payload = std::get_if<V>(&message);
            if (payload == nullptr) {
                return operation_errc::wrong_variant;
            }
            if (!core_) {
                return operation_errc::send_failed;
            }
            payload->resp = reply_slot<value_type>::fire();
            if (!core_->push(std::move(message))) {
                return operation_errc::send_failed;
            }
            return {};
        }

        /// @brief Closes the mailbox for every copy of this handle
        void close() {
            if (core_) {
                core_->close();
            }
        }

        bool closed() const {
            return !core_ || core_->mailbox().closed();
        }

    private:
        core_ptr core_;
    };

} // namespace actor_synth
