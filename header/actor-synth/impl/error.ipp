#pragma once

#include <actor-synth/error.hpp>

namespace actor_synth {

    namespace {

        class synthesis_category_impl final : public std::error_category {
        public:
            const char* name() const noexcept override {
                return "actor-synth.synthesis";
            }

            std::string message(int value) const override {
                switch (static_cast<synthesis_errc>(value)) {
                    case synthesis_errc::ambiguous_or_missing_pair:
                        return "no unique processor/message pair";
                    case synthesis_errc::missing_handler:
                        return "processor has no asynchronous message handler";
                    case synthesis_errc::empty_message_type:
                        return "message type declares no variants";
                    case synthesis_errc::missing_response_field:
                        return "variant has no single resp field";
                    case synthesis_errc::duplicate_operation_name:
                        return "two variants derive the same operation name";
                }
                return "unknown synthesis error";
            }
        };

        class operation_category_impl final : public std::error_category {
        public:
            const char* name() const noexcept override {
                return "actor-synth.operation";
            }

            std::string message(int value) const override {
                switch (static_cast<operation_errc>(value)) {
                    case operation_errc::wrong_variant:
                        return "invalid msg type";
                    case operation_errc::send_failed:
                        return "send failed";
                    case operation_errc::mailbox_closed_or_abandoned:
                        return "mailbox closed";
                }
                return "unknown operation error";
            }
        };

    } // namespace

    const std::error_category& synthesis_category() noexcept {
        static const synthesis_category_impl instance;
        return instance;
    }

    const std::error_category& operation_category() noexcept {
        static const operation_category_impl instance;
        return instance;
    }

    const char* error_name(synthesis_errc e) noexcept {
        switch (e) {
            case synthesis_errc::ambiguous_or_missing_pair:
                return "AmbiguousOrMissingPair";
            case synthesis_errc::missing_handler:
                return "MissingHandler";
            case synthesis_errc::empty_message_type:
                return "EmptyMessageType";
            case synthesis_errc::missing_response_field:
                return "MissingResponseField";
            case synthesis_errc::duplicate_operation_name:
                return "DuplicateOperationName";
        }
        return "Unknown";
    }

    const char* error_name(operation_errc e) noexcept {
        switch (e) {
            case operation_errc::wrong_variant:
                return "WrongVariant";
            case operation_errc::send_failed:
                return "SendFailed";
            case operation_errc::mailbox_closed_or_abandoned:
                return "MailboxClosedOrAbandoned";
        }
        return "Unknown";
    }

} // namespace actor_synth
