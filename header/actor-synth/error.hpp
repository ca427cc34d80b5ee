#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace actor_synth {

    /// @brief Build-time rejections of the analysis and synthesis stages
    enum class synthesis_errc {
        ambiguous_or_missing_pair = 1,
        missing_handler,
        empty_message_type,
        missing_response_field,
        duplicate_operation_name
    };

    /// @brief Call-time failures reported by a synthesized handle
    enum class operation_errc {
        wrong_variant = 1,
        send_failed,
        mailbox_closed_or_abandoned
    };

    const std::error_category& synthesis_category() noexcept;
    const std::error_category& operation_category() noexcept;

    inline std::error_code make_error_code(synthesis_errc e) noexcept {
        return {static_cast<int>(e), synthesis_category()};
    }

    inline std::error_code make_error_code(operation_errc e) noexcept {
        return {static_cast<int>(e), operation_category()};
    }

    /// @brief Short identifier of the error kind, e.g. "MissingHandler"
    const char* error_name(synthesis_errc e) noexcept;
    const char* error_name(operation_errc e) noexcept;

} // namespace actor_synth

namespace std {

    template<>
    struct is_error_code_enum<actor_synth::synthesis_errc> : true_type {};

    template<>
    struct is_error_code_enum<actor_synth::operation_errc> : true_type {};

} // namespace std
