#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <actor-synth/analysis/diagnostic.hpp>
#include <actor-synth/analysis/options.hpp>
#include <actor-synth/declaration/model.hpp>

namespace actor_synth {

    enum class call_mode {
        wait,
        no_wait
    };

    /// @brief Public signature of one derived operation
    ///
    /// The operation takes the whole message value; a wait call yields
    /// result<value_type>, a no-wait call result<void> (value_type empty).
    struct operation_signature {
        std::string name;
        call_mode mode = call_mode::wait;
        declaration::type_expr value_type;
    };

    /// @brief Public API surface derived from one message variant
    struct variant_contract {
        std::string variant_name;
        std::string operation_name;
        std::string no_wait_name;
        /// resp type as the caller sees it, optional wrapper removed
        declaration::type_expr response_type;
        /// resp type as written in the declaration
        declaration::type_expr declared_response_type;
        std::size_t response_field_index = 0;
        operation_signature wait_signature;
        operation_signature no_wait_signature;
    };

    bool is_optional_wrapper(const declaration::type_expr& type) noexcept;

    /// @brief `Option<T>`, `optional<T>`, `std::optional<T>` -> `T`; anything else unchanged
    declaration::type_expr unwrap_optional(const declaration::type_expr& type);

    /// @brief Contract of a single variant; the variant must carry a response field
    variant_contract derive(const declaration::variant_decl& variant,
                            const synthesis_options& options = {});

    /// @brief Contracts of every variant, rejecting operation name collisions
    build_result<std::vector<variant_contract>> derive_all(const declaration::message_type& message,
                                                           const synthesis_options& options = {});

} // namespace actor_synth
