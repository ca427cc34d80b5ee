#pragma once

#include <string>
#include <string_view>

namespace actor_synth {

    /// @brief PascalCase/camelCase identifier to snake_case
    ///
    /// Words start at an uppercase letter that follows a lowercase letter or
    /// digit, or at the last uppercase letter of a run followed by a lowercase
    /// letter (`HTTPServer` -> `http_server`). Digits stay with the preceding
    /// word, underscores and other separators split words.
    std::string to_snake_case(std::string_view identifier);

    /// @brief Usable as a C++ name: no leading digit, no `__`, no `_` + uppercase
    bool is_valid_identifier(std::string_view name) noexcept;

    bool is_keyword(std::string_view name) noexcept;

    /// @brief C++ keywords and the member names of an emitted handle
    bool is_reserved_word(std::string_view name) noexcept;

    /// @brief Operation name of a variant: snake_case, never empty, never reserved
    ///
    /// The suffix is appended before escaping, so `Close` with `_no_wait`
    /// gives `close_no_wait` while `Close` alone gives `close_`.
    std::string make_operation_name(std::string_view variant_name, std::string_view suffix = {});

    /// @brief Struct member name for a declared field; keywords get a trailing `_`
    std::string make_field_name(std::string_view field_name);

} // namespace actor_synth
