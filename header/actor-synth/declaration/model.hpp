#pragma once

/// @file model.hpp
/// @brief Typed view of one module handed over by the front end
///
/// Pure data. The front end resolves names before it fills these structures;
/// the engine never looks at source text.

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace actor_synth { namespace declaration {

    /// @brief A type as written in the declaration: `name<args...>`
    struct type_expr {
        std::string name;
        std::vector<type_expr> args;

        static type_expr named(std::string name) {
            return type_expr{std::move(name), {}};
        }

        static type_expr generic(std::string name, std::vector<type_expr> args) {
            return type_expr{std::move(name), std::move(args)};
        }

        bool empty() const noexcept {
            return name.empty();
        }
    };

    bool operator==(const type_expr& lhs, const type_expr& rhs);
    bool operator!=(const type_expr& lhs, const type_expr& rhs);

    /// @brief Renders `name<arg, arg>` recursively
    std::string to_string(const type_expr& type);

    struct field_decl {
        std::string name;
        type_expr type;
    };

    enum class receiver_mode {
        none,
        shared,
        exclusive
    };

    enum class passing_mode {
        value,
        shared_ref,
        exclusive_ref
    };

    struct param_decl {
        std::string name;
        type_expr type;
        passing_mode passing = passing_mode::value;
    };

    struct method_decl {
        std::string name;
        receiver_mode receiver = receiver_mode::exclusive;
        std::vector<param_decl> params;
        bool is_async = false;
    };

    /// @brief Record-like type whose instance becomes the actor's private state
    struct processor_type {
        std::string name;
        std::vector<field_decl> fields;
        std::vector<method_decl> methods;

        const method_decl* find_method(const std::string& method_name) const;
    };

    /// @brief One alternative of the tagged message type
    struct variant_decl {
        std::string name;
        std::vector<field_decl> fields;

        const field_decl* find_field(const std::string& field_name) const;
        std::size_t count_fields(const std::string& field_name) const;
    };

    struct message_type {
        std::string name;
        std::vector<variant_decl> variants;
    };

    /// @brief Method of the processor selected as the message handler
    struct handler_binding {
        std::string method_name;
        std::size_t method_index = 0;
    };

    /// @brief Explicit processor/message pairing used instead of the name suffix
    struct actor_binding {
        std::string processor;
        std::string message;
    };

    /// @brief Everything the front end produced for one module
    struct declaration_list {
        std::vector<processor_type> processors;
        std::vector<message_type> messages;
        std::vector<actor_binding> bindings;

        const processor_type* find_processor(const std::string& processor_name) const;
        const message_type* find_message(const std::string& message_name) const;
    };

}} // namespace actor_synth::declaration
