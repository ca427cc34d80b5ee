#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <vector>

#include <actor-synth/derive/naming.hpp>

namespace actor_synth {

    namespace {

        bool is_upper(char c) noexcept {
            return std::isupper(static_cast<unsigned char>(c)) != 0;
        }

        bool is_lower(char c) noexcept {
            return std::islower(static_cast<unsigned char>(c)) != 0;
        }

        bool is_digit(char c) noexcept {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        }

        bool is_alpha(char c) noexcept {
            return std::isalpha(static_cast<unsigned char>(c)) != 0;
        }

        char to_lower(char c) noexcept {
            return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }

        // sorted for binary_search
        constexpr std::array<std::string_view, 92> keywords = {
            "alignas", "alignof", "and", "and_eq", "asm", "auto", "bitand", "bitor",
            "bool", "break", "case", "catch", "char", "char16_t", "char32_t", "char8_t",
            "class", "co_await", "co_return", "co_yield", "compl", "concept", "const", "const_cast",
            "consteval", "constexpr", "constinit", "continue", "decltype", "default", "delete", "do",
            "double", "dynamic_cast", "else", "enum", "explicit", "export", "extern", "false",
            "float", "for", "friend", "goto", "if", "inline", "int", "long",
            "mutable", "namespace", "new", "noexcept", "not", "not_eq", "nullptr", "operator",
            "or", "or_eq", "private", "protected", "public", "register", "reinterpret_cast", "requires",
            "return", "short", "signed", "sizeof", "static", "static_assert", "static_cast", "struct",
            "switch", "template", "this", "thread_local", "throw", "true", "try", "typedef",
            "typeid", "typename", "union", "unsigned", "using", "virtual", "void", "volatile",
            "wchar_t", "while", "xor", "xor_eq"};

        // members and aliases of the emitted handle class, sorted
        constexpr std::array<std::string_view, 6> handle_members = {
            "close", "get_handle", "handle_", "message_type", "processor_type", "spawn"};

    } // namespace

    std::string to_snake_case(std::string_view identifier) {
        std::vector<std::string> words;
        std::string current;

        auto flush = [&]() {
            if (!current.empty()) {
                words.push_back(std::move(current));
                current.clear();
            }
        };

        for (std::size_t i = 0; i < identifier.size(); ++i) {
            const char c = identifier[i];
            if (!is_alpha(c) && !is_digit(c)) {
                flush();
                continue;
            }
            if (is_upper(c) && !current.empty()) {
                const char prev = identifier[i - 1];
                const bool next_is_lower = i + 1 < identifier.size() && is_lower(identifier[i + 1]);
                if (is_lower(prev) || is_digit(prev) || (is_upper(prev) && next_is_lower)) {
                    flush();
                }
            }
            current += to_lower(c);
        }
        flush();

        std::string result;
        for (const auto& word : words) {
            if (!result.empty()) {
                result += '_';
            }
            result += word;
        }
        return result;
    }

    bool is_valid_identifier(std::string_view name) noexcept {
        if (name.empty() || is_digit(name.front())) {
            return false;
        }
        if (name.size() > 1 && name[0] == '_' && is_upper(name[1])) {
            return false;
        }
        if (name.find("__") != std::string_view::npos) {
            return false;
        }
        return std::all_of(name.begin(), name.end(), [](char c) {
            return is_alpha(c) || is_digit(c) || c == '_';
        });
    }

    bool is_keyword(std::string_view name) noexcept {
        return std::binary_search(keywords.begin(), keywords.end(), name);
    }

    bool is_reserved_word(std::string_view name) noexcept {
        return is_keyword(name) || std::binary_search(handle_members.begin(), handle_members.end(), name);
    }

    std::string make_operation_name(std::string_view variant_name, std::string_view suffix) {
        auto name = to_snake_case(variant_name);
        name += suffix;
        if (name.empty() || is_digit(name.front())) {
            name.insert(name.begin(), '_');
        }
        if (is_reserved_word(name)) {
            name += '_';
        }
        return name;
    }

    std::string make_field_name(std::string_view field_name) {
        std::string name(field_name);
        if (is_keyword(name)) {
            name += '_';
        }
        return name;
    }

} // namespace actor_synth
