#pragma once

#include <cassert>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

#include <actor-synth/error.hpp>

namespace actor_synth {

    /// @brief Outcome of a handle operation: a value or an operation_errc
    ///
    /// Call-time failures are always returned, never thrown.
    template<typename T>
    class [[nodiscard]] result final {
        static_assert(!std::is_same_v<std::decay_t<T>, std::error_code>, "result<std::error_code> is ambiguous");

    public:
        result(T value)
            : storage_(std::in_place_index<0>, std::move(value)) {}

        result(std::error_code ec)
            : storage_(std::in_place_index<1>, ec) {
            assert(ec && "result constructed from an empty error_code");
        }

        result(operation_errc e)
            : result(make_error_code(e)) {}

        bool has_value() const noexcept {
            return storage_.index() == 0;
        }

        explicit operator bool() const noexcept {
            return has_value();
        }

        T& value() & {
            assert(has_value() && "value() on failed result");
            return std::get<0>(storage_);
        }

        const T& value() const& {
            assert(has_value() && "value() on failed result");
            return std::get<0>(storage_);
        }

        T&& value() && {
            assert(has_value() && "value() on failed result");
            return std::get<0>(std::move(storage_));
        }

        template<typename U>
        T value_or(U&& fallback) const& {
            return has_value() ? std::get<0>(storage_) : static_cast<T>(std::forward<U>(fallback));
        }

        std::error_code error() const noexcept {
            return has_value() ? std::error_code{} : std::get<1>(storage_);
        }

    private:
        std::variant<T, std::error_code> storage_;
    };

    template<>
    class [[nodiscard]] result<void> final {
    public:
        result() noexcept = default;

        result(std::error_code ec) noexcept
            : error_(ec) {}

        result(operation_errc e) noexcept
            : error_(make_error_code(e)) {}

        bool has_value() const noexcept {
            return !error_;
        }

        explicit operator bool() const noexcept {
            return has_value();
        }

        void value() const noexcept {
            assert(has_value() && "value() on failed result");
        }

        std::error_code error() const noexcept {
            return error_;
        }

    private:
        std::error_code error_;
    };

} // namespace actor_synth
