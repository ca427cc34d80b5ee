#pragma once

#include <cassert>
#include <string>
#include <system_error>
#include <utility>
#include <variant>

#include <actor-synth/error.hpp>

namespace actor_synth {

    /// @brief Build-time rejection: what failed and on which declaration
    struct diagnostic {
        std::error_code code;
        /// Type or variant the rejection is about, may be empty.
        std::string subject;
        std::string message;
    };

    diagnostic make_diagnostic(synthesis_errc code, std::string subject, std::string message);

    /// @brief "MissingResponseField(MsgTwo): variant MsgTwo of CalcMsg has no resp field"
    std::string to_string(const diagnostic& diag);

    /// @brief Either a value of a build stage or the diagnostic that stopped it
    template<typename T>
    class build_result final {
    public:
        build_result(T value)
            : storage_(std::in_place_index<0>, std::move(value)) {}

        build_result(diagnostic diag)
            : storage_(std::in_place_index<1>, std::move(diag)) {}

        bool ok() const noexcept {
            return storage_.index() == 0;
        }

        explicit operator bool() const noexcept {
            return ok();
        }

        const T& value() const& {
            assert(ok() && "value() on rejected build_result");
            return std::get<0>(storage_);
        }

        T& value() & {
            assert(ok() && "value() on rejected build_result");
            return std::get<0>(storage_);
        }

        T&& value() && {
            assert(ok() && "value() on rejected build_result");
            return std::get<0>(std::move(storage_));
        }

        const diagnostic& error() const {
            assert(!ok() && "error() on accepted build_result");
            return std::get<1>(storage_);
        }

        std::error_code code() const noexcept {
            return ok() ? std::error_code{} : std::get<1>(storage_).code;
        }

    private:
        std::variant<T, diagnostic> storage_;
    };

} // namespace actor_synth
