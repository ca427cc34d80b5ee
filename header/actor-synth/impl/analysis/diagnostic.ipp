#pragma once

#include <fmt/format.h>

#include <actor-synth/analysis/diagnostic.hpp>

namespace actor_synth {

    diagnostic make_diagnostic(synthesis_errc code, std::string subject, std::string message) {
        return diagnostic{make_error_code(code), std::move(subject), std::move(message)};
    }

    std::string to_string(const diagnostic& diag) {
        const char* kind = diag.code.category() == synthesis_category()
                               ? error_name(static_cast<synthesis_errc>(diag.code.value()))
                               : diag.code.category().name();
        if (diag.subject.empty()) {
            return fmt::format("{}: {}", kind, diag.message);
        }
        return fmt::format("{}({}): {}", kind, diag.subject, diag.message);
    }

} // namespace actor_synth
