#pragma once

#include <vector>

#include <actor-synth/analysis/diagnostic.hpp>
#include <actor-synth/analysis/options.hpp>
#include <actor-synth/declaration/model.hpp>

namespace actor_synth {

    /// @brief Declarations of one actor that passed every eligibility rule
    struct accepted_unit {
        declaration::processor_type processor;
        declaration::message_type message;
        declaration::handler_binding handler;
    };

    using analysis_result = build_result<accepted_unit>;

    /// @brief Decides whether the declarations describe exactly one generatable actor
    ///
    /// Rules are checked in order and the first failure is reported:
    ///  1. exactly one processor/message pair under options.linkage
    ///  2. the processor has an async handler taking the message exclusively
    ///  3. the message type has at least one variant
    ///  4. every variant has exactly one response field
    analysis_result analyze(const declaration::declaration_list& declarations,
                            const synthesis_options& options = {});

    /// @brief Splits a module into one candidate unit per message type
    ///
    /// Message types without the configured suffix (or explicit binding)
    /// are not actor candidates and are skipped.
    std::vector<declaration::declaration_list> partition_module(
        const declaration::declaration_list& declarations,
        const synthesis_options& options = {});

    /// @brief analyze() applied to every unit of partition_module()
    std::vector<analysis_result> analyze_module(const declaration::declaration_list& declarations,
                                                const synthesis_options& options = {});

} // namespace actor_synth
