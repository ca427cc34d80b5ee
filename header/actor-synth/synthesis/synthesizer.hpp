#pragma once

#include <vector>

#include <actor-synth/analysis/analyzer.hpp>
#include <actor-synth/derive/contract.hpp>
#include <actor-synth/synthesis/output_model.hpp>

namespace actor_synth {

    /// @brief Assembles the output model of an accepted unit; cannot fail
    output_model synthesize(const accepted_unit& unit,
                            const std::vector<variant_contract>& contracts,
                            const synthesis_options& options = {});

    using generation_result = build_result<output_model>;

    /// @brief analyze() -> derive_all() -> synthesize(), all or nothing
    generation_result generate(const declaration::declaration_list& declarations,
                               const synthesis_options& options = {});

    /// @brief generate() for every candidate unit of a module
    std::vector<generation_result> generate_module(const declaration::declaration_list& declarations,
                                                   const synthesis_options& options = {});

} // namespace actor_synth
