#pragma once

#include <cassert>

#include <actor-synth/log.hpp>
#include <actor-synth/synthesis/synthesizer.hpp>

namespace actor_synth {

    const char* to_string(construction_step step) noexcept {
        switch (step) {
            case construction_step::create_mailbox:
                return "create_mailbox";
            case construction_step::bind_processor:
                return "bind_processor";
            case construction_step::spawn_worker:
                return "spawn_worker";
            case construction_step::return_handle:
                return "return_handle";
        }
        return "?";
    }

    output_model synthesize(const accepted_unit& unit,
                            const std::vector<variant_contract>& contracts,
                            const synthesis_options& options) {
        assert(contracts.size() == unit.message.variants.size() && "one contract per variant");

        output_model out;
        const auto& message_name = unit.message.name;

        out.message.name = message_name;
        for (std::size_t i = 0; i < contracts.size(); ++i) {
            const auto& variant = unit.message.variants[i];
            const auto& contract = contracts[i];
            assert(variant.name == contract.variant_name && "contracts out of variant order");
            out.message.variants.push_back(augmented_variant{
                variant.name,
                variant.fields,
                contract.response_field_index,
                contract.response_type});
        }

        out.mailbox.message_name = message_name;

        out.worker.name = unit.processor.name + options.worker_suffix;
        out.worker.processor_name = unit.processor.name;
        out.worker.message_name = message_name;
        out.worker.handler_name = unit.handler.method_name;
        out.worker.processor_fields = unit.processor.fields;

        out.handle.name = options.handle_prefix + unit.processor.name;
        out.handle.message_name = message_name;
        for (const auto& contract : contracts) {
            out.handle.operations.push_back(operation_model{
                contract.operation_name, contract.variant_name, call_mode::wait, contract.response_type});
            out.handle.operations.push_back(operation_model{
                contract.no_wait_name, contract.variant_name, call_mode::no_wait, {}});
        }
        out.handle.construction = {
            construction_step::create_mailbox,
            construction_step::bind_processor,
            construction_step::spawn_worker,
            construction_step::return_handle};

        out.contracts = contracts;
        return out;
    }

    generation_result generate(const declaration::declaration_list& declarations,
                               const synthesis_options& options) {
        auto analysis = analyze(declarations, options);
        if (!analysis) {
            return analysis.error();
        }
        const auto& unit = analysis.value();

        auto contracts = derive_all(unit.message, options);
        if (!contracts) {
            return contracts.error();
        }

        auto out = synthesize(unit, contracts.value(), options);
        log::info("generated {} ({} operations) for {}",
                  out.handle.name, out.handle.operations.size(), unit.message.name);
        return out;
    }

    std::vector<generation_result> generate_module(const declaration::declaration_list& declarations,
                                                   const synthesis_options& options) {
        std::vector<generation_result> results;
        for (const auto& unit : partition_module(declarations, options)) {
            results.push_back(generate(unit, options));
        }
        return results;
    }

} // namespace actor_synth
