#pragma once

#include <cassert>
#include <unordered_map>

#include <fmt/format.h>

#include <actor-synth/derive/contract.hpp>
#include <actor-synth/derive/naming.hpp>
#include <actor-synth/log.hpp>

namespace actor_synth {

    bool is_optional_wrapper(const declaration::type_expr& type) noexcept {
        if (type.args.size() != 1) {
            return false;
        }
        return type.name == "Option" || type.name == "optional" || type.name == "std::optional";
    }

    declaration::type_expr unwrap_optional(const declaration::type_expr& type) {
        if (is_optional_wrapper(type)) {
            return type.args.front();
        }
        return type;
    }

    variant_contract derive(const declaration::variant_decl& variant, const synthesis_options& options) {
        variant_contract contract;
        contract.variant_name = variant.name;
        contract.operation_name = make_operation_name(variant.name);
        contract.no_wait_name = make_operation_name(variant.name, options.no_wait_suffix);

        bool found = false;
        for (std::size_t i = 0; i < variant.fields.size(); ++i) {
            if (variant.fields[i].name == options.response_field) {
                contract.response_field_index = i;
                contract.declared_response_type = variant.fields[i].type;
                contract.response_type = unwrap_optional(variant.fields[i].type);
                found = true;
                break;
            }
        }
        assert(found && "derive(): variant without response field, analyze() first");
        (void) found;

        contract.wait_signature = operation_signature{contract.operation_name, call_mode::wait, contract.response_type};
        contract.no_wait_signature = operation_signature{contract.no_wait_name, call_mode::no_wait, {}};
        return contract;
    }

    build_result<std::vector<variant_contract>> derive_all(const declaration::message_type& message,
                                                           const synthesis_options& options) {
        std::vector<variant_contract> contracts;
        contracts.reserve(message.variants.size());

        // every public name (wait and no-wait) -> variant that claimed it
        std::unordered_map<std::string, std::string> claimed;

        for (const auto& variant : message.variants) {
            auto contract = derive(variant, options);
            for (const auto* name : {&contract.operation_name, &contract.no_wait_name}) {
                auto [it, inserted] = claimed.emplace(*name, variant.name);
                if (!inserted) {
                    auto diag = make_diagnostic(
                        synthesis_errc::duplicate_operation_name,
                        variant.name,
                        fmt::format("variants {} and {} of {} both derive operation {}",
                                    it->second, variant.name, message.name, *name));
                    log::debug("actor rejected: {}", to_string(diag));
                    return diag;
                }
            }
            contracts.push_back(std::move(contract));
        }
        return contracts;
    }

} // namespace actor_synth
