#pragma once

#include <string>
#include <utility>

#include <fmt/format.h>

#include <actor-synth/analysis/analyzer.hpp>
#include <actor-synth/log.hpp>

namespace actor_synth {

    namespace {

        using declaration::declaration_list;
        using declaration::message_type;
        using declaration::method_decl;
        using declaration::passing_mode;
        using declaration::processor_type;
        using declaration::receiver_mode;

        struct candidate_pair {
            const processor_type* processor;
            const message_type* message;
        };

        bool has_suffix(const std::string& name, const std::string& suffix) {
            return name.size() > suffix.size() &&
                   name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

        std::string strip_suffix(const std::string& name, const std::string& suffix) {
            return name.substr(0, name.size() - suffix.size());
        }

        std::vector<candidate_pair> pairs_by_name(const declaration_list& declarations,
                                                  const synthesis_options& options) {
            std::vector<candidate_pair> pairs;
            for (const auto& message : declarations.messages) {
                if (!has_suffix(message.name, options.message_suffix)) {
                    continue;
                }
                auto processor_name = strip_suffix(message.name, options.message_suffix);
                for (const auto& processor : declarations.processors) {
                    if (processor.name == processor_name) {
                        pairs.push_back({&processor, &message});
                    }
                }
            }
            return pairs;
        }

        std::vector<candidate_pair> pairs_by_binding(const declaration_list& declarations) {
            std::vector<candidate_pair> pairs;
            for (const auto& binding : declarations.bindings) {
                for (const auto& processor : declarations.processors) {
                    if (processor.name != binding.processor) {
                        continue;
                    }
                    for (const auto& message : declarations.messages) {
                        if (message.name == binding.message) {
                            pairs.push_back({&processor, &message});
                        }
                    }
                }
            }
            return pairs;
        }

        /// Empty string when the method qualifies, the reason otherwise.
        std::string handler_mismatch(const method_decl& method, const message_type& message) {
            if (!method.is_async) {
                return "is not asynchronous";
            }
            if (method.receiver != receiver_mode::exclusive) {
                return "does not take the processor exclusively";
            }
            if (method.params.size() != 1) {
                return fmt::format("takes {} parameters instead of one", method.params.size());
            }
            const auto& param = method.params.front();
            if (param.type != declaration::type_expr::named(message.name)) {
                return fmt::format("takes {} instead of {}", declaration::to_string(param.type), message.name);
            }
            if (param.passing == passing_mode::shared_ref) {
                return fmt::format("takes {} by shared reference", message.name);
            }
            return {};
        }

        analysis_result reject(diagnostic diag) {
            log::debug("actor rejected: {}", to_string(diag));
            return analysis_result(std::move(diag));
        }

    } // namespace

    analysis_result analyze(const declaration_list& declarations, const synthesis_options& options) {
        auto pairs = options.linkage == linkage_mode::naming_convention
                         ? pairs_by_name(declarations, options)
                         : pairs_by_binding(declarations);

        if (pairs.size() != 1) {
            std::string names;
            for (const auto& pair : pairs) {
                names += fmt::format(" {}/{}", pair.processor->name, pair.message->name);
            }
            return reject(make_diagnostic(
                synthesis_errc::ambiguous_or_missing_pair,
                {},
                pairs.empty()
                    ? std::string("no processor is paired with a message type")
                    : fmt::format("{} processor/message pairs found:{}", pairs.size(), names)));
        }

        const auto& processor = *pairs.front().processor;
        const auto& message = *pairs.front().message;

        const method_decl* handler = nullptr;
        std::size_t handler_index = 0;
        std::string mismatch;
        for (std::size_t i = 0; i < processor.methods.size(); ++i) {
            const auto& method = processor.methods[i];
            if (method.name != options.handler_name) {
                continue;
            }
            auto reason = handler_mismatch(method, message);
            if (reason.empty()) {
                handler = &method;
                handler_index = i;
                break;
            }
            if (mismatch.empty()) {
                mismatch = std::move(reason);
            }
        }

        if (handler == nullptr) {
            return reject(make_diagnostic(
                synthesis_errc::missing_handler,
                processor.name,
                mismatch.empty()
                    ? fmt::format("{} declares no method {}", processor.name, options.handler_name)
                    : fmt::format("{}::{} {}", processor.name, options.handler_name, mismatch)));
        }

        if (message.variants.empty()) {
            return reject(make_diagnostic(
                synthesis_errc::empty_message_type,
                message.name,
                fmt::format("{} declares no variants", message.name)));
        }

        for (const auto& variant : message.variants) {
            auto count = variant.count_fields(options.response_field);
            if (count == 1) {
                continue;
            }
            return reject(make_diagnostic(
                synthesis_errc::missing_response_field,
                variant.name,
                count == 0
                    ? fmt::format("variant {} of {} has no {} field", variant.name, message.name, options.response_field)
                    : fmt::format("variant {} of {} has {} {} fields", variant.name, message.name, count, options.response_field)));
        }

        log::trace("actor accepted: {} handles {} via {}", processor.name, message.name, handler->name);
        return analysis_result(accepted_unit{
            processor,
            message,
            declaration::handler_binding{handler->name, handler_index}});
    }

    std::vector<declaration_list> partition_module(const declaration_list& declarations,
                                                   const synthesis_options& options) {
        std::vector<declaration_list> units;

        auto processors_named = [&](const std::string& name) {
            std::vector<processor_type> result;
            for (const auto& processor : declarations.processors) {
                if (processor.name == name) {
                    result.push_back(processor);
                }
            }
            return result;
        };

        if (options.linkage == linkage_mode::explicit_binding) {
            for (const auto& binding : declarations.bindings) {
                declaration_list unit;
                unit.processors = processors_named(binding.processor);
                for (const auto& message : declarations.messages) {
                    if (message.name == binding.message) {
                        unit.messages.push_back(message);
                    }
                }
                unit.bindings.push_back(binding);
                units.push_back(std::move(unit));
            }
            return units;
        }

        for (const auto& message : declarations.messages) {
            if (!has_suffix(message.name, options.message_suffix)) {
                continue;
            }
            declaration_list unit;
            unit.processors = processors_named(strip_suffix(message.name, options.message_suffix));
            unit.messages.push_back(message);
            units.push_back(std::move(unit));
        }
        return units;
    }

    std::vector<analysis_result> analyze_module(const declaration_list& declarations,
                                                const synthesis_options& options) {
        std::vector<analysis_result> results;
        for (const auto& unit : partition_module(declarations, options)) {
            results.push_back(analyze(unit, options));
        }
        return results;
    }

} // namespace actor_synth
