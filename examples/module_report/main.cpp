#include <string>

#include <fmt/core.h>

#include <actor-synth.hpp>

/// Runs the analyzer over a module with several candidate actors and
/// prints, per unit, either the derived operations or the rejection.
int main() {
    using namespace actor_synth::declaration;

    auto handler = [](const std::string& message) {
        method_decl method;
        method.name = "process";
        method.is_async = true;
        method.params.push_back(param_decl{"msg", type_expr::named(message), passing_mode::exclusive_ref});
        return method;
    };
    auto reply_variant = [](const std::string& name, const std::string& value, const std::string& resp) {
        return variant_decl{name, {field_decl{"value", type_expr::named(value)}, field_decl{"resp", type_expr::named(resp)}}};
    };

    declaration_list module;
    module.processors.push_back(processor_type{"Store", {}, {handler("StoreMsg")}});
    module.messages.push_back(message_type{
        "StoreMsg", {reply_variant("Put", "std::string", "bool"), reply_variant("GetHTTPHeader", "std::string", "std::string")}});

    module.processors.push_back(processor_type{"Clock", {}, {}});
    module.messages.push_back(message_type{"ClockMsg", {reply_variant("Now", "int", "long")}});

    module.processors.push_back(processor_type{"Echo", {}, {handler("EchoMsg")}});
    module.messages.push_back(message_type{"EchoMsg", {variant_decl{"Say", {field_decl{"text", type_expr::named("std::string")}}}}});

    for (const auto& result : actor_synth::generate_module(module)) {
        if (!result) {
            fmt::print("rejected  {}\n", actor_synth::to_string(result.error()));
            continue;
        }
        const auto& out = result.value();
        fmt::print("accepted  {} -> {}\n", out.handle.message_name, out.handle.name);
        for (const auto& op : out.handle.operations) {
            if (op.mode == actor_synth::call_mode::wait) {
                fmt::print("          {}({}) -> result<{}>\n", op.name, op.variant_name, to_string(op.response_type));
            } else {
                fmt::print("          {}({}) -> result<void>\n", op.name, op.variant_name);
            }
        }
    }
    return 0;
}
