#pragma once

#include <string>
#include <utility>
#include <vector>

#include <actor-synth/declaration/model.hpp>

namespace actor_synth { namespace test {

    using declaration::declaration_list;
    using declaration::field_decl;
    using declaration::message_type;
    using declaration::method_decl;
    using declaration::param_decl;
    using declaration::passing_mode;
    using declaration::processor_type;
    using declaration::receiver_mode;
    using declaration::type_expr;
    using declaration::variant_decl;

    inline field_decl field(std::string name, std::string type) {
        return field_decl{std::move(name), type_expr::named(std::move(type))};
    }

    inline variant_decl variant(std::string name, std::string value_type, std::string resp_type) {
        return variant_decl{std::move(name), {field("value", std::move(value_type)), field("resp", std::move(resp_type))}};
    }

    /// async process(&mut self, msg: <message>)
    inline method_decl handler(const std::string& message, passing_mode passing = passing_mode::exclusive_ref) {
        method_decl method;
        method.name = "process";
        method.receiver = receiver_mode::exclusive;
        method.params.push_back(param_decl{"msg", type_expr::named(message), passing});
        method.is_async = true;
        return method;
    }

    inline processor_type processor(const std::string& name, const std::string& message) {
        processor_type result;
        result.name = name;
        result.fields.push_back(field("total", "int"));
        result.methods.push_back(handler(message));
        return result;
    }

    /// Calc / CalcMsg { MsgOne{value:int, resp:int}, MsgTwo{value:float, resp:float} }
    inline declaration_list calc_declarations() {
        declaration_list decls;
        decls.processors.push_back(processor("Calc", "CalcMsg"));
        decls.messages.push_back(message_type{
            "CalcMsg",
            {variant("MsgOne", "int", "int"), variant("MsgTwo", "float", "float")}});
        return decls;
    }

    /// Store / StoreMsg whose variant and field names collide with generated members
    inline declaration_list store_declarations() {
        declaration_list decls;
        decls.processors.push_back(processor("Store", "StoreMsg"));
        decls.messages.push_back(message_type{
            "StoreMsg",
            {variant("Handle", "int", "int"),
             variant("MessageType", "int", "int"),
             variant_decl{"Close",
                          {field("class", "int"),
                           field_decl{"limit", type_expr::generic("Option", {type_expr::named("int")})},
                           field("resp", "int")}},
             variant("StoreMsg", "int", "int")}});
        return decls;
    }

}} // namespace actor_synth::test
