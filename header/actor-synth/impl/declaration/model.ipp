#pragma once

#include <algorithm>

#include <actor-synth/declaration/model.hpp>

namespace actor_synth { namespace declaration {

    bool operator==(const type_expr& lhs, const type_expr& rhs) {
        return lhs.name == rhs.name && lhs.args == rhs.args;
    }

    bool operator!=(const type_expr& lhs, const type_expr& rhs) {
        return !(lhs == rhs);
    }

    std::string to_string(const type_expr& type) {
        std::string out = type.name;
        if (type.args.empty()) {
            return out;
        }
        out += '<';
        for (std::size_t i = 0; i < type.args.size(); ++i) {
            if (i != 0) {
                out += ", ";
            }
            out += to_string(type.args[i]);
        }
        out += '>';
        return out;
    }

    const method_decl* processor_type::find_method(const std::string& method_name) const {
        auto it = std::find_if(methods.begin(), methods.end(), [&](const method_decl& m) {
            return m.name == method_name;
        });
        return it == methods.end() ? nullptr : &*it;
    }

    const field_decl* variant_decl::find_field(const std::string& field_name) const {
        auto it = std::find_if(fields.begin(), fields.end(), [&](const field_decl& f) {
            return f.name == field_name;
        });
        return it == fields.end() ? nullptr : &*it;
    }

    std::size_t variant_decl::count_fields(const std::string& field_name) const {
        return static_cast<std::size_t>(std::count_if(fields.begin(), fields.end(), [&](const field_decl& f) {
            return f.name == field_name;
        }));
    }

    const processor_type* declaration_list::find_processor(const std::string& processor_name) const {
        auto it = std::find_if(processors.begin(), processors.end(), [&](const processor_type& p) {
            return p.name == processor_name;
        });
        return it == processors.end() ? nullptr : &*it;
    }

    const message_type* declaration_list::find_message(const std::string& message_name) const {
        auto it = std::find_if(messages.begin(), messages.end(), [&](const message_type& m) {
            return m.name == message_name;
        });
        return it == messages.end() ? nullptr : &*it;
    }

}} // namespace actor_synth::declaration
