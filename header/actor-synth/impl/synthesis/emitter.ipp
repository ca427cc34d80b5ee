#pragma once

#include <iterator>
#include <string>

#include <fmt/format.h>

#include <actor-synth/derive/contract.hpp>
#include <actor-synth/derive/naming.hpp>
#include <actor-synth/synthesis/emitter.hpp>

namespace actor_synth {

    namespace {

        using buffer_t = fmt::memory_buffer;

        void write_preamble(buffer_t& out) {
            fmt::format_to(std::back_inserter(out), "// Generated by actor-synth. Do not edit.\n#pragma once\n\n");
        }

        void write_include(buffer_t& out, const std::string& header) {
            if (header.empty()) {
                return;
            }
            if (header.front() == '<' || header.front() == '"') {
                fmt::format_to(std::back_inserter(out), "#include {}\n", header);
            } else {
                fmt::format_to(std::back_inserter(out), "#include \"{}\"\n", header);
            }
        }

        void open_namespace(buffer_t& out, const emit_options& options) {
            fmt::format_to(std::back_inserter(out), "namespace {} {{\n", options.namespace_name);
        }

        void close_namespace(buffer_t& out, const emit_options& options) {
            fmt::format_to(std::back_inserter(out), "}} // namespace {}\n", options.namespace_name);
        }

        // declared types as C++: optional wrappers become std::optional
        std::string render_type(const declaration::type_expr& type) {
            std::string out = is_optional_wrapper(type) ? std::string("std::optional") : type.name;
            if (type.args.empty()) {
                return out;
            }
            out += '<';
            for (std::size_t i = 0; i < type.args.size(); ++i) {
                if (i != 0) {
                    out += ", ";
                }
                out += render_type(type.args[i]);
            }
            out += '>';
            return out;
        }

        void write_messages(buffer_t& out, const output_model& model) {
            const auto& message = model.message;
            const auto scope = variants_namespace(message);

            fmt::format_to(std::back_inserter(out), "\n    namespace {} {{\n", scope);
            for (const auto& variant : message.variants) {
                fmt::format_to(std::back_inserter(out), "\n        struct {} {{\n", variant.name);
                for (std::size_t i = 0; i < variant.fields.size(); ++i) {
                    const auto& field = variant.fields[i];
                    if (i == variant.response_field_index) {
                        fmt::format_to(std::back_inserter(out), "            actor_synth::reply_slot<{}> {};\n",
                                       render_type(variant.response_type), field.name);
                    } else {
                        fmt::format_to(std::back_inserter(out), "            {} {};\n",
                                       render_type(field.type), make_field_name(field.name));
                    }
                }
                fmt::format_to(std::back_inserter(out), "        }};\n");
            }
            fmt::format_to(std::back_inserter(out), "\n    }} // namespace {}\n\n", scope);

            fmt::format_to(std::back_inserter(out), "    using {} = std::variant<", message.name);
            for (std::size_t i = 0; i < message.variants.size(); ++i) {
                fmt::format_to(std::back_inserter(out), "{}{}::{}", i == 0 ? "" : ", ", scope, message.variants[i].name);
            }
            fmt::format_to(std::back_inserter(out), ">;\n");
        }

        // two overloads per operation: the variant struct, and the whole message
        // whose tag the handle checks. Names inside the class are fully
        // qualified; an operation may shadow them.
        void write_operation(buffer_t& out, const operation_model& op, const std::string& variant) {
            if (op.mode == call_mode::wait) {
                fmt::format_to(std::back_inserter(out),
                               "\n        ::actor_synth::result<{0}> {1}({2} message) {{\n"
                               "            return handle_.call<{2}>(message_type(std::move(message)));\n"
                               "        }}\n"
                               "\n        ::actor_synth::result<{0}> {1}(message_type message) {{\n"
                               "            return handle_.call<{2}>(std::move(message));\n"
                               "        }}\n",
                               render_type(op.response_type), op.name, variant);
            } else {
                fmt::format_to(std::back_inserter(out),
                               "\n        ::actor_synth::result<void> {0}({1} message) {{\n"
                               "            return handle_.call_no_wait<{1}>(message_type(std::move(message)));\n"
                               "        }}\n"
                               "\n        ::actor_synth::result<void> {0}(message_type message) {{\n"
                               "            return handle_.call_no_wait<{1}>(std::move(message));\n"
                               "        }}\n",
                               op.name, variant);
            }
        }

        void write_actor(buffer_t& out, const output_model& model, const emit_options& options) {
            const auto& message_name = model.handle.message_name;
            const auto processor = options.processor_scope + model.worker.processor_name;
            const auto& handle_name = model.handle.name;
            const auto qualified_scope = fmt::format("::{}::{}", options.namespace_name, variants_namespace(model.message));

            fmt::format_to(std::back_inserter(out),
                           "\n    using {} = actor_synth::actor_worker<{}, {}>;\n\n",
                           model.worker.name, processor, message_name);

            fmt::format_to(std::back_inserter(out),
                           "    class {0} final {{\n"
                           "    public:\n"
                           "        using message_type = ::{3}::{1};\n"
                           "        using processor_type = {2};\n"
                           "\n"
                           "        {0}() = default;\n"
                           "\n"
                           "        explicit {0}(::actor_synth::actor_handle<message_type> handle)\n"
                           "            : handle_(std::move(handle)) {{}}\n"
                           "\n"
                           "        template<class Runtime, class... Args>\n"
                           "        static {0} spawn(Runtime& runtime, Args&&... args) {{\n"
                           "            return {0}(runtime.template spawn<processor_type, message_type>(std::forward<Args>(args)...));\n"
                           "        }}\n",
                           handle_name, message_name, processor, options.namespace_name);

            for (const auto& op : model.handle.operations) {
                write_operation(out, op, fmt::format("{}::{}", qualified_scope, op.variant_name));
            }

            fmt::format_to(std::back_inserter(out),
                           "\n"
                           "        void close() {{\n"
                           "            handle_.close();\n"
                           "        }}\n"
                           "\n"
                           "        const ::actor_synth::actor_handle<message_type>& get_handle() const noexcept {{\n"
                           "            return handle_;\n"
                           "        }}\n"
                           "\n"
                           "    private:\n"
                           "        ::actor_synth::actor_handle<message_type> handle_;\n"
                           "    }};\n");
        }

        void write_messages_section(buffer_t& out, const std::vector<output_model>& models, const emit_options& options) {
            open_namespace(out, options);
            for (const auto& model : models) {
                write_messages(out, model);
            }
            fmt::format_to(std::back_inserter(out), "\n");
            close_namespace(out, options);
        }

        void write_actor_section(buffer_t& out, const std::vector<output_model>& models, const emit_options& options) {
            open_namespace(out, options);
            for (const auto& model : models) {
                write_actor(out, model, options);
            }
            fmt::format_to(std::back_inserter(out), "\n");
            close_namespace(out, options);
        }

    } // namespace

    std::string variants_namespace(const augmented_message& message) {
        return make_operation_name(message.name);
    }

    std::string emit_messages_header(const std::vector<output_model>& models, const emit_options& options) {
        buffer_t out;
        write_preamble(out);
        write_include(out, "<optional>");
        write_include(out, "<variant>");
        write_include(out, "<actor-synth/runtime/reply_slot.hpp>");
        for (const auto& header : options.includes) {
            write_include(out, header);
        }
        fmt::format_to(std::back_inserter(out), "\n");
        write_messages_section(out, models, options);
        return fmt::to_string(out);
    }

    std::string emit_actor_header(const std::vector<output_model>& models, const emit_options& options) {
        buffer_t out;
        write_preamble(out);
        write_include(out, "<utility>");
        write_include(out, "<actor-synth/runtime.hpp>");
        write_include(out, options.messages_header);
        for (const auto& header : options.includes) {
            write_include(out, header);
        }
        fmt::format_to(std::back_inserter(out), "\n");
        write_actor_section(out, models, options);
        return fmt::to_string(out);
    }

    std::string emit_header(const std::vector<output_model>& models, const emit_options& options) {
        buffer_t out;
        write_preamble(out);
        write_include(out, "<optional>");
        write_include(out, "<utility>");
        write_include(out, "<variant>");
        write_include(out, "<actor-synth/runtime.hpp>");
        fmt::format_to(std::back_inserter(out), "\n");
        write_messages_section(out, models, options);
        if (!options.includes.empty()) {
            fmt::format_to(std::back_inserter(out), "\n");
            for (const auto& header : options.includes) {
                write_include(out, header);
            }
        }
        fmt::format_to(std::back_inserter(out), "\n");
        write_actor_section(out, models, options);
        return fmt::to_string(out);
    }

    std::string emit_header(const output_model& model, const emit_options& options) {
        return emit_header(std::vector<output_model>{model}, options);
    }

} // namespace actor_synth
