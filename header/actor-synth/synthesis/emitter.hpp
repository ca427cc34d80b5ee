#pragma once

#include <string>
#include <vector>

#include <actor-synth/synthesis/output_model.hpp>

namespace actor_synth {

    struct emit_options {
        /// Namespace that receives the messages and the handle classes.
        std::string namespace_name = "generated";
        /// Prefix put in front of processor names, e.g. "app::".
        std::string processor_scope;
        /// Header the actor section includes to see the messages.
        std::string messages_header;
        /// Extra headers; for the actor section these declare the processors.
        std::vector<std::string> includes;
    };

    /// @brief Namespace holding the variant structs of a message, `CalcMsg` -> `calc_msg`
    std::string variants_namespace(const augmented_message& message);

    /// @brief Variant structs with `resp` as reply_slot, plus the std::variant alias per message
    std::string emit_messages_header(const std::vector<output_model>& models, const emit_options& options = {});

    /// @brief Worker aliases and handle classes; needs the messages and processors declared
    std::string emit_actor_header(const std::vector<output_model>& models, const emit_options& options = {});

    /// @brief Both sections in one header, the includes placed between them
    std::string emit_header(const std::vector<output_model>& models, const emit_options& options = {});

    std::string emit_header(const output_model& model, const emit_options& options = {});

} // namespace actor_synth
