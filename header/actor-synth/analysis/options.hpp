#pragma once

#include <string>

namespace actor_synth {

    /// @brief How a processor is paired with its message type
    enum class linkage_mode {
        /// message name == processor name + message_suffix
        naming_convention,
        /// declaration_list::bindings names both sides
        explicit_binding
    };

    struct synthesis_options {
        std::string message_suffix = "Msg";
        std::string handler_name = "process";
        std::string response_field = "resp";
        std::string no_wait_suffix = "_no_wait";
        std::string handle_prefix = "Actor";
        std::string worker_suffix = "Worker";
        linkage_mode linkage = linkage_mode::naming_convention;
    };

} // namespace actor_synth
