#pragma once

#include <string>
#include <vector>

#include <actor-synth/declaration/model.hpp>
#include <actor-synth/derive/contract.hpp>

namespace actor_synth {

    /// @brief Queue between the handle clones and the worker
    struct mailbox_model {
        std::string message_name;
        bool unbounded = true;
        bool multi_producer = true;
        bool single_consumer = true;
    };

    /// @brief A variant whose response field now carries a reply slot
    struct augmented_variant {
        std::string name;
        /// Declared fields in order; the response field keeps its position.
        std::vector<declaration::field_decl> fields;
        std::size_t response_field_index = 0;
        declaration::type_expr response_type;
    };

    struct augmented_message {
        std::string name;
        std::vector<augmented_variant> variants;
    };

    /// @brief Private side: actor_worker<Processor, Message>, which owns the
    /// mailbox consumer end and the processor instance
    struct worker_model {
        std::string name;
        std::string processor_name;
        std::string message_name;
        std::string handler_name;
        std::vector<declaration::field_decl> processor_fields;
    };

    struct operation_model {
        std::string name;
        std::string variant_name;
        call_mode mode = call_mode::wait;
        /// Empty for no-wait operations.
        declaration::type_expr response_type;
    };

    enum class construction_step {
        create_mailbox,
        bind_processor,
        spawn_worker,
        return_handle
    };

    /// @brief Public side: producer end plus the derived operations
    struct handle_model {
        std::string name;
        std::string message_name;
        std::vector<operation_model> operations;
        std::vector<construction_step> construction;
    };

    /// @brief Everything generated for one accepted actor
    struct output_model {
        augmented_message message;
        mailbox_model mailbox;
        worker_model worker;
        handle_model handle;
        std::vector<variant_contract> contracts;
    };

    const char* to_string(construction_step step) noexcept;

} // namespace actor_synth
