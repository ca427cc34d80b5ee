#pragma once

// clang-format off
#include <actor-synth/config.hpp>
#include <actor-synth/error.hpp>
#include <actor-synth/log.hpp>
// clang-format on

#include <actor-synth/declaration/model.hpp>
#include <actor-synth/analysis/options.hpp>
#include <actor-synth/analysis/diagnostic.hpp>
#include <actor-synth/analysis/analyzer.hpp>
#include <actor-synth/derive/naming.hpp>
#include <actor-synth/derive/contract.hpp>
#include <actor-synth/synthesis/output_model.hpp>
#include <actor-synth/synthesis/synthesizer.hpp>
#include <actor-synth/synthesis/emitter.hpp>
#include <actor-synth/runtime.hpp>

namespace actor_synth {

    using declaration::declaration_list;
    using declaration::message_type;
    using declaration::processor_type;
    using declaration::type_expr;

    using mailbox::enqueue_result;

} // namespace actor_synth
