#pragma once

// clang-format off
#include <actor-synth/config.hpp>
#include <actor-synth/error.hpp>
#include <actor-synth/log.hpp>
// clang-format on

#include <actor-synth/runtime/result.hpp>
#include <actor-synth/runtime/reply_slot.hpp>
#include <actor-synth/runtime/mailbox.hpp>
#include <actor-synth/runtime/message_traits.hpp>
#include <actor-synth/runtime/actor_handle.hpp>
#include <actor-synth/runtime/actor_worker.hpp>
#include <actor-synth/runtime/actor_runtime.hpp>
