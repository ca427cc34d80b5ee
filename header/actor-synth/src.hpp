#pragma once

// clang-format off
#include <actor-synth.hpp>

#include <actor-synth/impl/error.ipp>
#include <actor-synth/impl/log.ipp>

#include <actor-synth/impl/declaration/model.ipp>

#include <actor-synth/impl/analysis/diagnostic.ipp>
#include <actor-synth/impl/analysis/analyzer.ipp>

#include <actor-synth/impl/derive/naming.ipp>
#include <actor-synth/impl/derive/contract.ipp>

#include <actor-synth/impl/synthesis/synthesizer.ipp>
#include <actor-synth/impl/synthesis/emitter.ipp>
// clang-format on
