#include <actor-synth/src.hpp>
