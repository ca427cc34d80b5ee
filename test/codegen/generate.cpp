#include <cstdio>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include <actor-synth/analysis/diagnostic.hpp>
#include <actor-synth/synthesis/emitter.hpp>
#include <actor-synth/synthesis/synthesizer.hpp>

#include "calc_declarations.hpp"

namespace {

    bool write_file(const std::string& path, const std::string& text) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << text;
        return static_cast<bool>(out);
    }

} // namespace

/// usage: generate <output dir>
int main(int argc, char** argv) {
    if (argc != 2) {
        fmt::print(stderr, "usage: {} <output dir>\n", argv[0]);
        return 2;
    }
    const std::string dir = argv[1];

    std::vector<actor_synth::output_model> models;
    for (auto& result : actor_synth::generate_module(codegen::actors_module())) {
        if (!result) {
            fmt::print(stderr, "{}\n", actor_synth::to_string(result.error()));
            return 1;
        }
        models.push_back(std::move(result).value());
    }

    actor_synth::emit_options options;
    options.processor_scope = "codegen::";
    options.messages_header = "calc_messages.hpp";
    options.includes = {"<string>", "<optional>"};
    const auto messages = actor_synth::emit_messages_header(models, options);

    options.includes = {"calc_processor.hpp"};
    const auto actor = actor_synth::emit_actor_header(models, options);

    if (!write_file(dir + "/calc_messages.hpp", messages) || !write_file(dir + "/calc_actor.hpp", actor)) {
        fmt::print(stderr, "cannot write into {}\n", dir);
        return 1;
    }
    return 0;
}
