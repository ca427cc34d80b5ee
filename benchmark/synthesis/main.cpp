#include <benchmark/benchmark.h>

#include <string>

#include <actor-synth.hpp>

namespace {

    using namespace actor_synth::declaration;

    /// One processor and a message type with `variants` variants.
    declaration_list wide_module(int variants) {
        processor_type processor;
        processor.name = "Wide";
        method_decl process;
        process.name = "process";
        process.is_async = true;
        process.params.push_back(param_decl{"msg", type_expr::named("WideMsg"), passing_mode::exclusive_ref});
        processor.methods.push_back(process);

        message_type message;
        message.name = "WideMsg";
        for (int i = 0; i < variants; ++i) {
            message.variants.push_back(variant_decl{
                "GetHTTPValue" + std::to_string(i) + "Now",
                {field_decl{"key", type_expr::named("int")},
                 field_decl{"resp", type_expr::generic("std::optional", {type_expr::named("int")})}}});
        }

        declaration_list module;
        module.processors.push_back(processor);
        module.messages.push_back(message);
        return module;
    }

} // namespace

static void BM_SnakeCase(benchmark::State& state) {
    for (auto _ : state) {
        auto name = actor_synth::make_operation_name("GetHTTPResponseHeader");
        benchmark::DoNotOptimize(name);
    }
}
BENCHMARK(BM_SnakeCase);

static void BM_Generate(benchmark::State& state) {
    const auto module = wide_module(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto result = actor_synth::generate(module);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_Generate)->Arg(2)->Arg(16)->Arg(128);

static void BM_EmitHeader(benchmark::State& state) {
    const auto result = actor_synth::generate(wide_module(static_cast<int>(state.range(0))));
    for (auto _ : state) {
        auto text = actor_synth::emit_header(result.value());
        benchmark::DoNotOptimize(text);
    }
}
BENCHMARK(BM_EmitHeader)->Arg(2)->Arg(16)->Arg(128);

BENCHMARK_MAIN();
