#include <benchmark/benchmark.h>

#include <cstdint>
#include <variant>

#include <actor-synth/runtime.hpp>

namespace {

    class accumulator final {
    public:
        struct Add {
            std::int64_t value;
            actor_synth::reply_slot<std::int64_t> resp;
        };

        struct Reset {
            int unused;
            actor_synth::reply_slot<bool> resp;
        };

        using message = std::variant<Add, Reset>;

        void process(message& msg) {
            if (auto* add = std::get_if<Add>(&msg)) {
                total_ += add->value;
                add->resp.reply(total_);
            } else if (auto* reset = std::get_if<Reset>(&msg)) {
                total_ = 0;
                reset->resp.reply(true);
            }
        }

    private:
        std::int64_t total_ = 0;
    };

    actor_synth::runtime_config config_for(const benchmark::State& state) {
        actor_synth::runtime_config config;
        config.num_worker_threads = static_cast<std::size_t>(state.range(0));
        config.max_throughput = 64;
        return config;
    }

} // namespace

// Wait-form round trip: request, scheduling, handler, reply.
static void BM_CallWait(benchmark::State& state) {
    actor_synth::actor_runtime runtime(config_for(state));
    auto handle = runtime.spawn<accumulator, accumulator::message>();

    for (auto _ : state) {
        auto result = handle.call<accumulator::Add>(accumulator::Add{1, {}});
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_CallWait)->Arg(1)->Arg(2)->Arg(4);

// No-wait sends followed by one wait call that drains the mailbox.
static void BM_CallNoWaitBatch(benchmark::State& state) {
    actor_synth::actor_runtime runtime(config_for(state));
    auto handle = runtime.spawn<accumulator, accumulator::message>();
    const int batch = 256;

    for (auto _ : state) {
        for (int i = 0; i < batch; ++i) {
            auto sent = handle.call_no_wait<accumulator::Add>(accumulator::Add{1, {}});
            benchmark::DoNotOptimize(sent);
        }
        auto flushed = handle.call<accumulator::Reset>(accumulator::Reset{0, {}});
        benchmark::DoNotOptimize(flushed);
    }
    state.SetItemsProcessed(state.iterations() * (batch + 1));
}
BENCHMARK(BM_CallNoWaitBatch)->Arg(1)->Arg(4);

static void BM_ReplyPair(benchmark::State& state) {
    for (auto _ : state) {
        auto pair = actor_synth::make_reply_pair<int>();
        pair.first.send(1);
        auto value = pair.second.get();
        benchmark::DoNotOptimize(value);
    }
}
BENCHMARK(BM_ReplyPair);

static void BM_MailboxPushPop(benchmark::State& state) {
    actor_synth::mailbox::mailbox_t<int> box;
    for (auto _ : state) {
        box.push_back(1);
        auto value = box.pop_front();
        benchmark::DoNotOptimize(value);
    }
}
BENCHMARK(BM_MailboxPushPop);

BENCHMARK_MAIN();
