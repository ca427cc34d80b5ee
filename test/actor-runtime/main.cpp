#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <memory>
#include <thread>
#include <vector>

#include <actor-synth/runtime.hpp>

#include "../tooltestsuites/calc.hpp"

using actor_synth::actor_runtime;
using actor_synth::operation_errc;

namespace {

    actor_synth::runtime_config pool(std::size_t threads) {
        actor_synth::runtime_config config;
        config.num_worker_threads = threads;
        config.max_throughput = 16;
        return config;
    }

    class counter final {
    public:
        struct Add {
            int value;
            actor_synth::reply_slot<int> resp;
        };

        struct Get {
            int unused;
            actor_synth::reply_slot<int> resp;
        };

        using message = std::variant<Add, Get>;

        void process(message& msg) {
            if (auto* add = std::get_if<Add>(&msg)) {
                total_ += add->value;
                add->resp.reply(total_);
            } else if (auto* get = std::get_if<Get>(&msg)) {
                get->resp.reply(total_);
            }
        }

    private:
        int total_ = 0;
    };

} // namespace

TEST_CASE("actor-runtime - end to end") {
    actor_runtime runtime(pool(2));
    auto calc = runtime.spawn<Calc, CalcMsg>();

    auto one = calc.call<calc_msg::MsgOne>(calc_msg::MsgOne{1, {}});
    REQUIRE(one.has_value());
    REQUIRE(one.value() == 101);

    auto two = calc.call<calc_msg::MsgTwo>(calc_msg::MsgTwo{3.0f, {}});
    REQUIRE(two.has_value());
    REQUIRE(two.value() == Approx(30.0f));

    auto fired = calc.call_no_wait<calc_msg::MsgOne>(calc_msg::MsgOne{1, {}});
    REQUIRE(fired.has_value());
}

TEST_CASE("actor-runtime - wait and no-wait reach the same handler") {
    std::vector<int> journal;
    actor_runtime runtime(pool(1));
    auto calc = runtime.spawn<Calc, CalcMsg>(&journal);

    REQUIRE(calc.call_no_wait<calc_msg::MsgOne>(calc_msg::MsgOne{1, {}}).has_value());
    REQUIRE(calc.call<calc_msg::MsgOne>(calc_msg::MsgOne{2, {}}).value() == 102);
    REQUIRE(journal == std::vector<int>{1, 2});
}

TEST_CASE("actor-runtime - clones share one worker") {
    actor_runtime runtime(pool(4));
    auto handle = runtime.spawn<counter, counter::message>();

    constexpr int senders = 4;
    constexpr int per_sender = 250;
    std::vector<std::thread> threads;
    std::atomic<int> failures{0};
    for (int s = 0; s < senders; ++s) {
        threads.emplace_back([clone = handle, &failures]() mutable {
            for (int i = 0; i < per_sender; ++i) {
                if (!clone.call_no_wait<counter::Add>(counter::Add{1, {}})) {
                    ++failures;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(failures.load() == 0);
    auto total = handle.call<counter::Get>(counter::Get{0, {}});
    REQUIRE(total.value() == senders * per_sender);
}

TEST_CASE("actor-runtime - many actors") {
    actor_runtime runtime(pool(4));
    std::vector<actor_synth::actor_handle<counter::message>> handles;
    for (int i = 0; i < 32; ++i) {
        handles.push_back(runtime.spawn<counter, counter::message>());
    }
    REQUIRE(runtime.size() == 32);

    std::vector<actor_synth::response_receiver<int>> replies;
    for (auto& h : handles) {
        auto reply = h.request<counter::Add>(counter::Add{5, {}});
        REQUIRE(reply.has_value());
        replies.push_back(std::move(reply).value());
    }
    for (auto& r : replies) {
        REQUIRE(r.get().value() == 5);
    }
}

TEST_CASE("actor-runtime - dropped handles let workers finish") {
    actor_runtime runtime(pool(2));
    {
        auto calc = runtime.spawn<Calc, CalcMsg>();
        REQUIRE(calc.call<calc_msg::MsgOne>(calc_msg::MsgOne{0, {}}).value() == 100);
    }
    for (int attempt = 0; attempt < 200 && runtime.collect() == 0; ++attempt) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    REQUIRE(runtime.size() == 0);
}

TEST_CASE("actor-runtime - handler exception") {
    actor_runtime runtime(pool(2));
    auto calc = runtime.spawn<Calc, CalcMsg>();
    auto failed = calc.call<calc_msg::Fail>(calc_msg::Fail{-1, {}});
    REQUIRE(failed.error() == operation_errc::mailbox_closed_or_abandoned);
    REQUIRE(calc.closed());
    REQUIRE(calc.call<calc_msg::MsgOne>(calc_msg::MsgOne{1, {}}).error() == operation_errc::send_failed);
}

TEST_CASE("actor-runtime - shutdown with traffic in flight") {
    auto runtime = std::make_unique<actor_runtime>(pool(2));
    auto handle = runtime->spawn<counter, counter::message>();
    for (int i = 0; i < 1000; ++i) {
        REQUIRE(handle.call_no_wait<counter::Add>(counter::Add{1, {}}).has_value());
    }
    runtime->shutdown();
    REQUIRE(handle.closed());
    REQUIRE(handle.call<counter::Get>(counter::Get{0, {}}).error() == operation_errc::send_failed);
    runtime.reset();
}

TEST_CASE("actor-runtime - sharing scheduler requeues until done") {
    struct stepper {
        actor_synth::scheduler::resume_info resume(std::size_t) {
            std::lock_guard<std::mutex> guard(mutex);
            if (++steps < 5) {
                return actor_synth::scheduler::resume_result::resume;
            }
            cv.notify_all();
            return actor_synth::scheduler::resume_result::done;
        }

        std::mutex mutex;
        std::condition_variable cv;
        int steps = 0;
    };

    stepper job;
    actor_synth::scheduler::sharing_scheduler scheduler(2, 1);
    scheduler.start();
    scheduler.enqueue(&job);
    {
        std::unique_lock<std::mutex> guard(job.mutex);
        REQUIRE(job.cv.wait_for(guard, std::chrono::seconds(5), [&] { return job.steps == 5; }));
    }
    scheduler.stop();
    REQUIRE(job.steps == 5);
}
