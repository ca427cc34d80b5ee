#include <cstdio>
#include <string>
#include <variant>

#include <fmt/core.h>

#include <actor-synth.hpp>

/// The declarations a front end would produce for:
///
///   struct Calc { total: i32 }
///   enum CalcMsg { MsgOne { value: i32, resp: i32 }, MsgTwo { value: f32, resp: f32 } }
///   impl Calc { async fn process(&mut self, msg: CalcMsg) }
actor_synth::declaration_list calc_module() {
    using namespace actor_synth::declaration;

    processor_type calc{"Calc", {field_decl{"total", type_expr::named("int")}}, {}};
    method_decl process;
    process.name = "process";
    process.is_async = true;
    process.params.push_back(param_decl{"msg", type_expr::named("CalcMsg"), passing_mode::exclusive_ref});
    calc.methods.push_back(process);

    message_type msg{"CalcMsg", {}};
    msg.variants.push_back(variant_decl{
        "MsgOne", {field_decl{"value", type_expr::named("int")}, field_decl{"resp", type_expr::named("int")}}});
    msg.variants.push_back(variant_decl{
        "MsgTwo", {field_decl{"value", type_expr::named("float")}, field_decl{"resp", type_expr::named("float")}}});

    actor_synth::declaration_list module;
    module.processors.push_back(calc);
    module.messages.push_back(msg);
    return module;
}

// What the emitted header defines, written out for the example.
namespace calc_msg {

    struct MsgOne {
        int value;
        actor_synth::reply_slot<int> resp;
    };

    struct MsgTwo {
        float value;
        actor_synth::reply_slot<float> resp;
    };

} // namespace calc_msg

using CalcMsg = std::variant<calc_msg::MsgOne, calc_msg::MsgTwo>;

class Calc final {
public:
    void process(CalcMsg& msg) {
        if (auto* one = std::get_if<calc_msg::MsgOne>(&msg)) {
            total_ += one->value;
            one->resp.reply(one->value + 100);
        } else if (auto* two = std::get_if<calc_msg::MsgTwo>(&msg)) {
            two->resp.reply(two->value * 10.0f);
        }
    }

private:
    int total_ = 0;
};

int main() {
    actor_synth::log::instance().set_level(actor_synth::log::level::info);

    auto result = actor_synth::generate(calc_module());
    if (!result) {
        fmt::print(stderr, "{}\n", actor_synth::to_string(result.error()));
        return 1;
    }
    fmt::print("{}\n", actor_synth::emit_header(result.value()));

    actor_synth::runtime_config config;
    config.num_worker_threads = 2;
    actor_synth::actor_runtime runtime(config);
    auto calc = runtime.spawn<Calc, CalcMsg>();

    auto one = calc.call<calc_msg::MsgOne>(calc_msg::MsgOne{1, {}});
    auto two = calc.call<calc_msg::MsgTwo>(calc_msg::MsgTwo{3.0f, {}});
    auto fired = calc.call_no_wait<calc_msg::MsgOne>(calc_msg::MsgOne{1, {}});

    if (!one || !two || !fired) {
        fmt::print(stderr, "call failed\n");
        return 1;
    }
    fmt::print("msg_one(1) = {}\nmsg_two(3.0) = {}\nmsg_one_no_wait(1) = ok\n", one.value(), two.value());

    calc.close();
    runtime.shutdown();
    return 0;
}
