#pragma once

#include <stdexcept>
#include <variant>
#include <vector>

#include <actor-synth/runtime.hpp>

/// Hand-written counterpart of what the emitter produces for Calc / CalcMsg.
namespace calc_msg {

    struct MsgOne {
        int value;
        actor_synth::reply_slot<int> resp;
    };

    struct MsgTwo {
        float value;
        actor_synth::reply_slot<float> resp;
    };

    /// throws from the handler when value < 0
    struct Fail {
        int value;
        actor_synth::reply_slot<int> resp;
    };

    /// handler keeps the slot and answers on the next MsgOne
    struct Defer {
        int value;
        actor_synth::reply_slot<int> resp;
    };

    /// handler drops the slot without answering
    struct Ignore {
        int value;
        actor_synth::reply_slot<int> resp;
    };

} // namespace calc_msg

using CalcMsg = std::variant<calc_msg::MsgOne, calc_msg::MsgTwo, calc_msg::Fail, calc_msg::Defer, calc_msg::Ignore>;

class Calc final {
public:
    Calc() = default;

    explicit Calc(std::vector<int>* journal)
        : journal_(journal) {}

    void process(CalcMsg& msg) {
        if (auto* one = std::get_if<calc_msg::MsgOne>(&msg)) {
            record(one->value);
            if (deferred_.valid()) {
                deferred_.send(one->value);
            }
            one->resp.reply(one->value + 100);
        } else if (auto* two = std::get_if<calc_msg::MsgTwo>(&msg)) {
            two->resp.reply(two->value * 10.0f);
        } else if (auto* fail = std::get_if<calc_msg::Fail>(&msg)) {
            if (fail->value < 0) {
                throw std::runtime_error("negative value");
            }
            fail->resp.reply(fail->value);
        } else if (auto* defer = std::get_if<calc_msg::Defer>(&msg)) {
            deferred_ = defer->resp.take();
        }
    }

private:
    void record(int value) {
        if (journal_ != nullptr) {
            journal_->push_back(value);
        }
    }

    std::vector<int>* journal_ = nullptr;
    actor_synth::response_sender<int> deferred_;
};
