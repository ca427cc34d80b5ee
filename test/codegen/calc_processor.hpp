#pragma once

#include <optional>
#include <string>
#include <variant>

#include "calc_messages.hpp"

namespace codegen {

    class Calc final {
    public:
        void process(generated::CalcMsg& msg) {
            ++calls_;
            std::visit([this](auto& v) { handle(v); }, msg);
        }

    private:
        void handle(generated::calc_msg::MsgOne& m) {
            m.resp.reply(m.value + 100);
        }

        void handle(generated::calc_msg::MsgTwo& m) {
            m.resp.reply(m.value * 10.0f);
        }

        void handle(generated::calc_msg::Lookup& m) {
            if (m.key == 0) {
                m.resp.reply(std::to_string(calls_));
            }
        }

        int calls_ = 0;
    };

    class Store final {
    public:
        void process(generated::StoreMsg& msg) {
            std::visit([](auto& v) { on(v); }, msg);
        }

    private:
        static void on(generated::store_msg::Handle& m) {
            m.resp.reply(1);
        }

        static void on(generated::store_msg::MessageType& m) {
            m.resp.reply(2);
        }

        static void on(generated::store_msg::Close& m) {
            m.resp.reply(m.class_ + m.limit.value_or(0));
        }

        static void on(generated::store_msg::StoreMsg& m) {
            m.resp.reply(m.value);
        }
    };

} // namespace codegen
