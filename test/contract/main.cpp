#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <actor-synth/derive/contract.hpp>
#include <actor-synth/error.hpp>

#include "../tooltestsuites/declarations.hpp"

using namespace actor_synth::test;
using actor_synth::call_mode;
using actor_synth::derive;
using actor_synth::derive_all;
using actor_synth::synthesis_errc;
using actor_synth::synthesis_options;
using actor_synth::unwrap_optional;

TEST_CASE("contract - derive one variant") {
    auto contract = derive(variant("MsgOne", "int", "int"));
    REQUIRE(contract.variant_name == "MsgOne");
    REQUIRE(contract.operation_name == "msg_one");
    REQUIRE(contract.no_wait_name == "msg_one_no_wait");
    REQUIRE(contract.response_type == type_expr::named("int"));
    REQUIRE(contract.response_field_index == 1);
    REQUIRE(contract.wait_signature.name == "msg_one");
    REQUIRE(contract.wait_signature.mode == call_mode::wait);
    REQUIRE(contract.wait_signature.value_type == type_expr::named("int"));
    REQUIRE(contract.no_wait_signature.name == "msg_one_no_wait");
    REQUIRE(contract.no_wait_signature.mode == call_mode::no_wait);
    REQUIRE(contract.no_wait_signature.value_type.empty());
}

TEST_CASE("contract - response field may come first") {
    variant_decl v{"Query", {field("resp", "std::string"), field("key", "int")}};
    auto contract = derive(v);
    REQUIRE(contract.response_field_index == 0);
    REQUIRE(contract.response_type == type_expr::named("std::string"));
}

TEST_CASE("contract - optional wrapper removed from the response type") {
    auto wrapped = type_expr::generic("Option", {type_expr::named("int")});
    REQUIRE(unwrap_optional(wrapped) == type_expr::named("int"));
    REQUIRE(unwrap_optional(type_expr::generic("std::optional", {type_expr::named("double")})) == type_expr::named("double"));
    REQUIRE(unwrap_optional(type_expr::generic("optional", {type_expr::named("bool")})) == type_expr::named("bool"));

    auto vec = type_expr::generic("std::vector", {type_expr::named("int")});
    REQUIRE(unwrap_optional(vec) == vec);

    variant_decl v{"Lookup", {field("key", "int"), field_decl{"resp", wrapped}}};
    auto contract = derive(v);
    REQUIRE(contract.response_type == type_expr::named("int"));
    REQUIRE(contract.declared_response_type == wrapped);
}

TEST_CASE("contract - escaped names keep a single underscore before the suffix") {
    auto close = derive(variant("Close", "int", "int"));
    REQUIRE(close.operation_name == "close_");
    REQUIRE(close.no_wait_name == "close_no_wait");

    auto del = derive(variant("Delete", "int", "int"));
    REQUIRE(del.operation_name == "delete_");
    REQUIRE(del.no_wait_name == "delete_no_wait");
}

TEST_CASE("contract - configured no-wait suffix") {
    synthesis_options options;
    options.no_wait_suffix = "_async";
    auto contract = derive(variant("Ping", "int", "int"), options);
    REQUIRE(contract.no_wait_name == "ping_async");
}

TEST_CASE("contract - derive_all keeps variant order") {
    auto decls = calc_declarations();
    auto contracts = derive_all(decls.messages.front());
    REQUIRE(contracts.ok());
    REQUIRE(contracts.value().size() == 2);
    REQUIRE(contracts.value()[0].operation_name == "msg_one");
    REQUIRE(contracts.value()[1].operation_name == "msg_two");
    REQUIRE(contracts.value()[1].response_type == type_expr::named("float"));
}

TEST_CASE("contract - duplicate operation names") {
    SECTION("same snake case") {
        message_type message{"DupMsg", {variant("MsgOne", "int", "int"), variant("Msg_One", "int", "int")}};
        auto contracts = derive_all(message);
        REQUIRE_FALSE(contracts);
        REQUIRE(contracts.code() == synthesis_errc::duplicate_operation_name);
        REQUIRE(contracts.error().subject == "Msg_One");
    }
    SECTION("wait name equals another no-wait name") {
        message_type message{"DupMsg", {variant("Ping", "int", "int"), variant("PingNoWait", "int", "int")}};
        auto contracts = derive_all(message);
        REQUIRE(contracts.code() == synthesis_errc::duplicate_operation_name);
        REQUIRE(contracts.error().message.find("ping_no_wait") != std::string::npos);
    }
}

TEST_CASE("contract - deterministic") {
    auto decls = calc_declarations();
    auto first = derive_all(decls.messages.front());
    auto second = derive_all(decls.messages.front());
    REQUIRE(first.ok());
    REQUIRE(second.ok());
    for (std::size_t i = 0; i < first.value().size(); ++i) {
        REQUIRE(first.value()[i].operation_name == second.value()[i].operation_name);
        REQUIRE(first.value()[i].no_wait_name == second.value()[i].no_wait_name);
        REQUIRE(first.value()[i].response_type == second.value()[i].response_type);
    }
}
