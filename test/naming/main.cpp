#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <string>
#include <vector>

#include <actor-synth/derive/naming.hpp>

using actor_synth::is_keyword;
using actor_synth::is_reserved_word;
using actor_synth::is_valid_identifier;
using actor_synth::make_field_name;
using actor_synth::make_operation_name;
using actor_synth::to_snake_case;

TEST_CASE("naming - camel case variants") {
    REQUIRE(to_snake_case("MsgOne") == "msg_one");
    REQUIRE(to_snake_case("MsgTwo") == "msg_two");
    REQUIRE(to_snake_case("Ping") == "ping");
    REQUIRE(to_snake_case("GetValue") == "get_value");
    REQUIRE(to_snake_case("getValue") == "get_value");
}

TEST_CASE("naming - uppercase runs") {
    REQUIRE(to_snake_case("HTTPServer") == "http_server");
    REQUIRE(to_snake_case("GetHTTPResponse") == "get_http_response");
    REQUIRE(to_snake_case("IO") == "io");
    REQUIRE(to_snake_case("ParseURL") == "parse_url");
}

TEST_CASE("naming - digits stay with the preceding word") {
    REQUIRE(to_snake_case("Msg2") == "msg2");
    REQUIRE(to_snake_case("Msg2Go") == "msg2_go");
    REQUIRE(to_snake_case("Sha256Digest") == "sha256_digest");
}

TEST_CASE("naming - underscores separate words") {
    REQUIRE(to_snake_case("msg_one") == "msg_one");
    REQUIRE(to_snake_case("Msg_One") == "msg_one");
    REQUIRE(to_snake_case("__Leading") == "leading");
}

TEST_CASE("naming - reserved words get a trailing underscore") {
    REQUIRE(is_reserved_word("delete"));
    REQUIRE(is_reserved_word("class"));
    REQUIRE(is_reserved_word("close"));
    REQUIRE_FALSE(is_reserved_word("msg_one"));

    REQUIRE(make_operation_name("Delete") == "delete_");
    REQUIRE(make_operation_name("Return") == "return_");
    REQUIRE(make_operation_name("Close") == "close_");
    REQUIRE(make_operation_name("Spawn") == "spawn_");
    REQUIRE(make_operation_name("DeleteAll") == "delete_all");
}

TEST_CASE("naming - members of the generated handle are reserved") {
    REQUIRE(is_reserved_word("handle_"));
    REQUIRE(is_reserved_word("message_type"));
    REQUIRE(is_reserved_word("processor_type"));
    REQUIRE(is_reserved_word("get_handle"));
    REQUIRE_FALSE(is_keyword("message_type"));

    REQUIRE(make_operation_name("MessageType") == "message_type_");
    REQUIRE(make_operation_name("ProcessorType") == "processor_type_");
    REQUIRE(make_operation_name("GetHandle") == "get_handle_");
    REQUIRE(make_operation_name("Handle") == "handle");
    REQUIRE(make_operation_name("Handle") != "handle_");
}

TEST_CASE("naming - suffix goes on before escaping") {
    REQUIRE(make_operation_name("Close", "_no_wait") == "close_no_wait");
    REQUIRE(make_operation_name("Delete", "_no_wait") == "delete_no_wait");
    REQUIRE(make_operation_name("MsgOne", "_no_wait") == "msg_one_no_wait");
    REQUIRE(make_operation_name("9Lives", "_no_wait") == "_9_lives_no_wait");
    REQUIRE(make_operation_name("Message", "_type") == "message_type_");
}

TEST_CASE("naming - field names") {
    REQUIRE(make_field_name("class") == "class_");
    REQUIRE(make_field_name("value") == "value");
    REQUIRE(make_field_name("close") == "close");
    REQUIRE(make_field_name("resp") == "resp");
}

TEST_CASE("naming - result is always a valid identifier") {
    const std::vector<std::string> inputs = {
        "MsgOne", "HTTPServer", "Delete", "X", "_", "9Lives", "A1B2", "already_snake", "Namespace", "ABC",
        "Close", "Spawn", "Handle", "MessageType", "ProcessorType", "GetHandle"};
    for (const auto& input : inputs) {
        INFO(input);
        auto name = make_operation_name(input);
        REQUIRE(is_valid_identifier(name));
        REQUIRE_FALSE(is_reserved_word(name));
        REQUIRE(make_operation_name(input) == name);

        auto no_wait = make_operation_name(input, "_no_wait");
        REQUIRE(is_valid_identifier(no_wait));
        REQUIRE_FALSE(is_reserved_word(no_wait));
    }
    REQUIRE(make_operation_name("9Lives") == "_9_lives");
    REQUIRE(make_operation_name("_") == "_");
}

TEST_CASE("naming - identifier validity") {
    REQUIRE(is_valid_identifier("msg_one"));
    REQUIRE(is_valid_identifier("_x1"));
    REQUIRE_FALSE(is_valid_identifier(""));
    REQUIRE_FALSE(is_valid_identifier("1abc"));
    REQUIRE_FALSE(is_valid_identifier("a-b"));
    REQUIRE_FALSE(is_valid_identifier("close__no_wait"));
    REQUIRE_FALSE(is_valid_identifier("_Upper"));
}
