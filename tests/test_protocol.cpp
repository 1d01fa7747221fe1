#include "xpl/ipc/protocol.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace xpl;
using namespace xpl::protocol;

// ─────────────────────────────────────────────────────────────────────────────
// Requests
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Request channel and id are split from the body", "[protocol]")
{
    auto request = decode_request(R"(
channel = "window:beginDrag"
request_id = 7

[pointer]
x = 120
y = -40
)");

    REQUIRE(request.has_value());
    REQUIRE(request->channel == channel::BeginDrag);
    REQUIRE(request->request_id == 7);
    REQUIRE_FALSE(request->body.contains("channel"));

    auto pointer = decode_point(*request->body["pointer"].as_table());
    REQUIRE(pointer == Point{ 120, -40 });
}

TEST_CASE("Malformed requests are rejected", "[protocol]")
{
    REQUIRE_FALSE(decode_request("channel = ").has_value());
    REQUIRE_FALSE(decode_request("request_id = 3").has_value());
    REQUIRE_FALSE(decode_request("channel = \"\"").has_value());
}

TEST_CASE("Request without an id expects no reply", "[protocol]")
{
    auto request = decode_request("channel = \"window:minimize\"");
    REQUIRE(request.has_value());
    REQUIRE_FALSE(request->request_id.has_value());
}

TEST_CASE("Tab decoding enforces the history invariant", "[protocol]")
{
    auto valid = toml::parse(R"(
id = "t1"
path = "/b"
title = "b"
history = ["/a", "/b"]
history_index = 1
)");
    auto tab = decode_tab(valid);
    REQUIRE(tab.has_value());
    REQUIRE(tab->history.size() == 2);
    REQUIRE(tab->can_go_back());

    auto out_of_range = toml::parse(R"(
id = "t1"
path = "/b"
history = ["/a", "/b"]
history_index = 2
)");
    REQUIRE_FALSE(decode_tab(out_of_range).has_value());

    auto missing_path = toml::parse("id = \"t1\"");
    REQUIRE_FALSE(decode_tab(missing_path).has_value());

    auto bad_history = toml::parse("id = \"t1\"\npath = \"/\"\nhistory = [1, 2]");
    REQUIRE_FALSE(decode_tab(bad_history).has_value());
}

TEST_CASE("Window ids must be positive", "[protocol]")
{
    auto table = toml::parse("a = 3\nb = 0\nc = -1\nd = \"x\"");
    REQUIRE(decode_window_id(table, "a") == WindowId{ 3 });
    REQUIRE_FALSE(decode_window_id(table, "b").has_value());
    REQUIRE_FALSE(decode_window_id(table, "c").has_value());
    REQUIRE_FALSE(decode_window_id(table, "d").has_value());
    REQUIRE_FALSE(decode_window_id(table, "missing").has_value());
}

// ─────────────────────────────────────────────────────────────────────────────
// Records
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Property data splits into records on the separator", "[protocol]")
{
    std::string data = "a = 1";
    data += RECORD_SEPARATOR;
    data += RECORD_SEPARATOR;
    data += "b = 2";
    data += RECORD_SEPARATOR;

    auto records = split_records(data);
    REQUIRE(records.size() == 2);
    REQUIRE(records[0] == "a = 1");
    REQUIRE(records[1] == "b = 2");
    REQUIRE(split_records("").empty());
}

TEST_CASE("Signals carry their channel inside the record", "[protocol]")
{
    auto message = style_message(UiStyle::Glass);
    REQUIRE(message.channel == channel::StyleChanged);

    auto table = decode_message(message.payload);
    REQUIRE(table.has_value());
    REQUIRE((*table)["channel"].value_or(std::string{}) == "ui:style");
    REQUIRE((*table)["style"].value_or(std::string{}) == "glass");
}

TEST_CASE("Backend payloads are forwarded byte for byte", "[protocol]")
{
    std::string payload = "{\"event\":\"rename\",\"path\":\"/tmp/a \\\"b\\\"\"}";
    auto message = event_message(BackendEvent{ payload });

    auto table = decode_message(message.payload);
    REQUIRE(table.has_value());
    REQUIRE((*table)["payload"].value_or(std::string{}) == payload);
}

TEST_CASE("Reply carries request id, status and result", "[protocol]")
{
    auto message = reply_message(42, false, toml::table{ { "reason", "busy" } });
    auto table = decode_message(message.payload);

    REQUIRE(table.has_value());
    REQUIRE((*table)["request_id"].value_or(int64_t{ 0 }) == 42);
    REQUIRE_FALSE((*table)["ok"].value_or(true));
    REQUIRE((*table)["result"]["reason"].value_or(std::string{}) == "busy");
}
