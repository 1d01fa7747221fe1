#include "fake_backend.hpp"
#include "xpl/bridge/event_bridge.hpp"
#include "xpl/bridge/event_source.hpp"
#include <catch2/catch_test_macros.hpp>
#include <unistd.h>

using namespace xpl;
using namespace xpl::test;

namespace {

struct Fixture
{
    FakeBackend backend;
    WindowConfig config;
    WindowRegistry registry{ backend, config };
    EventBridge bridge{ registry };
    BackendEventSource source;

    WindowId open()
    {
        WindowId id = registry.create();
        registry.on_content_ready(id);
        return id;
    }

    std::vector<std::string> payloads(WindowId id)
    {
        std::vector<std::string> result;
        for (auto const& table : backend.received(id, protocol::channel::BackendEvent))
            result.push_back(table["payload"].value_or(std::string{}));
        return result;
    }
};

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Fan-out
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Every window receives every event in arrival order", "[bridge]")
{
    Fixture f;
    WindowId a = f.open();
    WindowId b = f.open();
    REQUIRE(f.bridge.subscribe(f.source));

    f.source.feed("E1\nE2\nE3\n");

    std::vector<std::string> expected{ "E1", "E2", "E3" };
    REQUIRE(f.payloads(a) == expected);
    REQUIRE(f.payloads(b) == expected);
    REQUIRE(f.bridge.published() == 3);
}

TEST_CASE("Window closed mid-stream only receives the events before its close", "[bridge]")
{
    Fixture f;
    WindowId a = f.open();
    WindowId b = f.open();
    f.bridge.subscribe(f.source);

    f.source.feed("E1\nE2\n");
    f.registry.request_close(b);
    f.source.feed("E3\n");
    f.registry.remove(b);
    f.source.feed("E4\n");

    REQUIRE(f.payloads(a) == std::vector<std::string>{ "E1", "E2", "E3", "E4" });
    REQUIRE(f.payloads(b) == std::vector<std::string>{ "E1", "E2" });
}

TEST_CASE("Windows opened later only see later events", "[bridge]")
{
    Fixture f;
    WindowId a = f.open();
    f.bridge.subscribe(f.source);

    f.source.feed("E1\n");
    WindowId b = f.open();
    f.source.feed("E2\n");

    REQUIRE(f.payloads(a) == std::vector<std::string>{ "E1", "E2" });
    REQUIRE(f.payloads(b) == std::vector<std::string>{ "E2" });
}

TEST_CASE("Identical payloads are not de-duplicated", "[bridge]")
{
    Fixture f;
    WindowId a = f.open();
    f.bridge.subscribe(f.source);

    f.source.feed("same\nsame\n");

    REQUIRE(f.payloads(a) == std::vector<std::string>{ "same", "same" });
}

TEST_CASE("Second subscription is ignored", "[bridge]")
{
    Fixture f;
    WindowId a = f.open();
    BackendEventSource other;

    REQUIRE(f.bridge.subscribe(f.source));
    REQUIRE_FALSE(f.bridge.subscribe(other));
    REQUIRE_FALSE(other.has_subscriber());

    f.source.feed("E1\n");
    REQUIRE(f.payloads(a).size() == 1);
}

// ─────────────────────────────────────────────────────────────────────────────
// Stream framing
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Partial lines are held until the newline arrives", "[bridge][source]")
{
    Fixture f;
    WindowId a = f.open();
    f.bridge.subscribe(f.source);

    f.source.feed("{\"type\":\"cha");
    REQUIRE(f.payloads(a).empty());

    f.source.feed("nge\"}\r\n\n");
    REQUIRE(f.payloads(a) == std::vector<std::string>{ "{\"type\":\"change\"}" });
}

TEST_CASE("CRLF and LF frame the same payloads and empty lines are skipped", "[bridge][source]")
{
    Fixture f;
    WindowId a = f.open();
    f.bridge.subscribe(f.source);

    f.source.feed("first\r\n\r\n\nsecond\n  \n");
    REQUIRE(f.payloads(a) == std::vector<std::string>{ "first", "second", "  " });
}

TEST_CASE("Lines that are not UTF-8 are dropped without breaking the stream", "[bridge][source]")
{
    Fixture f;
    WindowId a = f.open();
    f.bridge.subscribe(f.source);

    f.source.feed("before\n");
    f.source.feed("bad \xff\xfe bytes\n");
    f.source.feed("overlong \xc0\xaf\n");
    f.source.feed("caf\xc3\xa9 \xe2\x82\xac\n");
    f.source.feed("after\n");

    REQUIRE(f.payloads(a) == std::vector<std::string>{ "before", "caf\xc3\xa9 \xe2\x82\xac", "after" });
}

TEST_CASE("Events are read from a pipe until the writer closes it", "[bridge][source]")
{
    Fixture f;
    WindowId a = f.open();
    f.bridge.subscribe(f.source);

    int fds[2];
    REQUIRE(pipe(fds) == 0);
    f.source.adopt(fds[0]);

    std::string data = "created /tmp/a\nremoved /tmp/b\n";
    REQUIRE(write(fds[1], data.data(), data.size()) == static_cast<ssize_t>(data.size()));

    REQUIRE(f.source.read_available());
    REQUIRE(f.payloads(a) == std::vector<std::string>{ "created /tmp/a", "removed /tmp/b" });

    close(fds[1]);
    REQUIRE_FALSE(f.source.read_available());
    REQUIRE_FALSE(f.source.is_open());
}

TEST_CASE("Spawned backend command feeds the stream", "[bridge][source]")
{
    Fixture f;
    WindowId a = f.open();
    f.bridge.subscribe(f.source);

    REQUIRE(f.source.spawn("printf 'one\\ntwo\\n'"));
    while (f.source.is_open())
    {
        if (!f.source.read_available())
            break;
        usleep(1000);
    }

    REQUIRE(f.payloads(a) == std::vector<std::string>{ "one", "two" });
}

TEST_CASE("Connecting to a missing socket fails cleanly", "[bridge][source]")
{
    BackendEventSource source;
    REQUIRE_FALSE(source.connect_socket("/nonexistent/xpl-backend.sock"));
    REQUIRE_FALSE(source.is_open());
}
