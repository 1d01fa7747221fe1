#include "fake_backend.hpp"
#include "xpl/ipc/request_router.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace xpl;
using namespace xpl::test;

namespace {

struct Fixture
{
    FakeBackend backend;
    WindowConfig window_config;
    StyleConfig style_config;
    WindowRegistry registry{ backend, window_config };
    StyleCoordinator style{ registry, style_config };
    TrayCoordinator tray{ registry, false };
    TabTransfer transfer{ registry, window_config };
    RequestRouter router{ registry, transfer, style, tray };

    WindowId open()
    {
        WindowId id = registry.create();
        registry.on_content_ready(id);
        return id;
    }

    /// Send a request and return the reply it produced, if any.
    std::optional<toml::table> request(WindowId sender, std::string const& record)
    {
        size_t before = backend.received(sender, protocol::channel::Reply).size();
        router.handle(sender, record);
        auto replies = backend.received(sender, protocol::channel::Reply);
        if (replies.size() == before)
            return std::nullopt;
        return replies.back();
    }
};

bool ok(std::optional<toml::table> const& reply)
{
    return reply && (*reply)["ok"].value_or(false);
}

constexpr char const* kTab = "[tab]\nid = \"t1\"\npath = \"/tmp\"\nhistory = [\"/tmp\"]\nhistory_index = 0\n";

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Replies
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Reply echoes the request id and goes to the sender only", "[router]")
{
    Fixture f;
    WindowId a = f.open();
    WindowId b = f.open();

    auto reply = f.request(b, "channel = \"window:getId\"\nrequest_id = 7");

    REQUIRE(ok(reply));
    REQUIRE((*reply)["request_id"].value_or(int64_t{ 0 }) == 7);
    REQUIRE((*reply)["result"]["id"].value_or(int64_t{ 0 }) == static_cast<int64_t>(b));
    REQUIRE(f.backend.received(a, protocol::channel::Reply).empty());
}

TEST_CASE("Requests without an id act but are not answered", "[router]")
{
    Fixture f;
    WindowId a = f.open();

    REQUIRE_FALSE(f.request(a, "channel = \"window:maximize\"").has_value());
    REQUIRE(f.backend.by_id(a)->maximize_toggles == 1);
}

TEST_CASE("Records that are not TOML are dropped without a reply", "[router]")
{
    Fixture f;
    WindowId a = f.open();

    REQUIRE_FALSE(f.request(a, "channel = \"window:getId\nrequest_id = ").has_value());
    REQUIRE(f.backend.channels(a) == std::vector<std::string>{ std::string(protocol::channel::StyleChanged) });
}

TEST_CASE("Unknown channels are answered with a failure", "[router]")
{
    Fixture f;
    WindowId a = f.open();

    auto reply = f.request(a, "channel = \"window:teleport\"\nrequest_id = 1");
    REQUIRE(reply.has_value());
    REQUIRE_FALSE(ok(reply));
}

TEST_CASE("Missing or invalid fields are answered with a failure", "[router]")
{
    Fixture f;
    WindowId a = f.open();

    REQUIRE_FALSE(ok(f.request(a, "channel = \"window:beginDrag\"\nrequest_id = 1\n[pointer]\nx = 1\ny = 2\n")));
    REQUIRE_FALSE(ok(f.request(a, std::string("channel = \"window:beginDrag\"\nrequest_id = 2\n") + kTab)));
    REQUIRE_FALSE(ok(f.request(a, "channel = \"window:updateDrag\"\nrequest_id = 3")));
    REQUIRE_FALSE(ok(f.request(a, "channel = \"window:showDropIndicator\"\nrequest_id = 4\ntarget = 0")));
    REQUIRE_FALSE(ok(f.request(a, "channel = \"window:transferTab\"\nrequest_id = 5\ntarget = 1")));
    REQUIRE_FALSE(ok(f.request(a, "channel = \"window:setCloseToTray\"\nrequest_id = 6\nenabled = \"yes\"")));
    REQUIRE_FALSE(ok(f.request(a, "channel = \"window:getBounds\"\nrequest_id = 7\nid = 99")));
    REQUIRE(f.transfer.state() == TabTransfer::State::Idle);
}

// ─────────────────────────────────────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Id and bounds queries list live windows", "[router]")
{
    Fixture f;
    WindowId a = f.open();
    WindowId b = f.open();
    WindowId c = f.open();
    f.registry.request_close(c);

    auto ids = f.request(a, "channel = \"window:getAllIds\"\nrequest_id = 1");
    REQUIRE(ok(ids));
    auto const* list = (*ids)["result"]["ids"].as_array();
    REQUIRE(list != nullptr);
    REQUIRE(list->size() == 2);
    REQUIRE((*list)[0].value_or(int64_t{ 0 }) == static_cast<int64_t>(a));
    REQUIRE((*list)[1].value_or(int64_t{ 0 }) == static_cast<int64_t>(b));

    auto bounds = f.request(a, "channel = \"window:getAllBounds\"\nrequest_id = 2");
    REQUIRE(ok(bounds));
    REQUIRE((*bounds)["result"]["windows"].as_array()->size() == 2);

    auto own = f.request(b, "channel = \"window:getBounds\"\nrequest_id = 3");
    REQUIRE(ok(own));
    REQUIRE((*own)["result"]["width"].value_or(int64_t{ 0 }) == f.backend.by_id(b)->geometry.width);
}

// ─────────────────────────────────────────────────────────────────────────────
// Drag and transfer
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Drag requests drive a transfer to another window", "[router][transfer]")
{
    Fixture f;
    WindowId a = f.open();
    WindowId b = f.open();

    auto begin = f.request(a, std::string("channel = \"window:beginDrag\"\nrequest_id = 1\n[pointer]\nx = 5\ny = 5\n") + kTab);
    REQUIRE(ok(begin));
    REQUIRE((*begin)["result"]["accepted"].value_or(false));
    REQUIRE(f.transfer.session()->source == a);

    REQUIRE(ok(f.request(a, "channel = \"window:showDropIndicator\"\nrequest_id = 2\ntarget = 2\nshow = true")));
    REQUIRE(f.transfer.session()->indicator_target == b);

    auto second = f.request(b, std::string("channel = \"window:beginDrag\"\nrequest_id = 3\n[pointer]\nx = 1\ny = 1\n") + kTab);
    REQUIRE(second.has_value());
    REQUIRE_FALSE(ok(second));

    auto done = f.request(a, std::string("channel = \"window:transferTab\"\nrequest_id = 4\ntarget = 2\n") + kTab);
    REQUIRE(ok(done));
    REQUIRE((*done)["result"]["destination"].value_or(int64_t{ 0 }) == static_cast<int64_t>(b));
    REQUIRE_FALSE((*done)["result"]["created"].value_or(true));
    REQUIRE(f.backend.received(b, protocol::channel::TabReceive).size() == 1);
    REQUIRE(f.transfer.state() == TabTransfer::State::Idle);
}

TEST_CASE("Create with tab opens a seeded window at the drop point", "[router][transfer]")
{
    Fixture f;
    WindowId a = f.open();

    auto reply = f.request(a, std::string("channel = \"window:createWithTab\"\nrequest_id = 1\n[drop]\nx = 600\ny = 400\n") + kTab);

    REQUIRE(ok(reply));
    REQUIRE((*reply)["result"]["created"].value_or(false));
    WindowId created = static_cast<WindowId>((*reply)["result"]["destination"].value_or(int64_t{ 0 }));
    REQUIRE(created == 2);
    REQUIRE(f.backend.by_id(created)->geometry.x == 500);
    REQUIRE(f.backend.by_id(created)->geometry.y == 380);

    f.registry.on_content_ready(created);
    REQUIRE(f.backend.received(created, protocol::channel::TabInit).size() == 1);
}

TEST_CASE("Cancel request ends the drag", "[router][transfer]")
{
    Fixture f;
    WindowId a = f.open();

    REQUIRE(ok(f.request(a, std::string("channel = \"window:beginDrag\"\nrequest_id = 1\n[pointer]\nx = 5\ny = 5\n") + kTab)));
    REQUIRE(ok(f.request(a, "channel = \"window:updateDrag\"\nrequest_id = 2\n[pointer]\nx = 50\ny = 60\n")));
    REQUIRE(f.transfer.session()->pointer == Point{ 50, 60 });

    REQUIRE(ok(f.request(a, "channel = \"window:cancelDrag\"\nrequest_id = 3")));
    REQUIRE(f.transfer.state() == TabTransfer::State::Idle);
}

// ─────────────────────────────────────────────────────────────────────────────
// Window controls
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Style request changes the style for every window", "[router][style]")
{
    Fixture f;
    WindowId a = f.open();
    WindowId b = f.open();
    f.backend.clear_messages();

    REQUIRE(ok(f.request(a, "channel = \"window:setUIStyle\"\nrequest_id = 1\nstyle = \"glass\"")));
    REQUIRE(f.style.current() == UiStyle::Glass);
    REQUIRE(f.backend.received(b, protocol::channel::StyleChanged).size() == 1);

    auto bad = f.request(a, "channel = \"window:setUIStyle\"\nrequest_id = 2\nstyle = \"acrylic\"");
    REQUIRE(bad.has_value());
    REQUIRE_FALSE(ok(bad));
    REQUIRE(f.style.current() == UiStyle::Glass);
}

TEST_CASE("Close-to-tray request changes what closing the last window does", "[router][tray]")
{
    Fixture f;
    WindowId a = f.open();

    REQUIRE(ok(f.request(a, "channel = \"window:setCloseToTray\"\nrequest_id = 1\nenabled = true")));
    REQUIRE(f.tray.close_to_tray());

    REQUIRE(ok(f.request(a, "channel = \"window:close\"\nrequest_id = 2")));
    REQUIRE(f.registry.get(a)->state == ManagedWindow::State::Hidden);

    REQUIRE(ok(f.request(a, "channel = \"window:focus\"\nrequest_id = 3")));
    REQUIRE(f.registry.get(a)->state == ManagedWindow::State::Visible);
    REQUIRE(f.backend.by_id(a)->activations == 1);
}

TEST_CASE("Close request destroys the sender window", "[router]")
{
    Fixture f;
    WindowId a = f.open();
    WindowId b = f.open();

    // The sender is already closing when the reply goes out, so none arrives
    REQUIRE_FALSE(f.request(a, "channel = \"window:close\"\nrequest_id = 1").has_value());
    REQUIRE(f.registry.get(a)->state == ManagedWindow::State::Closing);
    REQUIRE(f.backend.by_id(a)->destroyed);
    REQUIRE_FALSE(f.backend.by_id(b)->destroyed);
}

TEST_CASE("Minimize acts on the sender only", "[router]")
{
    Fixture f;
    WindowId a = f.open();
    WindowId b = f.open();

    REQUIRE(ok(f.request(b, "channel = \"window:minimize\"\nrequest_id = 1")));
    REQUIRE(f.backend.by_id(b)->minimizes == 1);
    REQUIRE(f.backend.by_id(a)->minimizes == 0);
}
