#include "request_router.hpp"
#include "xpl/core/log.hpp"

namespace xpl {

namespace {

std::optional<Point> point_field(toml::table const& body, std::string_view key)
{
    if (auto const* table = body[key].as_table())
        return protocol::decode_point(*table);
    return std::nullopt;
}

std::optional<TabData> tab_field(toml::table const& body)
{
    if (auto const* table = body["tab"].as_table())
        return protocol::decode_tab(*table);
    return std::nullopt;
}

} // namespace

RequestRouter::RequestRouter(WindowRegistry& registry, TabTransfer& transfer, StyleCoordinator& style, TrayCoordinator& tray)
    : registry_(registry)
    , transfer_(transfer)
    , style_(style)
    , tray_(tray)
{
}

void RequestRouter::handle(WindowId sender, std::string_view record)
{
    auto request = protocol::decode_request(record);
    if (!request)
    {
        LOG_WARN("Malformed request from window {} dropped", sender);
        return;
    }

    LOG_TRACE("Request {} from window {}", request->channel, sender);
    Outcome outcome = dispatch(sender, *request);

    if (request->request_id)
    {
        registry_.deliver(sender, protocol::reply_message(*request->request_id, outcome.ok, std::move(outcome.result)));
    }
}

RequestRouter::Outcome RequestRouter::dispatch(WindowId sender, protocol::Request const& request)
{
    namespace ch = protocol::channel;
    auto const& body = request.body;
    std::string_view name = request.channel;

    // ─────────────────────────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────────────────────────

    if (name == ch::GetId)
    {
        return { true, toml::table{ { "id", static_cast<int64_t>(sender) } } };
    }

    if (name == ch::GetAllIds)
    {
        toml::array ids;
        for (WindowId id : registry_.list())
        {
            if (registry_.is_live(id))
                ids.push_back(static_cast<int64_t>(id));
        }
        return { true, toml::table{ { "ids", std::move(ids) } } };
    }

    if (name == ch::GetBounds)
    {
        WindowId id = protocol::decode_window_id(body, "id").value_or(sender);
        auto bounds = registry_.bounds(id);
        if (!bounds)
            return { false, {} };
        return { true, protocol::encode_bounds(*bounds) };
    }

    if (name == ch::GetAllBounds)
    {
        toml::array windows;
        for (auto const& [id, bounds] : transfer_.query_bounds_of_all_windows())
        {
            auto entry = protocol::encode_bounds(bounds);
            entry.insert("id", static_cast<int64_t>(id));
            windows.push_back(std::move(entry));
        }
        return { true, toml::table{ { "windows", std::move(windows) } } };
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Tab drag and transfer
    // ─────────────────────────────────────────────────────────────────────────

    if (name == ch::BeginDrag)
    {
        auto tab = tab_field(body);
        auto pointer = point_field(body, "pointer");
        if (!tab || !pointer)
        {
            LOG_WARN("{} from window {} without a valid tab and pointer", name, sender);
            return { false, {} };
        }
        bool accepted = transfer_.begin_drag(sender, std::move(*tab), *pointer);
        return { accepted, toml::table{ { "accepted", accepted } } };
    }

    if (name == ch::UpdateDrag)
    {
        auto pointer = point_field(body, "pointer");
        if (!pointer)
            return { false, {} };
        transfer_.update_pointer(*pointer);
        return {};
    }

    if (name == ch::CancelDrag)
    {
        transfer_.cancel_drag();
        return {};
    }

    if (name == ch::ShowDropIndicator)
    {
        auto target = protocol::decode_window_id(body, "target");
        if (!target)
            return { false, {} };
        transfer_.set_drop_indicator(*target, body["show"].value_or(true));
        return {};
    }

    if (name == ch::TransferTab)
        return transfer_tab(sender, body, false);

    if (name == ch::CreateWithTab)
        return transfer_tab(sender, body, true);

    // ─────────────────────────────────────────────────────────────────────────
    // Window controls
    // ─────────────────────────────────────────────────────────────────────────

    if (name == ch::Focus)
    {
        registry_.activate(protocol::decode_window_id(body, "id").value_or(sender));
        return {};
    }

    if (name == ch::SetUiStyle)
    {
        auto style = parse_ui_style(body["style"].value_or(std::string_view{}));
        if (!style)
        {
            LOG_WARN("Unknown UI style requested by window {}", sender);
            return { false, {} };
        }
        style_.set_style(*style);
        return {};
    }

    if (name == ch::Minimize)
    {
        registry_.minimize(sender);
        return {};
    }

    if (name == ch::Maximize)
    {
        registry_.toggle_maximize(sender);
        return {};
    }

    if (name == ch::Close)
    {
        auto outcome = registry_.request_close(sender);
        return { outcome != CloseOutcome::Ignored, {} };
    }

    if (name == ch::SetCloseToTray)
    {
        auto enabled = body["enabled"].value<bool>();
        if (!enabled)
            return { false, {} };
        tray_.set_close_to_tray(*enabled);
        return {};
    }

    LOG_WARN("Unknown request channel '{}' from window {}", name, sender);
    return { false, {} };
}

RequestRouter::Outcome RequestRouter::transfer_tab(WindowId sender, toml::table const& body, bool to_new_window)
{
    auto tab = tab_field(body);
    if (!tab)
    {
        LOG_WARN("Tab transfer from window {} without a valid tab", sender);
        return { false, {} };
    }

    std::optional<WindowId> target;
    if (!to_new_window)
        target = protocol::decode_window_id(body, "target");

    auto result = transfer_.complete_drag(target, std::move(*tab), point_field(body, "drop"));
    if (result.destination == INVALID_WINDOW_ID)
        return { false, {} };

    return { true,
             toml::table{
                 { "destination", static_cast<int64_t>(result.destination) },
                 { "created", result.created_window },
             } };
}

} // namespace xpl
