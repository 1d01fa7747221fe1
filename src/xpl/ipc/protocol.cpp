#include "protocol.hpp"
#include "xpl/core/log.hpp"
#include <sstream>

namespace xpl::protocol {

std::optional<toml::table> decode_message(std::string_view payload)
{
    try
    {
        return toml::parse(payload);
    }
    catch (toml::parse_error const& err)
    {
        LOG_WARN("Malformed record: {}", err.description());
        return std::nullopt;
    }
}

std::optional<Request> decode_request(std::string_view record)
{
    auto table = decode_message(record);
    if (!table)
        return std::nullopt;

    auto name = (*table)["channel"].value<std::string>();
    if (!name || name->empty())
    {
        LOG_WARN("Request without channel dropped");
        return std::nullopt;
    }

    Request request;
    request.channel = std::move(*name);
    request.request_id = (*table)["request_id"].value<int64_t>();
    table->erase("channel");
    table->erase("request_id");
    request.body = std::move(*table);
    return request;
}

std::optional<TabData> decode_tab(toml::table const& table)
{
    auto id = table["id"].value<std::string>();
    auto path = table["path"].value<std::string>();
    if (!id || !path)
        return std::nullopt;

    TabData tab;
    tab.id = std::move(*id);
    tab.path = std::move(*path);
    tab.title = table["title"].value_or(std::string{});

    if (auto history = table["history"].as_array())
    {
        for (auto const& entry : *history)
        {
            auto visited = entry.value<std::string>();
            if (!visited)
                return std::nullopt;
            tab.history.push_back(std::move(*visited));
        }
    }

    auto index = table["history_index"].value_or(int64_t{ 0 });
    if (index < 0)
        return std::nullopt;
    tab.history_index = static_cast<size_t>(index);

    if (!tab.is_valid())
        return std::nullopt;
    return tab;
}

std::optional<Point> decode_point(toml::table const& table)
{
    auto x = table["x"].value<int64_t>();
    auto y = table["y"].value<int64_t>();
    if (!x || !y)
        return std::nullopt;
    return Point{ static_cast<int32_t>(*x), static_cast<int32_t>(*y) };
}

std::optional<WindowId> decode_window_id(toml::table const& table, std::string_view key)
{
    auto value = table[key].value<int64_t>();
    if (!value || *value <= 0 || *value > static_cast<int64_t>(UINT32_MAX))
        return std::nullopt;
    return static_cast<WindowId>(*value);
}

std::vector<std::string_view> split_records(std::string_view data)
{
    std::vector<std::string_view> records;
    size_t start = 0;
    while (start < data.size())
    {
        size_t end = data.find(RECORD_SEPARATOR, start);
        if (end == std::string_view::npos)
            end = data.size();
        if (end > start)
            records.push_back(data.substr(start, end - start));
        start = end + 1;
    }
    return records;
}

toml::table encode_tab(TabData const& tab)
{
    toml::array history;
    for (auto const& visited : tab.history)
        history.push_back(visited);

    return toml::table{
        { "id", tab.id },
        { "path", tab.path },
        { "title", tab.title },
        { "history", std::move(history) },
        { "history_index", static_cast<int64_t>(tab.history_index) },
    };
}

toml::table encode_bounds(Geometry const& bounds)
{
    return toml::table{
        { "x", static_cast<int64_t>(bounds.x) },
        { "y", static_cast<int64_t>(bounds.y) },
        { "width", static_cast<int64_t>(bounds.width) },
        { "height", static_cast<int64_t>(bounds.height) },
    };
}

std::string to_record(toml::table const& table)
{
    std::ostringstream out;
    out << table;
    return out.str();
}

ContentMessage make_message(std::string_view channel, toml::table body)
{
    body.insert_or_assign("channel", std::string(channel));
    return ContentMessage{ std::string(channel), to_record(body) };
}

ContentMessage tab_message(std::string_view channel, TabData const& tab)
{
    return make_message(channel, toml::table{ { "tab", encode_tab(tab) } });
}

ContentMessage drop_indicator_message(bool show)
{
    return make_message(channel::TabDropIndicator, toml::table{ { "show", show } });
}

ContentMessage style_message(UiStyle style)
{
    return make_message(channel::StyleChanged, toml::table{ { "style", to_string(style) } });
}

ContentMessage event_message(BackendEvent const& event)
{
    return make_message(channel::BackendEvent, toml::table{ { "payload", event.payload } });
}

ContentMessage reply_message(int64_t request_id, bool ok, toml::table result)
{
    return make_message(
        channel::Reply,
        toml::table{ { "request_id", request_id }, { "ok", ok }, { "result", std::move(result) } }
    );
}

} // namespace xpl::protocol
