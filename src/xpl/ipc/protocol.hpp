#pragma once

#include "xpl/core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <toml++/toml.hpp>
#include <vector>

/**
 * @file protocol.hpp
 * @brief Records exchanged between the shell and each window's content layer
 *
 * Every record is a small TOML document with a `channel` key. Records travel
 * in X window properties (see X11Backend), separated by RECORD_SEPARATOR.
 *
 * Content -> shell requests may carry `request_id`; the shell then answers on
 * the `reply` channel with the same id, `ok`, and a `result` table.
 */

namespace xpl::protocol {

constexpr char RECORD_SEPARATOR = '\x1e';

namespace channel {

// Requests (content -> shell)
inline constexpr std::string_view GetId = "window:getId";
inline constexpr std::string_view GetAllIds = "window:getAllIds";
inline constexpr std::string_view GetBounds = "window:getBounds";
inline constexpr std::string_view GetAllBounds = "window:getAllBounds";
inline constexpr std::string_view BeginDrag = "window:beginDrag";
inline constexpr std::string_view UpdateDrag = "window:updateDrag";
inline constexpr std::string_view CancelDrag = "window:cancelDrag";
inline constexpr std::string_view ShowDropIndicator = "window:showDropIndicator";
inline constexpr std::string_view TransferTab = "window:transferTab";
inline constexpr std::string_view CreateWithTab = "window:createWithTab";
inline constexpr std::string_view Focus = "window:focus";
inline constexpr std::string_view SetUiStyle = "window:setUIStyle";
inline constexpr std::string_view Minimize = "window:minimize";
inline constexpr std::string_view Maximize = "window:maximize";
inline constexpr std::string_view Close = "window:close";
inline constexpr std::string_view SetCloseToTray = "window:setCloseToTray";

// Signals (shell -> content)
inline constexpr std::string_view TabInit = "tab:initWithData";
inline constexpr std::string_view TabReceive = "tab:receive";
inline constexpr std::string_view TabDropIndicator = "tab:dropIndicator";
inline constexpr std::string_view StyleChanged = "ui:style";
inline constexpr std::string_view BackendEvent = "xp:event";
inline constexpr std::string_view Reply = "reply";

} // namespace channel

struct Request
{
    std::string channel;
    std::optional<int64_t> request_id;
    toml::table body;
};

// Decoding (tolerant: malformed input yields nullopt, never throws)
std::optional<Request> decode_request(std::string_view record);
std::optional<TabData> decode_tab(toml::table const& table);
std::optional<Point> decode_point(toml::table const& table);
std::optional<WindowId> decode_window_id(toml::table const& table, std::string_view key);
std::vector<std::string_view> split_records(std::string_view data);

// Encoding
toml::table encode_tab(TabData const& tab);
toml::table encode_bounds(Geometry const& bounds);
std::string to_record(toml::table const& table);

ContentMessage make_message(std::string_view channel, toml::table body);
ContentMessage tab_message(std::string_view channel, TabData const& tab);
ContentMessage drop_indicator_message(bool show);
ContentMessage style_message(UiStyle style);
ContentMessage event_message(BackendEvent const& event);
ContentMessage reply_message(int64_t request_id, bool ok, toml::table result);

/// Parse a record sent to content back into a table; used by tests and tools.
std::optional<toml::table> decode_message(std::string_view payload);

} // namespace xpl::protocol
