#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <xcb/xcb.h>

namespace xpl {

// ─────────────────────────────────────────────────────────────────────────────
// Basic geometry types
// ─────────────────────────────────────────────────────────────────────────────

struct Point
{
    int32_t x = 0;
    int32_t y = 0;

    bool operator==(Point const&) const = default;
};

struct Geometry
{
    int16_t x = 0;
    int16_t y = 0;
    uint16_t width = 0;
    uint16_t height = 0;

    bool operator==(Geometry const&) const = default;

    bool contains(Point p) const
    {
        return p.x >= x && p.x < x + static_cast<int32_t>(width) && p.y >= y
            && p.y < y + static_cast<int32_t>(height);
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Window identity
// ─────────────────────────────────────────────────────────────────────────────

/// Process-unique window id. Issued by WindowRegistry, starts at 1, never reused.
using WindowId = uint32_t;

constexpr WindowId INVALID_WINDOW_ID = 0;

// ─────────────────────────────────────────────────────────────────────────────
// Tab model
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Navigation state of one tab, the unit moved between windows.
 *
 * Owned by exactly one window at a time. The owning window mutates it through
 * the navigation helpers below so that history_index always points into history.
 */
struct TabData
{
    std::string id;
    std::string path;
    std::string title;
    std::vector<std::string> history;
    size_t history_index = 0;

    bool operator==(TabData const&) const = default;

    bool is_valid() const { return history.empty() || history_index < history.size(); }

    bool can_go_back() const { return !history.empty() && history_index > 0; }
    bool can_go_forward() const { return !history.empty() && history_index + 1 < history.size(); }

    void navigate(std::string new_path)
    {
        if (!history.empty())
            history.resize(history_index + 1);
        history.push_back(new_path);
        history_index = history.size() - 1;
        path = std::move(new_path);
    }

    bool go_back()
    {
        if (!can_go_back())
            return false;
        --history_index;
        path = history[history_index];
        return true;
    }

    bool go_forward()
    {
        if (!can_go_forward())
            return false;
        ++history_index;
        path = history[history_index];
        return true;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// UI style
// ─────────────────────────────────────────────────────────────────────────────

enum class UiStyle
{
    Classic,
    Glass
};

inline char const* to_string(UiStyle style)
{
    switch (style)
    {
        case UiStyle::Classic:
            return "classic";
        case UiStyle::Glass:
            return "glass";
    }
    return "classic";
}

inline std::optional<UiStyle> parse_ui_style(std::string_view name)
{
    if (name == "classic")
        return UiStyle::Classic;
    if (name == "glass")
        return UiStyle::Glass;
    return std::nullopt;
}

/// Native background of a window, chosen per style.
struct Background
{
    enum class Kind
    {
        Solid,
        Translucent
    };
    Kind kind = Kind::Solid;
    uint32_t color = 0; // RGB for Solid

    bool operator==(Background const&) const = default;
};

// ─────────────────────────────────────────────────────────────────────────────
// Backend events and drag sessions
// ─────────────────────────────────────────────────────────────────────────────

/// Filesystem-change notification from the backend. Never inspected here.
struct BackendEvent
{
    std::string payload;
};

struct DragSession
{
    WindowId source = INVALID_WINDOW_ID;
    TabData tab;
    Point pointer;
    WindowId indicator_target = INVALID_WINDOW_ID;
};

// ─────────────────────────────────────────────────────────────────────────────
// Content signals
// ─────────────────────────────────────────────────────────────────────────────

/// One record sent to a window's content layer. payload is an encoded TOML document.
struct ContentMessage
{
    std::string channel;
    std::string payload;
};

struct VisibilityState
{
    size_t visible = 0;
    size_t hidden = 0;

    bool operator==(VisibilityState const&) const = default;
};

} // namespace xpl
