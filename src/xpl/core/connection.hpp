#pragma once

#include "xpl/core/types.hpp"
#include <memory>
#include <optional>
#include <xcb/randr.h>
#include <xcb/xcb.h>

namespace xpl {

class Connection
{
public:
    Connection();
    ~Connection() = default;

    Connection(Connection const&) = delete;
    Connection& operator=(Connection const&) = delete;
    Connection(Connection&&) = default;
    Connection& operator=(Connection&&) = default;

    xcb_connection_t* get() const { return conn_.get(); }
    xcb_screen_t* screen() const { return screen_; }
    int screen_number() const { return screen_number_; }

    bool has_randr() const { return randr_available_; }

    /// Geometry of the primary RandR output, or the whole screen without RandR.
    Geometry primary_display() const;

    /// 32-bit TrueColor visual for translucent windows, if the server has one.
    std::optional<xcb_visualid_t> argb_visual() const { return argb_visual_; }

    /// True when a compositing manager owns _NET_WM_CM_S<screen>.
    bool has_compositor() const;

    xcb_atom_t intern_atom(char const* name) const;

    void flush() { xcb_flush(conn_.get()); }

private:
    std::unique_ptr<xcb_connection_t, decltype(&xcb_disconnect)> conn_;
    xcb_screen_t* screen_;
    int screen_number_ = 0;

    bool randr_available_ = false;
    std::optional<xcb_visualid_t> argb_visual_;

    void init_randr();
    void find_argb_visual();
};

} // namespace xpl
