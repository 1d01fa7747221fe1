#pragma once

#include "connection.hpp"
#include "types.hpp"
#include <string>
#include <xcb/xcb_ewmh.h>

namespace xpl {

/**
 * @brief Client-side EWMH/ICCCM helpers for the shell's own top-level windows
 *
 * The shell is not a window manager. Everything here either describes our
 * windows to the running window manager (names, pid, type, size hints,
 * protocols) or asks it to act on them (activate, maximize, iconify).
 */
class Ewmh
{
public:
    explicit Ewmh(Connection& conn);
    ~Ewmh();

    Ewmh(Ewmh const&) = delete;
    Ewmh& operator=(Ewmh const&) = delete;

    // Per-window properties (set once before mapping)
    void set_wm_name(xcb_window_t window, std::string const& name);
    void set_wm_class(xcb_window_t window, std::string const& instance, std::string const& class_name);
    void set_wm_pid(xcb_window_t window, uint32_t pid);
    void set_window_type_normal(xcb_window_t window);
    void set_size_hints(xcb_window_t window, Geometry const& geometry, bool user_position, uint16_t min_width, uint16_t min_height);
    void set_delete_protocol(xcb_window_t window);

    // Requests to the window manager
    void request_activate(xcb_window_t window);
    void request_toggle_maximized(xcb_window_t window);
    void request_iconify(xcb_window_t window);

    bool is_delete_message(xcb_client_message_event_t const& e) const;

private:
    Connection& conn_;
    mutable xcb_ewmh_connection_t ewmh_; // mutable: XCB EWMH API isn't const-correct
    xcb_atom_t wm_protocols_ = XCB_NONE;
    xcb_atom_t wm_delete_window_ = XCB_NONE;
    xcb_atom_t wm_change_state_ = XCB_NONE;
};

} // namespace xpl
