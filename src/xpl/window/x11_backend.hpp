#pragma once

#include "xpl/config/config.hpp"
#include "xpl/core/connection.hpp"
#include "xpl/core/ewmh.hpp"
#include "xpl/window/backend.hpp"
#include <string>
#include <sys/types.h>
#include <unordered_map>
#include <vector>

namespace xpl {

/**
 * @brief WindowBackend over XCB
 *
 * Content channel, per window:
 *   _XPL_CONTENT_READY  set by the content once it can receive messages
 *   _XPL_REQUEST        content -> shell records, consumed with delete-on-read
 *   _XPL_MESSAGE        shell -> content records, appended
 *
 * Records are UTF8_STRING data terminated by protocol::RECORD_SEPARATOR.
 */
class X11Backend : public WindowBackend
{
public:
    X11Backend(Connection& conn, Ewmh& ewmh, ContentConfig const& content);
    ~X11Backend() override;

    X11Backend(X11Backend const&) = delete;
    X11Backend& operator=(X11Backend const&) = delete;

    xcb_window_t create_window(WindowId id, WindowOptions const& options) override;
    void destroy_window(xcb_window_t window) override;

    void show(xcb_window_t window) override;
    void hide(xcb_window_t window) override;
    void activate(xcb_window_t window) override;
    void minimize(xcb_window_t window) override;
    void toggle_maximize(xcb_window_t window) override;

    std::optional<Geometry> query_bounds(xcb_window_t window) const override;
    Geometry work_area() const override;
    bool supports_native_effect() const override { return native_effect_; }
    bool set_background(xcb_window_t window, Background const& background) override;

    void send(xcb_window_t window, ContentMessage const& message) override;

    /// True when windows need an external content process to become ready.
    bool has_content_process() const override { return !content_.command.empty(); }

    /// Drop bookkeeping for a window the server already destroyed.
    void release(xcb_window_t window);

    /// Drain the pending request records of a window.
    std::vector<std::string> take_requests(xcb_window_t window);

    // Leader window: discovery and tray controller channel
    xcb_window_t create_leader_window();
    void publish_visibility(VisibilityState const& state);
    bool is_show_windows_message(xcb_client_message_event_t const& e) const;

    xcb_atom_t content_ready_atom() const { return xpl_content_ready_; }
    xcb_atom_t request_atom() const { return xpl_request_; }
    xcb_window_t leader() const { return leader_; }

private:
    struct NativeWindow
    {
        bool argb = false;
        xcb_colormap_t colormap = XCB_NONE;
        pid_t content_pid = -1;
    };

    Connection& conn_;
    Ewmh& ewmh_;
    ContentConfig const& content_;
    bool native_effect_ = false;
    xcb_window_t leader_ = XCB_NONE;
    std::unordered_map<xcb_window_t, NativeWindow> windows_;

    xcb_atom_t utf8_string_ = XCB_NONE;
    xcb_atom_t xpl_message_ = XCB_NONE;
    xcb_atom_t xpl_request_ = XCB_NONE;
    xcb_atom_t xpl_content_ready_ = XCB_NONE;
    xcb_atom_t xpl_shell_window_ = XCB_NONE;
    xcb_atom_t xpl_visibility_ = XCB_NONE;
    xcb_atom_t xpl_show_windows_ = XCB_NONE;
    xcb_atom_t blur_region_ = XCB_NONE;

    pid_t spawn_content(WindowId id, xcb_window_t window);
};

} // namespace xpl
