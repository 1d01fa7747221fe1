#pragma once

#include "xpl/core/types.hpp"
#include <optional>
#include <string>

namespace xpl {

struct WindowOptions
{
    Geometry geometry;
    bool user_position = false; // geometry.x/y were requested explicitly (drop target)
    uint16_t min_width = 0;
    uint16_t min_height = 0;
    std::string title;
};

/**
 * @brief Native window system seam
 *
 * WindowRegistry and the coordinators talk to windows only through this
 * interface. X11Backend is the production implementation; tests use an
 * in-memory fake. Every call is non-blocking from the event loop's point of
 * view, and none of them throws for a window that has already gone away.
 */
class WindowBackend
{
public:
    virtual ~WindowBackend() = default;

    /// Create an unmapped top-level window. Returns XCB_NONE on failure.
    virtual xcb_window_t create_window(WindowId id, WindowOptions const& options) = 0;
    virtual void destroy_window(xcb_window_t window) = 0;

    virtual void show(xcb_window_t window) = 0;
    virtual void hide(xcb_window_t window) = 0;
    virtual void activate(xcb_window_t window) = 0;
    virtual void minimize(xcb_window_t window) = 0;
    virtual void toggle_maximize(xcb_window_t window) = 0;

    /// Current root-relative geometry, or nullopt when the window is gone.
    virtual std::optional<Geometry> query_bounds(xcb_window_t window) const = 0;

    /// Primary display geometry, used to size new windows.
    virtual Geometry work_area() const = 0;

    /// False when no external content will ever signal readiness.
    virtual bool has_content_process() const = 0;

    /// Decided once at startup: can a window be made natively translucent?
    virtual bool supports_native_effect() const = 0;

    /// Returns false if the native background could not be applied.
    virtual bool set_background(xcb_window_t window, Background const& background) = 0;

    /// Queue one record for the window's content layer.
    virtual void send(xcb_window_t window, ContentMessage const& message) = 0;
};

} // namespace xpl
