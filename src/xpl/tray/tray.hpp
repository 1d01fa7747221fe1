#pragma once

#include "xpl/core/types.hpp"
#include "xpl/window/registry.hpp"
#include <functional>

namespace xpl {

/**
 * @brief Close-to-tray rule and visibility notifications
 *
 * Installs itself as the registry's close filter and visibility hooks. It
 * never draws a tray icon; the external tray controller only receives
 * VisibilityState updates.
 */
class TrayCoordinator
{
public:
    using VisibilityListener = std::function<void(VisibilityState const&)>;

    TrayCoordinator(WindowRegistry& registry, bool close_to_tray);

    TrayCoordinator(TrayCoordinator const&) = delete;
    TrayCoordinator& operator=(TrayCoordinator const&) = delete;

    void set_close_to_tray(bool enabled);
    bool close_to_tray() const { return close_to_tray_; }

    void set_visibility_listener(VisibilityListener listener) { listener_ = std::move(listener); }

    /// Stop intercepting closes; used when the application exits.
    void begin_quit() { quitting_ = true; }
    bool quitting() const { return quitting_; }

    /// Restore every hidden window (tray icon activated).
    void show_all();

    VisibilityState visibility() const;

private:
    WindowRegistry& registry_;
    bool close_to_tray_ = false;
    bool quitting_ = false;
    VisibilityListener listener_;

    bool should_intercept(WindowId id) const;
    void notify();
};

} // namespace xpl
