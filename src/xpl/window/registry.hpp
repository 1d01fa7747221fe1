#pragma once

#include "xpl/config/config.hpp"
#include "xpl/core/types.hpp"
#include "xpl/window/backend.hpp"
#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace xpl {

/**
 * @brief Registry record for one top-level window
 *
 * Lifecycle: Loading -> Visible <-> Hidden, any -> Closing -> removed.
 * A window becomes Visible only after its content signalled readiness.
 */
struct ManagedWindow
{
    enum class State
    {
        Loading, ///< Created, content not ready, not mapped
        Visible,
        Hidden, ///< Withdrawn (close-to-tray)
        Closing ///< Destroy requested, waiting for the window system to confirm
    };

    WindowId id = INVALID_WINDOW_ID;
    xcb_window_t native = XCB_NONE;
    State state = State::Loading;
    std::optional<TabData> pending_tab;  ///< Seeded tab, delivered on readiness
    std::vector<TabData> received_tabs;  ///< Transferred in before readiness
    bool content_ready = false;
    bool restore_requested = false; ///< Shown while hidden and not ready yet

    bool live() const { return state != State::Closing; }
};

enum class CloseOutcome
{
    Ignored,     ///< Unknown or already closing
    Intercepted, ///< Hidden instead of destroyed
    Closing,     ///< Destroy requested
};

/**
 * @brief Single source of truth for the set of live windows
 *
 * Ids start at 1 and are never reused. Entries are only erased by remove(),
 * called once the window system confirmed destruction. Other components hold
 * window ids, never pointers.
 */
class WindowRegistry
{
public:
    using WindowHook = std::function<void(ManagedWindow&)>;
    using CloseFilter = std::function<bool(WindowId)>;

    WindowRegistry(WindowBackend& backend, WindowConfig const& config);

    WindowRegistry(WindowRegistry const&) = delete;
    WindowRegistry& operator=(WindowRegistry const&) = delete;

    /// Returns INVALID_WINDOW_ID if the native window could not be created.
    WindowId create(std::optional<Point> origin = std::nullopt, std::optional<TabData> initial_tab = std::nullopt);

    ManagedWindow* get(WindowId id);
    ManagedWindow const* get(WindowId id) const;
    ManagedWindow* find_by_native(xcb_window_t native);

    std::vector<WindowId> list() const;
    size_t size() const { return windows_.size(); }
    size_t live_count() const;
    bool empty() const { return windows_.empty(); }
    bool is_live(WindowId id) const;

    /// Lowest live id, the application's main window.
    std::optional<WindowId> main_window() const;

    std::optional<Geometry> bounds(WindowId id) const;

    /// One-shot: show the window, then run the ready hook, then deliver the seeded
    /// and received tabs.
    void on_content_ready(WindowId id);

    /// Hand a transferred tab to a window; held until its content is ready.
    void receive_tab(WindowId id, TabData tab);

    CloseOutcome request_close(WindowId id);
    void close_all();
    void remove(WindowId id);

    void show(WindowId id);
    void hide(WindowId id);
    void activate(WindowId id);
    void minimize(WindowId id);
    void toggle_maximize(WindowId id);

    /// No-op for unknown or closing windows.
    void deliver(WindowId id, ContentMessage const& message);

    /// Visit live windows in id order. The callback must not create or remove windows.
    void for_each(std::function<void(ManagedWindow&)> const& fn);

    void set_created_hook(WindowHook hook) { created_hook_ = std::move(hook); }
    void set_ready_hook(WindowHook hook) { ready_hook_ = std::move(hook); }
    void set_shown_hook(WindowHook hook) { shown_hook_ = std::move(hook); }
    void set_hidden_hook(WindowHook hook) { hidden_hook_ = std::move(hook); }
    void set_removed_hook(std::function<void(WindowId)> hook) { removed_hook_ = std::move(hook); }
    void set_close_filter(CloseFilter filter) { close_filter_ = std::move(filter); }

    WindowBackend& backend() { return backend_; }

private:
    WindowBackend& backend_;
    WindowConfig const& config_;
    std::map<WindowId, ManagedWindow> windows_;
    WindowId next_window_id_ = 1;

    WindowHook created_hook_;
    WindowHook ready_hook_;
    WindowHook shown_hook_;
    WindowHook hidden_hook_;
    std::function<void(WindowId)> removed_hook_;
    CloseFilter close_filter_;
};

} // namespace xpl
