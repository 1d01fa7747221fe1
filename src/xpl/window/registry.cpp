#include "registry.hpp"
#include "xpl/core/invariants.hpp"
#include "xpl/core/log.hpp"
#include "xpl/core/policy.hpp"
#include "xpl/ipc/protocol.hpp"

namespace xpl {

WindowRegistry::WindowRegistry(WindowBackend& backend, WindowConfig const& config)
    : backend_(backend)
    , config_(config)
{
}

WindowId WindowRegistry::create(std::optional<Point> origin, std::optional<TabData> initial_tab)
{
    // The id is consumed even if creation fails so that ids are never reused
    WindowId id = next_window_id_++;

    WindowOptions options;
    options.geometry = placement_policy::initial_geometry(
        backend_.work_area(),
        config_.width,
        config_.height,
        config_.min_width,
        config_.min_height,
        origin
    );
    options.user_position = origin.has_value();
    options.min_width = config_.min_width;
    options.min_height = config_.min_height;
    options.title = config_.title;

    xcb_window_t native = backend_.create_window(id, options);
    if (native == XCB_NONE)
    {
        LOG_ERROR("Failed to create native window for window {}", id);
        return INVALID_WINDOW_ID;
    }

    auto& window = windows_[id];
    window.id = id;
    window.native = native;
    window.state = ManagedWindow::State::Loading;
    window.pending_tab = std::move(initial_tab);

    LOG_DEBUG(
        "Created window {} (native {:#x}) at {},{} {}x{}{}",
        id,
        native,
        options.geometry.x,
        options.geometry.y,
        options.geometry.width,
        options.geometry.height,
        window.pending_tab ? " with seeded tab" : ""
    );

    if (created_hook_)
        created_hook_(window);

    XPL_ASSERT_REGISTRY(windows_, next_window_id_);

    if (!backend_.has_content_process())
    {
        // Nothing external to wait for
        on_content_ready(id);
    }
    return id;
}

ManagedWindow* WindowRegistry::get(WindowId id)
{
    auto it = windows_.find(id);
    return it != windows_.end() ? &it->second : nullptr;
}

ManagedWindow const* WindowRegistry::get(WindowId id) const
{
    auto it = windows_.find(id);
    return it != windows_.end() ? &it->second : nullptr;
}

ManagedWindow* WindowRegistry::find_by_native(xcb_window_t native)
{
    for (auto& [id, window] : windows_)
    {
        if (window.native == native)
            return &window;
    }
    return nullptr;
}

std::vector<WindowId> WindowRegistry::list() const
{
    std::vector<WindowId> ids;
    ids.reserve(windows_.size());
    for (auto const& [id, window] : windows_)
        ids.push_back(id);
    return ids;
}

size_t WindowRegistry::live_count() const
{
    size_t count = 0;
    for (auto const& [id, window] : windows_)
    {
        if (window.live())
            ++count;
    }
    return count;
}

bool WindowRegistry::is_live(WindowId id) const
{
    auto const* window = get(id);
    return window && window->live();
}

std::optional<WindowId> WindowRegistry::main_window() const
{
    for (auto const& [id, window] : windows_)
    {
        if (window.live())
            return id;
    }
    return std::nullopt;
}

std::optional<Geometry> WindowRegistry::bounds(WindowId id) const
{
    auto const* window = get(id);
    if (!window || !window->live())
        return std::nullopt;
    return backend_.query_bounds(window->native);
}

void WindowRegistry::on_content_ready(WindowId id)
{
    auto* window = get(id);
    if (!window || !window->live())
        return;
    if (window->content_ready)
    {
        LOG_TRACE("Duplicate readiness signal from window {} ignored", id);
        return;
    }

    window->content_ready = true;
    LOG_DEBUG("Window {} content ready", id);

    if (window->state == ManagedWindow::State::Loading || window->restore_requested)
        show(id);
    window->restore_requested = false;

    if (ready_hook_)
        ready_hook_(*window);

    if (window->pending_tab)
    {
        backend_.send(window->native, protocol::tab_message(protocol::channel::TabInit, *window->pending_tab));
        window->pending_tab.reset();
    }

    for (auto const& tab : window->received_tabs)
        backend_.send(window->native, protocol::tab_message(protocol::channel::TabReceive, tab));
    window->received_tabs.clear();
}

void WindowRegistry::receive_tab(WindowId id, TabData tab)
{
    auto* window = get(id);
    if (!window || !window->live())
    {
        LOG_WARN("Tab {} for window {} dropped: not live", tab.id, id);
        return;
    }
    if (!window->content_ready)
    {
        LOG_DEBUG("Tab {} held until window {} is ready", tab.id, id);
        window->received_tabs.push_back(std::move(tab));
        return;
    }
    backend_.send(window->native, protocol::tab_message(protocol::channel::TabReceive, tab));
}

CloseOutcome WindowRegistry::request_close(WindowId id)
{
    auto* window = get(id);
    if (!window || !window->live())
        return CloseOutcome::Ignored;

    if (close_filter_ && close_filter_(id))
    {
        LOG_DEBUG("Close of window {} intercepted", id);
        hide(id);
        return CloseOutcome::Intercepted;
    }

    LOG_DEBUG("Closing window {}", id);
    window->state = ManagedWindow::State::Closing;
    backend_.destroy_window(window->native);
    return CloseOutcome::Closing;
}

void WindowRegistry::close_all()
{
    // Snapshot first: closing never erases, but hooks may run while we iterate
    for (WindowId id : list())
        request_close(id);
}

void WindowRegistry::remove(WindowId id)
{
    auto it = windows_.find(id);
    if (it == windows_.end())
        return;

    windows_.erase(it);
    LOG_DEBUG("Window {} removed ({} remaining)", id, windows_.size());

    if (removed_hook_)
        removed_hook_(id);

    XPL_ASSERT_REGISTRY(windows_, next_window_id_);
}

void WindowRegistry::show(WindowId id)
{
    auto* window = get(id);
    if (!window || !window->live())
        return;
    if (!window->content_ready)
    {
        if (window->state == ManagedWindow::State::Hidden)
            window->restore_requested = true;
        LOG_DEBUG("Window {} not shown yet: content not ready", id);
        return;
    }
    if (window->state == ManagedWindow::State::Visible)
        return;

    window->state = ManagedWindow::State::Visible;
    backend_.show(window->native);

    if (shown_hook_)
        shown_hook_(*window);
}

void WindowRegistry::hide(WindowId id)
{
    auto* window = get(id);
    if (!window || !window->live() || window->state == ManagedWindow::State::Hidden)
        return;

    window->state = ManagedWindow::State::Hidden;
    window->restore_requested = false;
    backend_.hide(window->native);

    if (hidden_hook_)
        hidden_hook_(*window);
}

void WindowRegistry::activate(WindowId id)
{
    auto* window = get(id);
    if (!window || !window->live())
        return;

    if (window->state == ManagedWindow::State::Hidden)
        show(id);
    if (window->state == ManagedWindow::State::Visible)
        backend_.activate(window->native);
}

void WindowRegistry::minimize(WindowId id)
{
    auto* window = get(id);
    if (window && window->state == ManagedWindow::State::Visible)
        backend_.minimize(window->native);
}

void WindowRegistry::toggle_maximize(WindowId id)
{
    auto* window = get(id);
    if (window && window->state == ManagedWindow::State::Visible)
        backend_.toggle_maximize(window->native);
}

void WindowRegistry::deliver(WindowId id, ContentMessage const& message)
{
    auto* window = get(id);
    if (!window || !window->live())
    {
        LOG_TRACE("Dropped {} for window {}: not live", message.channel, id);
        return;
    }
    backend_.send(window->native, message);
}

void WindowRegistry::for_each(std::function<void(ManagedWindow&)> const& fn)
{
    for (auto& [id, window] : windows_)
    {
        if (window.live())
            fn(window);
    }
}

} // namespace xpl
