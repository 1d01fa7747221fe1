#include "tray.hpp"
#include "xpl/core/log.hpp"
#include "xpl/core/policy.hpp"

namespace xpl {

TrayCoordinator::TrayCoordinator(WindowRegistry& registry, bool close_to_tray)
    : registry_(registry)
    , close_to_tray_(close_to_tray)
{
    registry_.set_close_filter([this](WindowId id) { return should_intercept(id); });
    registry_.set_shown_hook([this](ManagedWindow&) { notify(); });
    registry_.set_hidden_hook([this](ManagedWindow&) { notify(); });
    registry_.set_removed_hook([this](WindowId) { notify(); });
}

void TrayCoordinator::set_close_to_tray(bool enabled)
{
    if (close_to_tray_ == enabled)
        return;
    close_to_tray_ = enabled;
    LOG_INFO("Close to tray {}", enabled ? "enabled" : "disabled");
}

bool TrayCoordinator::should_intercept(WindowId id) const
{
    bool hide = tray_policy::should_hide_on_close(close_to_tray_, quitting_, registry_.live_count());
    if (hide)
    {
        LOG_DEBUG("Window {} is the last window, hiding to tray", id);
    }
    return hide;
}

void TrayCoordinator::show_all()
{
    for (WindowId id : registry_.list())
    {
        auto const* window = registry_.get(id);
        if (window && window->state == ManagedWindow::State::Hidden)
            registry_.activate(id);
    }
}

VisibilityState TrayCoordinator::visibility() const
{
    VisibilityState state;
    for (WindowId id : registry_.list())
    {
        auto const* window = registry_.get(id);
        if (!window)
            continue;
        if (window->state == ManagedWindow::State::Visible)
            ++state.visible;
        else if (window->state == ManagedWindow::State::Hidden)
            ++state.hidden;
    }
    return state;
}

void TrayCoordinator::notify()
{
    if (!listener_)
        return;

    auto state = visibility();
    LOG_TRACE("Visibility changed: {} visible, {} hidden", state.visible, state.hidden);
    listener_(state);
}

} // namespace xpl
