#include "style.hpp"
#include "xpl/core/log.hpp"
#include "xpl/core/policy.hpp"
#include "xpl/ipc/protocol.hpp"

namespace xpl {

StyleCoordinator::StyleCoordinator(WindowRegistry& registry, StyleConfig const& config)
    : registry_(registry)
    , config_(config)
    , native_effect_(registry.backend().supports_native_effect())
{
    LOG_INFO("Native translucency {}", native_effect_ ? "available" : "unavailable, glass is content-only");

    registry_.set_created_hook([this](ManagedWindow& window) { apply_native(window); });
    registry_.set_ready_hook(
        [this](ManagedWindow& window)
        { registry_.backend().send(window.native, protocol::style_message(style_)); }
    );
}

void StyleCoordinator::set_style(UiStyle style)
{
    UiStyle previous = style_;
    style_ = style;

    registry_.for_each([this](ManagedWindow& window) { apply(window); });

    if (previous != style)
    {
        LOG_INFO("UI style changed from {} to {}", to_string(previous), to_string(style));
    }
}

void StyleCoordinator::apply_native(ManagedWindow const& window)
{
    Background background = style_policy::background_for(style_, native_effect_, config_.classic_background);
    if (!registry_.backend().set_background(window.native, background))
    {
        LOG_WARN("Failed to apply {} background to window {}", to_string(style_), window.id);
    }
}

void StyleCoordinator::apply(ManagedWindow const& window)
{
    apply_native(window);

    // Content that is still loading receives the style with its readiness signal
    if (window.content_ready)
        registry_.backend().send(window.native, protocol::style_message(style_));
}

} // namespace xpl
