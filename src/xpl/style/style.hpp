#pragma once

#include "xpl/config/config.hpp"
#include "xpl/core/types.hpp"
#include "xpl/window/registry.hpp"

namespace xpl {

/**
 * @brief Process-wide UI style cell with broadcast on change
 *
 * set_style() is the only writer. New windows pick up the current style
 * through registry hooks: native background at creation (before the first
 * map, so there is no flash), content signal at readiness.
 */
class StyleCoordinator
{
public:
    StyleCoordinator(WindowRegistry& registry, StyleConfig const& config);

    StyleCoordinator(StyleCoordinator const&) = delete;
    StyleCoordinator& operator=(StyleCoordinator const&) = delete;

    UiStyle current() const { return style_; }
    bool supports_native_effect() const { return native_effect_; }

    void set_style(UiStyle style);

private:
    WindowRegistry& registry_;
    StyleConfig const& config_;
    UiStyle style_ = UiStyle::Classic;
    bool native_effect_ = false;

    void apply_native(ManagedWindow const& window);
    void apply(ManagedWindow const& window);
};

} // namespace xpl
