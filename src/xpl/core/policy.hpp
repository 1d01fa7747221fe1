#pragma once

#include "xpl/core/types.hpp"
#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>

namespace xpl::placement_policy {

inline int16_t clamp_coord(int32_t value)
{
    return static_cast<int16_t>(std::clamp<int32_t>(
        value,
        std::numeric_limits<int16_t>::min(),
        std::numeric_limits<int16_t>::max()
    ));
}

/// Default size: the configured size, capped at 80% of the work area but never below the minimum.
inline uint16_t
default_extent(uint16_t configured, uint16_t minimum, uint16_t work_area_extent)
{
    uint32_t capped = std::min<uint32_t>(configured, static_cast<uint32_t>(work_area_extent) * 4 / 5);
    return static_cast<uint16_t>(std::max<uint32_t>(capped, minimum));
}

/**
 * @brief Geometry of a new top-level window
 *
 * With an origin the window is placed there; otherwise it is centered in the
 * work area.
 */
inline Geometry initial_geometry(
    Geometry const& work_area,
    uint16_t width,
    uint16_t height,
    uint16_t min_width,
    uint16_t min_height,
    std::optional<Point> origin
)
{
    Geometry geometry;
    geometry.width = default_extent(width, min_width, work_area.width);
    geometry.height = default_extent(height, min_height, work_area.height);

    if (origin)
    {
        geometry.x = clamp_coord(origin->x);
        geometry.y = clamp_coord(origin->y);
    }
    else
    {
        geometry.x = clamp_coord(
            static_cast<int32_t>(work_area.x) + (static_cast<int32_t>(work_area.width) - geometry.width) / 2
        );
        geometry.y = clamp_coord(
            static_cast<int32_t>(work_area.y) + (static_cast<int32_t>(work_area.height) - geometry.height) / 2
        );
    }
    return geometry;
}

/// Origin of a window spawned by dropping a tab on empty desktop space.
/// The offset keeps the new tab strip under the pointer.
inline Point drop_origin(Point drop_point, int32_t offset_x, int32_t offset_y)
{
    return { drop_point.x - offset_x, drop_point.y - offset_y };
}

} // namespace xpl::placement_policy

namespace xpl::tray_policy {

/**
 * @brief Decide whether a close request should hide the window instead
 *
 * Only the last live window is ever hidden, and never while the application
 * is quitting.
 */
inline bool should_hide_on_close(bool close_to_tray, bool quitting, size_t live_windows)
{
    if (!close_to_tray || quitting)
        return false;
    return live_windows == 1;
}

} // namespace xpl::tray_policy

namespace xpl::style_policy {

/**
 * @brief Native background for a style
 *
 * Glass is only translucent when the display can composite it; otherwise the
 * window keeps a solid background and its content simulates the effect.
 */
inline Background background_for(UiStyle style, bool native_effect, uint32_t classic_color)
{
    if (style == UiStyle::Glass && native_effect)
        return { Background::Kind::Translucent, 0 };
    return { Background::Kind::Solid, classic_color };
}

} // namespace xpl::style_policy

namespace xpl::drag_policy {

enum class DropDestination
{
    ExistingWindow,
    NewWindow,
};

/// A drop onto a window that has since gone away falls back to a new window.
inline DropDestination resolve_destination(std::optional<WindowId> target, bool target_live)
{
    if (target && *target != INVALID_WINDOW_ID && target_live)
        return DropDestination::ExistingWindow;
    return DropDestination::NewWindow;
}

} // namespace xpl::drag_policy
