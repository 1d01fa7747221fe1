#pragma once

#include "xpl/config/config.hpp"
#include "xpl/core/types.hpp"
#include "xpl/window/registry.hpp"
#include <map>
#include <optional>

namespace xpl {

struct TransferResult
{
    WindowId destination = INVALID_WINDOW_ID;
    bool created_window = false;
};

/**
 * @brief Cross-window tab drag state machine
 *
 *   Idle ──begin_drag──► Dragging ──complete_drag──► Idle
 *                           │
 *                           └──────cancel_drag─────► Idle
 *
 * Hit-testing happens in the dragging window's content: it pulls
 * query_bounds_of_all_windows() while the pointer moves and names the target
 * on drop. Tab membership is not tracked here; the source removes the tab
 * from its own set before it asks for the transfer.
 */
class TabTransfer
{
public:
    enum class State
    {
        Idle,
        Dragging
    };

    TabTransfer(WindowRegistry& registry, WindowConfig const& config);

    TabTransfer(TabTransfer const&) = delete;
    TabTransfer& operator=(TabTransfer const&) = delete;

    /// Rejected (false) while another session is active or if the source is not live.
    bool begin_drag(WindowId source, TabData tab, Point pointer);
    void update_pointer(Point pointer);
    void cancel_drag();

    /// A window is closing or gone: end its drag and forget it as indicator target.
    void forget_window(WindowId id);

    /// Bounds of the windows a tab can be dropped on (visible ones only).
    std::map<WindowId, Geometry> query_bounds_of_all_windows() const;

    void set_drop_indicator(WindowId target, bool visible);

    /**
     * @brief Hand the tab to exactly one destination
     *
     * A live target receives it (held until its content is ready); otherwise
     * a new window is created at the drop point (explicit, else the session's last pointer) and seeded with it.
     * Works with or without an active session and always ends it.
     */
    TransferResult complete_drag(
        std::optional<WindowId> target,
        TabData tab,
        std::optional<Point> drop_point = std::nullopt
    );

    State state() const { return session_ ? State::Dragging : State::Idle; }
    bool is_dragging() const { return session_.has_value(); }
    DragSession const* session() const { return session_ ? &*session_ : nullptr; }

private:
    WindowRegistry& registry_;
    WindowConfig const& config_;
    std::optional<DragSession> session_;

    void clear_indicator();
};

} // namespace xpl
