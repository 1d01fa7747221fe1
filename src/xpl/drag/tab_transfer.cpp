/**
 * @file tab_transfer.cpp
 * @brief Tab drag and transfer between windows
 *
 * The lifecycle is:
 *   begin_drag -> update_pointer / set_drop_indicator (repeated) -> complete_drag | cancel_drag
 *
 * The content layer may also call complete_drag directly (transfer a tab via
 * its context menu, or tear it off without a tracked gesture).
 */

#include "tab_transfer.hpp"
#include "xpl/core/log.hpp"
#include "xpl/core/policy.hpp"
#include "xpl/ipc/protocol.hpp"

namespace xpl {

TabTransfer::TabTransfer(WindowRegistry& registry, WindowConfig const& config)
    : registry_(registry)
    , config_(config)
{
}

bool TabTransfer::begin_drag(WindowId source, TabData tab, Point pointer)
{
    if (session_ && !registry_.is_live(session_->source))
    {
        LOG_DEBUG("Discarding drag of tab {}: window {} closed", session_->tab.id, session_->source);
        forget_window(session_->source);
    }
    if (session_)
    {
        LOG_WARN(
            "Drag of tab {} from window {} rejected: tab {} from window {} is still being dragged",
            tab.id,
            source,
            session_->tab.id,
            session_->source
        );
        return false;
    }
    if (!registry_.is_live(source))
    {
        LOG_WARN("Drag of tab {} rejected: source window {} is not live", tab.id, source);
        return false;
    }

    LOG_DEBUG("Drag of tab {} started in window {} at {},{}", tab.id, source, pointer.x, pointer.y);
    session_ = DragSession{ source, std::move(tab), pointer, INVALID_WINDOW_ID };
    return true;
}

void TabTransfer::update_pointer(Point pointer)
{
    if (!session_)
        return;
    session_->pointer = pointer;
}

void TabTransfer::cancel_drag()
{
    if (!session_)
        return;

    LOG_DEBUG("Drag of tab {} cancelled", session_->tab.id);
    clear_indicator();
    session_.reset();
}

void TabTransfer::forget_window(WindowId id)
{
    if (!session_)
        return;

    if (session_->source == id)
    {
        LOG_DEBUG("Drag of tab {} ended: source window {} closed", session_->tab.id, id);
        clear_indicator();
        session_.reset();
    }
    else if (session_->indicator_target == id)
    {
        session_->indicator_target = INVALID_WINDOW_ID;
    }
}

std::map<WindowId, Geometry> TabTransfer::query_bounds_of_all_windows() const
{
    std::map<WindowId, Geometry> result;
    for (WindowId id : registry_.list())
    {
        auto const* window = registry_.get(id);
        if (!window || window->state != ManagedWindow::State::Visible)
            continue;
        if (auto bounds = registry_.bounds(id))
            result.emplace(id, *bounds);
    }
    return result;
}

void TabTransfer::set_drop_indicator(WindowId target, bool visible)
{
    if (session_)
    {
        if (visible && session_->indicator_target != INVALID_WINDOW_ID && session_->indicator_target != target)
            clear_indicator();
        if (visible)
            session_->indicator_target = target;
        else if (session_->indicator_target == target)
            session_->indicator_target = INVALID_WINDOW_ID;
    }

    registry_.deliver(target, protocol::drop_indicator_message(visible));
}

TransferResult TabTransfer::complete_drag(std::optional<WindowId> target, TabData tab, std::optional<Point> drop_point)
{
    if (!drop_point && session_)
        drop_point = session_->pointer;

    clear_indicator();
    session_.reset();

    TransferResult result;
    bool target_live = target && registry_.is_live(*target);
    switch (drag_policy::resolve_destination(target, target_live))
    {
        case drag_policy::DropDestination::ExistingWindow:
            LOG_DEBUG("Tab {} transferred to window {}", tab.id, *target);
            registry_.receive_tab(*target, std::move(tab));
            result.destination = *target;
            break;

        case drag_policy::DropDestination::NewWindow:
        {
            if (target && *target != INVALID_WINDOW_ID)
            {
                LOG_INFO("Drop target window {} is gone, opening tab {} in a new window", *target, tab.id);
            }

            std::optional<Point> origin;
            if (drop_point)
            {
                origin = placement_policy::drop_origin(*drop_point, config_.drop_offset_x, config_.drop_offset_y);
            }

            std::string tab_id = tab.id;
            result.destination = registry_.create(origin, std::move(tab));
            result.created_window = true;
            if (result.destination == INVALID_WINDOW_ID)
            {
                LOG_ERROR("Tab {} could not be placed: window creation failed", tab_id);
            }
            else
            {
                LOG_DEBUG("Tab {} opened in new window {}", tab_id, result.destination);
            }
            break;
        }
    }

    return result;
}

void TabTransfer::clear_indicator()
{
    if (!session_ || session_->indicator_target == INVALID_WINDOW_ID)
        return;

    registry_.deliver(session_->indicator_target, protocol::drop_indicator_message(false));
    session_->indicator_target = INVALID_WINDOW_ID;
}

} // namespace xpl
