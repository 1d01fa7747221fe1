#pragma once

/**
 * @file invariants.hpp
 * @brief Debug checks for window registry invariants
 *
 * Enabled in debug builds, compiled out with NDEBUG. Violations are logged,
 * never fatal.
 *
 * Key invariants:
 * 1. Every registry key equals the record's id and is below the next id to issue
 * 2. Every record has a native window, and no two records share one
 * 3. A pending (seeded) tab satisfies the tab history invariant
 * 4. Only windows whose content is ready are Visible
 */

#include "log.hpp"
#include "types.hpp"
#include <type_traits>
#include <unordered_set>

namespace xpl::invariants {

#ifdef NDEBUG
#    define XPL_ASSERT_REGISTRY(windows, next_id)
#else

template<typename WindowMap>
inline void assert_registry(WindowMap const& windows, WindowId next_id)
{
    std::unordered_set<xcb_window_t> natives;
    for (auto const& [id, window] : windows)
    {
        if (id != window.id)
        {
            LOG_ERROR("INVARIANT VIOLATION: registry key {} holds window {}", id, window.id);
        }
        if (id == INVALID_WINDOW_ID || id >= next_id)
        {
            LOG_ERROR("INVARIANT VIOLATION: window id {} outside issued range (next {})", id, next_id);
        }
        if (window.native == XCB_NONE)
        {
            LOG_ERROR("INVARIANT VIOLATION: window {} has no native window", id);
        }
        else if (!natives.insert(window.native).second)
        {
            LOG_ERROR("INVARIANT VIOLATION: native window {:#x} registered twice", window.native);
        }
        if (window.pending_tab && !window.pending_tab->is_valid())
        {
            LOG_ERROR("INVARIANT VIOLATION: window {} seeded with tab {} outside its history", id, window.pending_tab->id);
        }
        if (window.state == std::decay_t<decltype(window)>::State::Visible && !window.content_ready)
        {
            LOG_ERROR("INVARIANT VIOLATION: window {} visible before content ready", id);
        }
    }
}

#    define XPL_ASSERT_REGISTRY(windows, next_id) ::xpl::invariants::assert_registry(windows, next_id)
#endif

} // namespace xpl::invariants
