#include "ewmh.hpp"
#include <cstring>
#include <stdexcept>
#include <xcb/xcb_icccm.h>

namespace xpl {

Ewmh::Ewmh(Connection& conn)
    : conn_(conn)
{
    xcb_intern_atom_cookie_t* cookies = xcb_ewmh_init_atoms(conn_.get(), &ewmh_);
    if (!xcb_ewmh_init_atoms_replies(&ewmh_, cookies, nullptr))
    {
        throw std::runtime_error("Failed to initialize EWMH atoms");
    }

    wm_protocols_ = conn_.intern_atom("WM_PROTOCOLS");
    wm_delete_window_ = conn_.intern_atom("WM_DELETE_WINDOW");
    wm_change_state_ = conn_.intern_atom("WM_CHANGE_STATE");
}

Ewmh::~Ewmh() { xcb_ewmh_connection_wipe(&ewmh_); }

void Ewmh::set_wm_name(xcb_window_t window, std::string const& name)
{
    xcb_ewmh_set_wm_name(&ewmh_, window, name.length(), name.c_str());
    xcb_icccm_set_wm_name(conn_.get(), window, XCB_ATOM_STRING, 8, name.length(), name.c_str());
}

void Ewmh::set_wm_class(xcb_window_t window, std::string const& instance, std::string const& class_name)
{
    // WM_CLASS is two NUL-terminated strings back to back
    std::string combined = instance;
    combined += '\0';
    combined += class_name;
    combined += '\0';
    xcb_icccm_set_wm_class(conn_.get(), window, combined.length(), combined.c_str());
}

void Ewmh::set_wm_pid(xcb_window_t window, uint32_t pid) { xcb_ewmh_set_wm_pid(&ewmh_, window, pid); }

void Ewmh::set_window_type_normal(xcb_window_t window)
{
    xcb_atom_t type = ewmh_._NET_WM_WINDOW_TYPE_NORMAL;
    xcb_ewmh_set_wm_window_type(&ewmh_, window, 1, &type);
}

void Ewmh::set_size_hints(
    xcb_window_t window,
    Geometry const& geometry,
    bool user_position,
    uint16_t min_width,
    uint16_t min_height
)
{
    xcb_size_hints_t hints;
    std::memset(&hints, 0, sizeof(hints));
    xcb_icccm_size_hints_set_min_size(&hints, min_width, min_height);
    xcb_icccm_size_hints_set_size(&hints, user_position, geometry.width, geometry.height);
    if (user_position)
    {
        // Without USPosition most window managers ignore the requested origin
        xcb_icccm_size_hints_set_position(&hints, 1, geometry.x, geometry.y);
    }
    xcb_icccm_set_wm_normal_hints(conn_.get(), window, &hints);
}

void Ewmh::set_delete_protocol(xcb_window_t window)
{
    xcb_atom_t protocols[] = { wm_delete_window_ };
    xcb_icccm_set_wm_protocols(conn_.get(), window, wm_protocols_, 1, protocols);
}

void Ewmh::request_activate(xcb_window_t window)
{
    xcb_ewmh_request_change_active_window(
        &ewmh_,
        conn_.screen_number(),
        window,
        XCB_EWMH_CLIENT_SOURCE_TYPE_NORMAL,
        XCB_CURRENT_TIME,
        XCB_NONE
    );
}

void Ewmh::request_toggle_maximized(xcb_window_t window)
{
    xcb_ewmh_request_change_wm_state(
        &ewmh_,
        conn_.screen_number(),
        window,
        XCB_EWMH_WM_STATE_TOGGLE,
        ewmh_._NET_WM_STATE_MAXIMIZED_VERT,
        ewmh_._NET_WM_STATE_MAXIMIZED_HORZ,
        XCB_EWMH_CLIENT_SOURCE_TYPE_NORMAL
    );
}

void Ewmh::request_iconify(xcb_window_t window)
{
    // ICCCM 4.1.4: WM_CHANGE_STATE with IconicState, sent to the root window
    xcb_client_message_event_t event{};
    event.response_type = XCB_CLIENT_MESSAGE;
    event.window = window;
    event.type = wm_change_state_;
    event.format = 32;
    event.data.data32[0] = XCB_ICCCM_WM_STATE_ICONIC;
    xcb_send_event(
        conn_.get(),
        0,
        conn_.screen()->root,
        XCB_EVENT_MASK_SUBSTRUCTURE_REDIRECT | XCB_EVENT_MASK_SUBSTRUCTURE_NOTIFY,
        reinterpret_cast<char const*>(&event)
    );
}

bool Ewmh::is_delete_message(xcb_client_message_event_t const& e) const
{
    return e.type == wm_protocols_ && e.format == 32 && e.data.data32[0] == wm_delete_window_;
}

} // namespace xpl
