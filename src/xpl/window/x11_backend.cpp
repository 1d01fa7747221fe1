#include "x11_backend.hpp"
#include "xpl/core/log.hpp"
#include "xpl/ipc/protocol.hpp"
#include <cstdlib>
#include <cstring>
#include <signal.h>
#include <string>
#include <unistd.h>

namespace xpl {

namespace {

constexpr uint32_t OPAQUE_ALPHA = 0xFF000000;
constexpr char const* WM_INSTANCE = "xpl-shell";
constexpr char const* WM_CLASS_NAME = "Xplorer";

} // namespace

X11Backend::X11Backend(Connection& conn, Ewmh& ewmh, ContentConfig const& content)
    : conn_(conn)
    , ewmh_(ewmh)
    , content_(content)
{
    utf8_string_ = conn_.intern_atom("UTF8_STRING");
    xpl_message_ = conn_.intern_atom("_XPL_MESSAGE");
    xpl_request_ = conn_.intern_atom("_XPL_REQUEST");
    xpl_content_ready_ = conn_.intern_atom("_XPL_CONTENT_READY");
    xpl_shell_window_ = conn_.intern_atom("_XPL_SHELL_WINDOW");
    xpl_visibility_ = conn_.intern_atom("_XPL_VISIBILITY");
    xpl_show_windows_ = conn_.intern_atom("_XPL_SHOW_WINDOWS");
    blur_region_ = conn_.intern_atom("_KDE_NET_WM_BLUR_BEHIND_REGION");

    native_effect_ = conn_.argb_visual().has_value() && conn_.has_compositor();
}

X11Backend::~X11Backend()
{
    for (auto const& [window, native] : windows_)
    {
        if (native.content_pid > 0)
            kill(native.content_pid, SIGTERM);
    }

    if (leader_ != XCB_NONE && !xcb_connection_has_error(conn_.get()))
    {
        xcb_delete_property(conn_.get(), conn_.screen()->root, xpl_shell_window_);
        xcb_destroy_window(conn_.get(), leader_);
        conn_.flush();
    }
}

xcb_window_t X11Backend::create_window(WindowId id, WindowOptions const& options)
{
    auto* screen = conn_.screen();
    xcb_window_t window = xcb_generate_id(conn_.get());

    NativeWindow native;
    native.argb = native_effect_;

    uint32_t event_mask = XCB_EVENT_MASK_STRUCTURE_NOTIFY | XCB_EVENT_MASK_PROPERTY_CHANGE;
    xcb_void_cookie_t cookie;
    if (native.argb)
    {
        xcb_visualid_t visual = *conn_.argb_visual();
        native.colormap = xcb_generate_id(conn_.get());
        xcb_create_colormap(conn_.get(), XCB_COLORMAP_ALLOC_NONE, native.colormap, screen->root, visual);

        uint32_t values[] = { OPAQUE_ALPHA, 0, event_mask, native.colormap };
        cookie = xcb_create_window_checked(
            conn_.get(),
            32,
            window,
            screen->root,
            options.geometry.x,
            options.geometry.y,
            options.geometry.width,
            options.geometry.height,
            0,
            XCB_WINDOW_CLASS_INPUT_OUTPUT,
            visual,
            XCB_CW_BACK_PIXEL | XCB_CW_BORDER_PIXEL | XCB_CW_EVENT_MASK | XCB_CW_COLORMAP,
            values
        );
    }
    else
    {
        uint32_t values[] = { screen->black_pixel, event_mask };
        cookie = xcb_create_window_checked(
            conn_.get(),
            XCB_COPY_FROM_PARENT,
            window,
            screen->root,
            options.geometry.x,
            options.geometry.y,
            options.geometry.width,
            options.geometry.height,
            0,
            XCB_WINDOW_CLASS_INPUT_OUTPUT,
            screen->root_visual,
            XCB_CW_BACK_PIXEL | XCB_CW_EVENT_MASK,
            values
        );
    }

    if (auto* err = xcb_request_check(conn_.get(), cookie))
    {
        LOG_ERROR("xcb_create_window failed for window {}: error code {}", id, err->error_code);
        free(err);
        if (native.colormap != XCB_NONE)
            xcb_free_colormap(conn_.get(), native.colormap);
        return XCB_NONE;
    }

    ewmh_.set_wm_name(window, options.title);
    ewmh_.set_wm_class(window, WM_INSTANCE, WM_CLASS_NAME);
    ewmh_.set_wm_pid(window, static_cast<uint32_t>(getpid()));
    ewmh_.set_window_type_normal(window);
    ewmh_.set_size_hints(window, options.geometry, options.user_position, options.min_width, options.min_height);
    ewmh_.set_delete_protocol(window);

    if (has_content_process())
        native.content_pid = spawn_content(id, window);

    windows_[window] = native;
    conn_.flush();
    return window;
}

void X11Backend::destroy_window(xcb_window_t window)
{
    release(window);
    xcb_destroy_window(conn_.get(), window);
    conn_.flush();
}

void X11Backend::release(xcb_window_t window)
{
    auto it = windows_.find(window);
    if (it == windows_.end())
        return;

    if (it->second.content_pid > 0)
        kill(it->second.content_pid, SIGTERM);
    if (it->second.colormap != XCB_NONE)
        xcb_free_colormap(conn_.get(), it->second.colormap);
    windows_.erase(it);
}

void X11Backend::show(xcb_window_t window)
{
    xcb_map_window(conn_.get(), window);
    conn_.flush();
}

void X11Backend::hide(xcb_window_t window)
{
    xcb_unmap_window(conn_.get(), window);

    // ICCCM 4.1.4: withdrawing needs a synthetic UnmapNotify on the root
    xcb_unmap_notify_event_t event{};
    event.response_type = XCB_UNMAP_NOTIFY;
    event.event = conn_.screen()->root;
    event.window = window;
    event.from_configure = 0;
    xcb_send_event(
        conn_.get(),
        0,
        conn_.screen()->root,
        XCB_EVENT_MASK_SUBSTRUCTURE_REDIRECT | XCB_EVENT_MASK_SUBSTRUCTURE_NOTIFY,
        reinterpret_cast<char const*>(&event)
    );
    conn_.flush();
}

void X11Backend::activate(xcb_window_t window)
{
    ewmh_.request_activate(window);
    conn_.flush();
}

void X11Backend::minimize(xcb_window_t window)
{
    ewmh_.request_iconify(window);
    conn_.flush();
}

void X11Backend::toggle_maximize(xcb_window_t window)
{
    ewmh_.request_toggle_maximized(window);
    conn_.flush();
}

std::optional<Geometry> X11Backend::query_bounds(xcb_window_t window) const
{
    auto geom_cookie = xcb_get_geometry(conn_.get(), window);
    auto trans_cookie = xcb_translate_coordinates(conn_.get(), window, conn_.screen()->root, 0, 0);

    auto* geom = xcb_get_geometry_reply(conn_.get(), geom_cookie, nullptr);
    auto* trans = xcb_translate_coordinates_reply(conn_.get(), trans_cookie, nullptr);
    if (!geom || !trans)
    {
        free(geom);
        free(trans);
        return std::nullopt;
    }

    Geometry result{ trans->dst_x, trans->dst_y, geom->width, geom->height };
    free(geom);
    free(trans);
    return result;
}

Geometry X11Backend::work_area() const { return conn_.primary_display(); }

bool X11Backend::set_background(xcb_window_t window, Background const& background)
{
    auto it = windows_.find(window);
    if (it == windows_.end())
        return false;
    bool argb = it->second.argb;

    uint32_t pixel = 0;
    if (background.kind == Background::Kind::Translucent)
    {
        if (!argb)
            return false;
        pixel = 0;
    }
    else
    {
        pixel = argb ? (OPAQUE_ALPHA | background.color) : background.color;
    }

    auto cookie = xcb_change_window_attributes_checked(conn_.get(), window, XCB_CW_BACK_PIXEL, &pixel);
    if (auto* err = xcb_request_check(conn_.get(), cookie))
    {
        LOG_DEBUG("Background change on {:#x} failed: error code {}", window, err->error_code);
        free(err);
        return false;
    }

    if (blur_region_ != XCB_NONE)
    {
        if (background.kind == Background::Kind::Translucent)
        {
            // An empty region asks the compositor to blur the whole window
            xcb_change_property(
                conn_.get(),
                XCB_PROP_MODE_REPLACE,
                window,
                blur_region_,
                XCB_ATOM_CARDINAL,
                32,
                0,
                nullptr
            );
        }
        else
        {
            xcb_delete_property(conn_.get(), window, blur_region_);
        }
    }

    xcb_clear_area(conn_.get(), 0, window, 0, 0, 0, 0);
    conn_.flush();
    return true;
}

void X11Backend::send(xcb_window_t window, ContentMessage const& message)
{
    std::string data = message.payload;
    data += protocol::RECORD_SEPARATOR;

    // Without a content process nobody drains the property: keep the latest record only
    uint8_t mode = has_content_process() ? XCB_PROP_MODE_APPEND : XCB_PROP_MODE_REPLACE;

    xcb_change_property(
        conn_.get(),
        mode,
        window,
        xpl_message_,
        utf8_string_,
        8,
        static_cast<uint32_t>(data.size()),
        data.data()
    );
    conn_.flush();
    LOG_TRACE("Sent {} to {:#x}", message.channel, window);
}

std::vector<std::string> X11Backend::take_requests(xcb_window_t window)
{
    std::vector<std::string> result;

    // delete=1 only removes the property when it was read completely
    auto cookie = xcb_get_property(conn_.get(), 1, window, xpl_request_, XCB_GET_PROPERTY_TYPE_ANY, 0, UINT32_MAX / 4);
    auto* reply = xcb_get_property_reply(conn_.get(), cookie, nullptr);
    if (!reply)
        return result;

    int length = xcb_get_property_value_length(reply);
    if (reply->format == 8 && length > 0)
    {
        std::string_view data(static_cast<char const*>(xcb_get_property_value(reply)), static_cast<size_t>(length));
        for (auto record : protocol::split_records(data))
            result.emplace_back(record);
    }
    if (reply->bytes_after > 0)
    {
        LOG_WARN("Request property on {:#x} truncated, {} bytes left unread", window, reply->bytes_after);
    }

    free(reply);
    return result;
}

xcb_window_t X11Backend::create_leader_window()
{
    auto* screen = conn_.screen();
    leader_ = xcb_generate_id(conn_.get());
    xcb_create_window(
        conn_.get(),
        XCB_COPY_FROM_PARENT,
        leader_,
        screen->root,
        -1,
        -1,
        1,
        1,
        0,
        XCB_WINDOW_CLASS_INPUT_ONLY,
        XCB_COPY_FROM_PARENT,
        0,
        nullptr
    );
    ewmh_.set_wm_name(leader_, WM_INSTANCE);
    ewmh_.set_wm_class(leader_, WM_INSTANCE, WM_CLASS_NAME);
    ewmh_.set_wm_pid(leader_, static_cast<uint32_t>(getpid()));

    xcb_change_property(
        conn_.get(),
        XCB_PROP_MODE_REPLACE,
        screen->root,
        xpl_shell_window_,
        XCB_ATOM_WINDOW,
        32,
        1,
        &leader_
    );
    xcb_change_property(
        conn_.get(),
        XCB_PROP_MODE_REPLACE,
        leader_,
        xpl_shell_window_,
        XCB_ATOM_WINDOW,
        32,
        1,
        &leader_
    );
    publish_visibility(VisibilityState{});
    return leader_;
}

void X11Backend::publish_visibility(VisibilityState const& state)
{
    if (leader_ == XCB_NONE)
        return;

    uint32_t values[] = { static_cast<uint32_t>(state.visible), static_cast<uint32_t>(state.hidden) };
    xcb_change_property(
        conn_.get(),
        XCB_PROP_MODE_REPLACE,
        leader_,
        xpl_visibility_,
        XCB_ATOM_CARDINAL,
        32,
        2,
        values
    );
    conn_.flush();
}

bool X11Backend::is_show_windows_message(xcb_client_message_event_t const& e) const
{
    return e.window == leader_ && e.type == xpl_show_windows_;
}

pid_t X11Backend::spawn_content(WindowId id, xcb_window_t window)
{
    pid_t pid = fork();
    if (pid < 0)
    {
        LOG_ERROR("Failed to fork content process for window {}", id);
        return -1;
    }
    if (pid == 0)
    {
        setsid();
        setenv("XPL_WINDOW_ID", std::to_string(id).c_str(), 1);
        setenv("XPL_NATIVE_WINDOW", std::to_string(window).c_str(), 1);
        execl("/bin/sh", "sh", "-c", content_.command.c_str(), nullptr);
        _exit(127);
    }

    LOG_DEBUG("Spawned content process {} for window {}", pid, id);
    return pid;
}

} // namespace xpl
