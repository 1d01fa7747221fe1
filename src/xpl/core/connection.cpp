#include "connection.hpp"
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>

namespace xpl {

Connection::Connection()
    : conn_(nullptr, xcb_disconnect)
    , screen_(nullptr)
{
    int screen_number = 0;
    conn_.reset(xcb_connect(nullptr, &screen_number));
    screen_number_ = screen_number;

    if (xcb_connection_has_error(conn_.get()))
    {
        throw std::runtime_error("Failed to connect to X server");
    }

    auto iter = xcb_setup_roots_iterator(xcb_get_setup(conn_.get()));
    for (int i = 0; i < screen_number_ && iter.rem > 0; ++i)
    {
        xcb_screen_next(&iter);
    }
    screen_ = iter.data;
    if (!screen_)
    {
        throw std::runtime_error("Failed to get screen");
    }

    init_randr();
    find_argb_visual();
}

void Connection::init_randr()
{
    auto cookie = xcb_randr_query_version(conn_.get(), XCB_RANDR_MAJOR_VERSION, XCB_RANDR_MINOR_VERSION);
    auto* reply = xcb_randr_query_version_reply(conn_.get(), cookie, nullptr);
    if (!reply)
        return;

    free(reply);
    randr_available_ = true;
}

void Connection::find_argb_visual()
{
    for (auto depth_iter = xcb_screen_allowed_depths_iterator(screen_); depth_iter.rem;
         xcb_depth_next(&depth_iter))
    {
        if (depth_iter.data->depth != 32)
            continue;

        for (auto visual_iter = xcb_depth_visuals_iterator(depth_iter.data); visual_iter.rem;
             xcb_visualtype_next(&visual_iter))
        {
            if (visual_iter.data->_class == XCB_VISUAL_CLASS_TRUE_COLOR)
            {
                argb_visual_ = visual_iter.data->visual_id;
                return;
            }
        }
    }
}

Geometry Connection::primary_display() const
{
    Geometry fallback{ 0, 0, screen_->width_in_pixels, screen_->height_in_pixels };
    if (!randr_available_)
        return fallback;

    auto primary_cookie = xcb_randr_get_output_primary(conn_.get(), screen_->root);
    auto* primary = xcb_randr_get_output_primary_reply(conn_.get(), primary_cookie, nullptr);
    if (!primary)
        return fallback;

    xcb_randr_output_t output = primary->output;
    free(primary);
    if (output == XCB_NONE)
        return fallback;

    auto output_cookie = xcb_randr_get_output_info(conn_.get(), output, XCB_CURRENT_TIME);
    auto* output_info = xcb_randr_get_output_info_reply(conn_.get(), output_cookie, nullptr);
    if (!output_info)
        return fallback;

    xcb_randr_crtc_t crtc = output_info->crtc;
    free(output_info);
    if (crtc == XCB_NONE)
        return fallback;

    auto crtc_cookie = xcb_randr_get_crtc_info(conn_.get(), crtc, XCB_CURRENT_TIME);
    auto* crtc_info = xcb_randr_get_crtc_info_reply(conn_.get(), crtc_cookie, nullptr);
    if (!crtc_info)
        return fallback;

    Geometry result{ crtc_info->x, crtc_info->y, crtc_info->width, crtc_info->height };
    free(crtc_info);
    if (result.width == 0 || result.height == 0)
        return fallback;
    return result;
}

bool Connection::has_compositor() const
{
    std::string selection = "_NET_WM_CM_S" + std::to_string(screen_number_);
    xcb_atom_t atom = intern_atom(selection.c_str());
    if (atom == XCB_NONE)
        return false;

    auto cookie = xcb_get_selection_owner(conn_.get(), atom);
    auto* reply = xcb_get_selection_owner_reply(conn_.get(), cookie, nullptr);
    if (!reply)
        return false;

    bool owned = reply->owner != XCB_NONE;
    free(reply);
    return owned;
}

xcb_atom_t Connection::intern_atom(char const* name) const
{
    auto cookie = xcb_intern_atom(conn_.get(), 0, static_cast<uint16_t>(std::strlen(name)), name);
    auto* reply = xcb_intern_atom_reply(conn_.get(), cookie, nullptr);
    if (!reply)
        return XCB_NONE;
    xcb_atom_t atom = reply->atom;
    free(reply);
    return atom;
}

} // namespace xpl
