#pragma once

#include "xpl/bridge/event_bridge.hpp"
#include "xpl/bridge/event_source.hpp"
#include "xpl/config/config.hpp"
#include "xpl/core/connection.hpp"
#include "xpl/core/ewmh.hpp"
#include "xpl/core/types.hpp"
#include "xpl/drag/tab_transfer.hpp"
#include "xpl/ipc/request_router.hpp"
#include "xpl/style/style.hpp"
#include "xpl/tray/tray.hpp"
#include "xpl/window/registry.hpp"
#include "xpl/window/x11_backend.hpp"

namespace xpl {

/**
 * @brief The application: owns every coordinator and runs the event loop
 *
 * Single-threaded. The loop polls the X connection, the backend event stream
 * and a self-pipe written by the SIGTERM/SIGINT handler. It ends once the
 * registry is empty or the X connection fails.
 */
class Shell
{
public:
    explicit Shell(Config config);
    ~Shell();

    Shell(Shell const&) = delete;
    Shell& operator=(Shell const&) = delete;

    void run();

private:
    Config config_;
    Connection conn_;
    Ewmh ewmh_;
    X11Backend backend_;
    WindowRegistry registry_;
    StyleCoordinator style_;
    TrayCoordinator tray_;
    TabTransfer transfer_;
    RequestRouter requests_;
    BackendEventSource events_;
    EventBridge bridge_;
    bool quit_requested_ = false;

    void connect_backend();
    void quit();

    // X events
    void handle_event(xcb_generic_event_t const& event);
    void handle_property_notify(xcb_property_notify_event_t const& e);
    void handle_client_message(xcb_client_message_event_t const& e);
    void handle_destroy_notify(xcb_destroy_notify_event_t const& e);
};

} // namespace xpl
