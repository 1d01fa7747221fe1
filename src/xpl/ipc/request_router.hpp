#pragma once

#include "xpl/drag/tab_transfer.hpp"
#include "xpl/ipc/protocol.hpp"
#include "xpl/style/style.hpp"
#include "xpl/tray/tray.hpp"
#include "xpl/window/registry.hpp"
#include <string_view>

namespace xpl {

/**
 * @brief Dispatch of requests from a window's content layer
 *
 * Each request names the channel it arrived on and is answered on the `reply`
 * channel when it carries a request_id. A request always acts on behalf of
 * its sender window; queries may name another window through `id`.
 *
 * Unknown channels and missing or invalid fields are answered with
 * `ok = false`. A record that is not valid TOML has no readable id and is
 * dropped.
 */
class RequestRouter
{
public:
    struct Outcome
    {
        bool ok = true;
        toml::table result;
    };

    RequestRouter(WindowRegistry& registry, TabTransfer& transfer, StyleCoordinator& style, TrayCoordinator& tray);

    RequestRouter(RequestRouter const&) = delete;
    RequestRouter& operator=(RequestRouter const&) = delete;

    /// Decode one record, act on it and send the reply if one is expected.
    void handle(WindowId sender, std::string_view record);

    Outcome dispatch(WindowId sender, protocol::Request const& request);

private:
    WindowRegistry& registry_;
    TabTransfer& transfer_;
    StyleCoordinator& style_;
    TrayCoordinator& tray_;

    Outcome transfer_tab(WindowId sender, toml::table const& body, bool to_new_window);
};

} // namespace xpl
