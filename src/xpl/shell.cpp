#include "shell.hpp"
#include "xpl/core/log.hpp"
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <poll.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

namespace xpl {

namespace {

int quit_pipe[2] = { -1, -1 };

void sigchld_handler(int /*sig*/)
{
    // Reap content and backend children
    int saved_errno = errno;
    while (waitpid(-1, nullptr, WNOHANG) > 0);
    errno = saved_errno;
}

void quit_handler(int /*sig*/)
{
    int saved_errno = errno;
    char byte = 'q';
    [[maybe_unused]] auto written = write(quit_pipe[1], &byte, 1);
    errno = saved_errno;
}

void setup_signal_handlers()
{
    if (pipe(quit_pipe) < 0)
        throw std::runtime_error("Failed to create signal pipe");
    for (int fd : quit_pipe)
    {
        fcntl(fd, F_SETFL, fcntl(fd, F_GETFL, 0) | O_NONBLOCK);
        fcntl(fd, F_SETFD, FD_CLOEXEC);
    }

    struct sigaction sa = {};
    sa.sa_handler = sigchld_handler;
    sa.sa_flags = SA_RESTART | SA_NOCLDSTOP;
    sigaction(SIGCHLD, &sa, nullptr);

    struct sigaction quit_sa = {};
    quit_sa.sa_handler = quit_handler;
    quit_sa.sa_flags = SA_RESTART;
    sigaction(SIGTERM, &quit_sa, nullptr);
    sigaction(SIGINT, &quit_sa, nullptr);
}

void drain(int fd)
{
    char buffer[64];
    while (read(fd, buffer, sizeof(buffer)) > 0);
}

} // namespace

Shell::Shell(Config config)
    : config_(std::move(config))
    , conn_()
    , ewmh_(conn_)
    , backend_(conn_, ewmh_, config_.content)
    , registry_(backend_, config_.window)
    , style_(registry_, config_.style)
    , tray_(registry_, config_.tray.close_to_tray)
    , transfer_(registry_, config_.window)
    , requests_(registry_, transfer_, style_, tray_)
    , bridge_(registry_)
{
    setup_signal_handlers();
    backend_.create_leader_window();
    tray_.set_visibility_listener([this](VisibilityState const& state) { backend_.publish_visibility(state); });

    connect_backend();

    if (registry_.create() == INVALID_WINDOW_ID)
        throw std::runtime_error("Failed to create the main window");
    conn_.flush();
}

Shell::~Shell()
{
    for (int& fd : quit_pipe)
    {
        if (fd >= 0)
        {
            close(fd);
            fd = -1;
        }
    }
}

void Shell::connect_backend()
{
    bool connected = false;
    if (!config_.backend.socket.empty())
        connected = events_.connect_socket(config_.backend.socket);
    else if (!config_.backend.command.empty())
        connected = events_.spawn(config_.backend.command);
    else
        LOG_INFO("No backend configured, running without backend events");

    if (connected)
        bridge_.subscribe(events_);
}

void Shell::quit()
{
    if (quit_requested_)
        return;
    quit_requested_ = true;

    LOG_INFO("Quit requested, closing {} window(s)", registry_.size());
    transfer_.cancel_drag();
    tray_.begin_quit();
    registry_.close_all();
    conn_.flush();
}

void Shell::run()
{
    pollfd fds[3] = {};
    fds[0].fd = xcb_get_file_descriptor(conn_.get());
    fds[0].events = POLLIN;
    fds[1].fd = quit_pipe[0];
    fds[1].events = POLLIN;
    fds[2].events = POLLIN;

    while (!registry_.empty())
    {
        // A closed backend stream drops out of the poll set (negative fds are ignored)
        fds[2].fd = events_.fd();

        int poll_result = poll(fds, 3, -1);
        if (poll_result < 0)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("poll failed: {}", std::strerror(errno));
            break;
        }

        if (fds[1].revents & POLLIN)
        {
            drain(quit_pipe[0]);
            quit();
        }

        if (fds[2].fd >= 0 && (fds[2].revents & (POLLIN | POLLHUP | POLLERR)))
            events_.read_available();

        while (auto event = xcb_poll_for_event(conn_.get()))
        {
            std::unique_ptr<xcb_generic_event_t, decltype(&free)> eventPtr(event, free);
            handle_event(*eventPtr);
        }

        if (xcb_connection_has_error(conn_.get()))
        {
            LOG_ERROR("X connection lost");
            break;
        }
    }

    LOG_INFO("All windows closed, {} backend event(s) delivered", bridge_.published());
}

// ─────────────────────────────────────────────────────────────────────────────
// X events
// ─────────────────────────────────────────────────────────────────────────────

void Shell::handle_event(xcb_generic_event_t const& event)
{
    uint8_t response_type = event.response_type & ~0x80;

    switch (response_type)
    {
        case XCB_PROPERTY_NOTIFY:
            handle_property_notify(reinterpret_cast<xcb_property_notify_event_t const&>(event));
            break;
        case XCB_CLIENT_MESSAGE:
            handle_client_message(reinterpret_cast<xcb_client_message_event_t const&>(event));
            break;
        case XCB_DESTROY_NOTIFY:
            handle_destroy_notify(reinterpret_cast<xcb_destroy_notify_event_t const&>(event));
            break;
        case 0:
        {
            auto const& err = reinterpret_cast<xcb_generic_error_t const&>(event);
            LOG_DEBUG("X error {} (major {}, minor {})", err.error_code, err.major_code, err.minor_code);
            break;
        }
        default:
            LOG_TRACE("Ignoring event type {}", response_type);
            break;
    }
}

void Shell::handle_property_notify(xcb_property_notify_event_t const& e)
{
    if (e.state != XCB_PROPERTY_NEW_VALUE)
        return;

    auto* window = registry_.find_by_native(e.window);
    if (!window)
        return;
    WindowId id = window->id;

    if (e.atom == backend_.content_ready_atom())
    {
        registry_.on_content_ready(id);
    }
    else if (e.atom == backend_.request_atom())
    {
        for (auto const& record : backend_.take_requests(e.window))
            requests_.handle(id, record);
    }
}

void Shell::handle_client_message(xcb_client_message_event_t const& e)
{
    if (backend_.is_show_windows_message(e))
    {
        LOG_DEBUG("Tray controller requested restore");
        tray_.show_all();
        return;
    }

    if (ewmh_.is_delete_message(e))
    {
        if (auto* window = registry_.find_by_native(e.window))
            registry_.request_close(window->id);
    }
}

void Shell::handle_destroy_notify(xcb_destroy_notify_event_t const& e)
{
    auto* window = registry_.find_by_native(e.window);
    if (!window)
        return;

    WindowId id = window->id;
    if (window->live())
    {
        // Destroyed behind our back (content crashed, killed by the WM)
        LOG_WARN("Window {} destroyed externally", id);
    }
    transfer_.forget_window(id);
    backend_.release(e.window);
    registry_.remove(id);
}

} // namespace xpl
