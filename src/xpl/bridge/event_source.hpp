#pragma once

#include "xpl/core/types.hpp"
#include <functional>
#include <string>
#include <string_view>
#include <sys/types.h>

namespace xpl {

/**
 * @brief Newline-framed event stream from the backend process
 *
 * The stream comes from a Unix stream socket or from the stdout of a spawned
 * command. The shell polls fd() and calls read_available() when it is
 * readable. Each complete line becomes one BackendEvent; a trailing partial
 * line is kept until the rest arrives.
 *
 * Framing: lines end with LF or CRLF (the CR is not part of the payload), and
 * empty lines are keep-alives. Payloads must be UTF-8 text; other lines are
 * dropped with a warning.
 */
class BackendEventSource
{
public:
    using Handler = std::function<void(BackendEvent const&)>;

    BackendEventSource() = default;
    ~BackendEventSource();

    BackendEventSource(BackendEventSource const&) = delete;
    BackendEventSource& operator=(BackendEventSource const&) = delete;

    bool connect_socket(std::string const& path);
    bool spawn(std::string const& command);

    /// Take ownership of an already open, readable descriptor.
    void adopt(int fd);

    /// Single subscriber; replaces any previous handler.
    void on_event(Handler handler) { handler_ = std::move(handler); }
    bool has_subscriber() const { return static_cast<bool>(handler_); }

    int fd() const { return fd_; }
    bool is_open() const { return fd_ >= 0; }

    /// Drain what is readable right now. Returns false once the stream ended.
    bool read_available();

    /// Frame raw bytes as if read from the descriptor.
    void feed(std::string_view data);

    void close();

private:
    int fd_ = -1;
    pid_t child_ = -1;
    std::string partial_;
    Handler handler_;
};

} // namespace xpl
