#include "event_source.hpp"
#include "xpl/core/log.hpp"
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace xpl {

namespace {

constexpr size_t READ_CHUNK = 4096;

void set_nonblocking(int fd)
{
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0)
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    fcntl(fd, F_SETFD, FD_CLOEXEC);
}

// Payloads travel to content inside TOML strings, which must be UTF-8
bool is_valid_utf8(std::string_view text)
{
    size_t i = 0;
    while (i < text.size())
    {
        auto c = static_cast<unsigned char>(text[i]);
        if (c < 0x80)
        {
            ++i;
            continue;
        }

        size_t length = 0;
        uint32_t code = 0;
        if ((c & 0xE0) == 0xC0)
        {
            length = 2;
            code = c & 0x1F;
        }
        else if ((c & 0xF0) == 0xE0)
        {
            length = 3;
            code = c & 0x0F;
        }
        else if ((c & 0xF8) == 0xF0)
        {
            length = 4;
            code = c & 0x07;
        }
        else
        {
            return false;
        }

        if (i + length > text.size())
            return false;
        for (size_t k = 1; k < length; ++k)
        {
            auto next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80)
                return false;
            code = (code << 6) | (next & 0x3F);
        }

        // Overlong forms, surrogates and values past U+10FFFF
        constexpr uint32_t min_code[] = { 0, 0, 0x80, 0x800, 0x10000 };
        if (code < min_code[length] || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF))
            return false;
        i += length;
    }
    return true;
}

} // namespace

BackendEventSource::~BackendEventSource()
{
    close();
}

bool BackendEventSource::connect_socket(std::string const& path)
{
    close();

    sockaddr_un addr = {};
    if (path.size() >= sizeof(addr.sun_path))
    {
        LOG_ERROR("Backend socket path too long: {}", path);
        return false;
    }

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0)
    {
        LOG_ERROR("Failed to create backend socket: {}", std::strerror(errno));
        return false;
    }

    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, path.c_str(), path.size());
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0)
    {
        LOG_ERROR("Failed to connect to backend at {}: {}", path, std::strerror(errno));
        ::close(fd);
        return false;
    }

    LOG_INFO("Connected to backend at {}", path);
    adopt(fd);
    return true;
}

bool BackendEventSource::spawn(std::string const& command)
{
    close();

    int fds[2];
    if (pipe(fds) < 0)
    {
        LOG_ERROR("Failed to create backend pipe: {}", std::strerror(errno));
        return false;
    }

    pid_t pid = fork();
    if (pid < 0)
    {
        LOG_ERROR("Failed to fork backend: {}", std::strerror(errno));
        ::close(fds[0]);
        ::close(fds[1]);
        return false;
    }
    if (pid == 0)
    {
        setsid();
        dup2(fds[1], STDOUT_FILENO);
        ::close(fds[0]);
        ::close(fds[1]);
        execl("/bin/sh", "sh", "-c", command.c_str(), nullptr);
        _exit(127);
    }

    ::close(fds[1]);
    child_ = pid;
    LOG_INFO("Spawned backend (pid {}): {}", pid, command);
    adopt(fds[0]);
    return true;
}

void BackendEventSource::adopt(int fd)
{
    set_nonblocking(fd);
    fd_ = fd;
    partial_.clear();
}

bool BackendEventSource::read_available()
{
    if (fd_ < 0)
        return false;

    char buffer[READ_CHUNK];
    while (true)
    {
        ssize_t n = ::read(fd_, buffer, sizeof(buffer));
        if (n > 0)
        {
            feed(std::string_view(buffer, static_cast<size_t>(n)));
            continue;
        }
        if (n == 0)
        {
            if (!partial_.empty())
            {
                LOG_WARN("Backend stream ended mid-event, {} bytes discarded", partial_.size());
            }
            LOG_WARN("Backend event stream closed, no further events will be delivered");
            close();
            return false;
        }
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return true;

        LOG_ERROR("Backend read failed: {}", std::strerror(errno));
        close();
        return false;
    }
}

void BackendEventSource::feed(std::string_view data)
{
    partial_.append(data);

    size_t start = 0;
    size_t newline;
    while ((newline = partial_.find('\n', start)) != std::string::npos)
    {
        std::string line = partial_.substr(start, newline - start);
        start = newline + 1;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            continue;
        if (!is_valid_utf8(line))
        {
            LOG_WARN("Backend event of {} bytes dropped: not valid UTF-8", line.size());
            continue;
        }

        if (handler_)
            handler_(BackendEvent{ std::move(line) });
        else
            LOG_TRACE("Backend event dropped: no subscriber");
    }
    partial_.erase(0, start);
}

void BackendEventSource::close()
{
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
    if (child_ > 0)
    {
        // Reaped by the SIGCHLD handler
        kill(child_, SIGTERM);
        child_ = -1;
    }
}

} // namespace xpl
