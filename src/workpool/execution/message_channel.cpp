#include "workpool/execution/message_channel.hpp"
#include "workpool/common/pool_errors.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace workpool
{

namespace
{

std::string errno_text(const char* what)
{
    return std::string(what) + ": " + std::strerror(errno);
}

} // namespace

MessageChannel::MessageChannel(int fd) noexcept
    : m_fd{fd}
{}

MessageChannel::~MessageChannel()
{
    close();
}

MessageChannel::MessageChannel(MessageChannel&& other) noexcept
    : m_fd{other.m_fd}
{
    other.m_fd = -1;
}

MessageChannel& MessageChannel::operator=(MessageChannel&& other) noexcept
{
    if (this != &other)
    {
        close();
        m_fd = other.m_fd;
        other.m_fd = -1;
    }
    return *this;
}

std::pair<MessageChannel, MessageChannel> MessageChannel::create_pair()
{
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) == -1)
    {
        throw WorkerInitError(errno_text("socketpair"));
    }
    return {MessageChannel{fds[0]}, MessageChannel{fds[1]}};
}

void MessageChannel::close() noexcept
{
    if (m_fd >= 0)
    {
        ::close(m_fd);
        m_fd = -1;
    }
}

bool MessageChannel::send(const Json& message)
{
    if (m_fd < 0)
    {
        return false;
    }

    std::string body;
    try
    {
        body = message.dump();
    }
    catch (const Json::exception& e)
    {
        throw ProtocolError(std::string("Cannot encode message: ") + e.what());
    }
    if (body.size() > k_max_message_bytes)
    {
        throw ProtocolError("Message of " + std::to_string(body.size()) + " bytes exceeds limit");
    }

    const auto size = static_cast<std::uint32_t>(body.size());
    unsigned char header[4] = {
        static_cast<unsigned char>((size >> 24) & 0xFF),
        static_cast<unsigned char>((size >> 16) & 0xFF),
        static_cast<unsigned char>((size >> 8) & 0xFF),
        static_cast<unsigned char>(size & 0xFF),
    };

    return write_fully(reinterpret_cast<const char*>(header), sizeof(header))
        && write_fully(body.data(), body.size());
}

std::optional<Json> MessageChannel::receive()
{
    if (m_fd < 0)
    {
        return std::nullopt;
    }

    unsigned char header[4];
    size_t got = read_fully(reinterpret_cast<char*>(header), sizeof(header));
    if (got == 0)
    {
        return std::nullopt;
    }
    if (got != sizeof(header))
    {
        throw ProtocolError("Truncated message header");
    }

    const std::uint32_t size =
        (static_cast<std::uint32_t>(header[0]) << 24) |
        (static_cast<std::uint32_t>(header[1]) << 16) |
        (static_cast<std::uint32_t>(header[2]) << 8) |
        static_cast<std::uint32_t>(header[3]);
    if (size > k_max_message_bytes)
    {
        throw ProtocolError("Message of " + std::to_string(size) + " bytes exceeds limit");
    }

    std::string body(size, '\0');
    if (size > 0 && read_fully(&body[0], size) != size)
    {
        throw ProtocolError("Truncated message body");
    }

    try
    {
        return Json::parse(body);
    }
    catch (const Json::parse_error& e)
    {
        throw ProtocolError(std::string("Malformed message: ") + e.what());
    }
}

bool MessageChannel::wait_readable(std::chrono::milliseconds timeout) const
{
    if (m_fd < 0)
    {
        return false;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;)
    {
        int wait_ms = -1;
        if (timeout.count() >= 0)
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            wait_ms = static_cast<int>(std::max<std::int64_t>(0, remaining.count()));
        }

        struct pollfd pfd{};
        pfd.fd = m_fd;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, wait_ms);
        if (rc > 0)
        {
            return true;
        }
        if (rc == 0)
        {
            return false;
        }
        if (errno != EINTR)
        {
            throw ProtocolError(errno_text("poll"));
        }
    }
}

size_t MessageChannel::read_fully(char* buffer, size_t size)
{
    size_t offset = 0;
    while (offset < size)
    {
        ssize_t n = ::recv(m_fd, buffer + offset, size - offset, 0);
        if (n > 0)
        {
            offset += static_cast<size_t>(n);
            continue;
        }
        if (n == 0)
        {
            break;
        }
        if (errno == EINTR)
        {
            continue;
        }
        if (errno == ECONNRESET)
        {
            break;
        }
        throw ProtocolError(errno_text("recv"));
    }
    return offset;
}

bool MessageChannel::write_fully(const char* buffer, size_t size)
{
    size_t offset = 0;
    while (offset < size)
    {
        ssize_t n = ::send(m_fd, buffer + offset, size - offset, MSG_NOSIGNAL);
        if (n > 0)
        {
            offset += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR)
        {
            continue;
        }
        return false;
    }
    return true;
}

} // namespace workpool
