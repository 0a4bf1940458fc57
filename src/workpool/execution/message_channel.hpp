/**
 * @file message_channel.hpp
 * @brief Length-prefixed JSON messages over a Unix stream socket.
 */
#pragma once
#include "workpool/common/common.hpp"

namespace workpool
{

/**
 * @brief One end of a bidirectional message channel.
 *
 * @details
 * Each message is a 4-byte big-endian length followed by that many bytes of
 * UTF-8 JSON. The channel owns its file descriptor and closes it on
 * destruction.
 *
 * Writes never raise SIGPIPE: a vanished peer is reported as a `false`
 * return from send().
 *
 * @par Thread Safety
 * - Not thread-safe. One thread sends and receives on a given end.
 */
class MessageChannel
{
public:
    /**
     * @brief Largest accepted message body in bytes.
     */
    static constexpr std::uint32_t k_max_message_bytes = 64u * 1024u * 1024u;

    MessageChannel() = default;
    explicit MessageChannel(int fd) noexcept;
    ~MessageChannel();

    MessageChannel(const MessageChannel&) = delete;
    MessageChannel& operator=(const MessageChannel&) = delete;
    MessageChannel(MessageChannel&& other) noexcept;
    MessageChannel& operator=(MessageChannel&& other) noexcept;

    /**
     * @brief Create a connected pair of channels.
     * @throws WorkerInitError if the socket pair cannot be created.
     */
    static std::pair<MessageChannel, MessageChannel> create_pair();

    /**
     * @brief Send one message.
     * @return False if the peer has closed its end or the write failed.
     * @throws ProtocolError if the message cannot be encoded (invalid UTF-8)
     *         or exceeds k_max_message_bytes. Nothing is written then.
     */
    bool send(const Json& message);

    /**
     * @brief Receive one message, blocking until it is complete.
     * @return The message, or std::nullopt if the peer closed the channel
     *         cleanly before a new message started.
     * @throws ProtocolError on a truncated frame, an oversized frame, a read
     *         error or a body that is not valid JSON.
     */
    std::optional<Json> receive();

    /**
     * @brief Wait until the channel is readable (data or EOF).
     * @param timeout Maximum time to wait; negative waits indefinitely.
     * @return True if readable before the timeout.
     */
    bool wait_readable(std::chrono::milliseconds timeout) const;

    int fd() const noexcept
    {
        return m_fd;
    }

    bool is_open() const noexcept
    {
        return m_fd >= 0;
    }

    void close() noexcept;

private:
    /**
     * @brief Read exactly @p size bytes.
     * @return Number of bytes read before EOF (== size unless EOF was hit).
     */
    size_t read_fully(char* buffer, size_t size);

    bool write_fully(const char* buffer, size_t size);

    int m_fd{-1};
};

} // namespace workpool
