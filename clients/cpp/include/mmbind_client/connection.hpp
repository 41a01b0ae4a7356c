/**
 * @file connection.hpp
 * @brief Streaming client connection to the daemon's command socket.
 *
 * A request is one compact JSON object written in a single send:
 * @code
 * {"Command":"vm info","Args":["summary"]}
 * @endcode
 * The reply is a JSON array of response frames, or the envelope
 * {"Resp":[...],"More":true|false} when further payloads follow for the
 * same request. Replies carry no length prefix or delimiter; the receive
 * buffer is re-parsed after every chunk until it holds a complete document.
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#pragma once

#include "mmbind_client/export.hpp"
#include "mmbind_client/response_frame.hpp"

#include <chrono>
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mmbind {
namespace client {

// Forward declarations
class ConnectionImpl;

/// Default socket read/write timeout
constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{60000};

/// Size of each socket read
constexpr size_t MSG_BLOCK_SIZE = 4096;

/**
 * @brief Connection lifecycle.
 */
enum class ConnectionState {
    DISCONNECTED,    ///< No socket; connect() or reconnect() required
    CONNECTED,       ///< Ready for a request
    AWAITING_DRAIN,  ///< Streamed frames are unread; drainStream() required
    CLOSED           ///< close() was called; terminal
};

MMBIND_CLIENT_API const char* connectionStateName(ConnectionState state);

/**
 * @brief Where and how to connect.
 */
struct ConnectionOptions {
    std::string path;
    std::chrono::milliseconds timeout = DEFAULT_TIMEOUT;
};

/**
 * @class FrameStream
 * @brief Lazy, one-shot sequence of the frames left by a streamed request.
 *
 * Frames already received are handed out first; when they run out and the
 * daemon announced more, the next payload is read from the socket. The
 * stream borrows its Connection and must not outlive it.
 *
 * @code
 * conn.stream("vm info");
 * for (const auto& frame : conn.drainStream()) {
 *     std::cout << frame.host << ": " << frame.responseText() << "\n";
 * }
 * @endcode
 */
class MMBIND_CLIENT_API FrameStream {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = ResponseFrame;
        using difference_type = std::ptrdiff_t;
        using pointer = const ResponseFrame*;
        using reference = const ResponseFrame&;

        iterator() = default;

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++() {
            advance();
            return *this;
        }

        bool operator==(const iterator& other) const {
            return current_.has_value() == other.current_.has_value() &&
                   (!current_ || stream_ == other.stream_);
        }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        friend class FrameStream;

        explicit iterator(FrameStream* stream)
            : stream_(stream)
        {
            advance();
        }

        void advance() { current_ = stream_ ? stream_->next() : std::nullopt; }

        FrameStream* stream_ = nullptr;
        std::optional<ResponseFrame> current_;
    };

    /**
     * @brief Next frame, or nullopt once the stream is exhausted.
     * @throws core::ConnectionError if a continuation read fails.
     */
    std::optional<ResponseFrame> next();

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

    /**
     * @brief Consume the remaining frames into a vector.
     */
    std::vector<ResponseFrame> collect();

private:
    friend class Connection;

    explicit FrameStream(ConnectionImpl* impl)
        : impl_(impl)
    {}

    ConnectionImpl* impl_;
    bool done_ = false;
};

/**
 * @class Connection
 * @brief One Unix socket connection to the daemon.
 *
 * Only one request may be outstanding. If a reply carried more than one
 * frame (or announced a continuation), the unread frames must be drained
 * with drainStream() before the next send(); reconnect() discards them.
 *
 * Not safe for concurrent use.
 */
class MMBIND_CLIENT_API Connection {
public:
    /// Unconnected; call connect() before sending
    Connection();

    /**
     * @brief Connect immediately.
     * @throws core::ConnectionError if the socket cannot be connected.
     */
    explicit Connection(const std::string& path,
                        std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);

    explicit Connection(const ConnectionOptions& options);

    ~Connection();

    // Non-copyable
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Movable
    Connection(Connection&&) noexcept;
    Connection& operator=(Connection&&) noexcept;

    /**
     * @brief Connect to the daemon socket at @p path.
     * @throws core::ConnectionError on failure; there is no retry.
     * @throws core::ProtocolUsageError if already connected.
     */
    void connect(const std::string& path,
                 std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);

    /**
     * @brief Send a command and return its first response frame.
     *
     * Any further frames are queued and must be drained before the next
     * request.
     *
     * @throws core::ProtocolUsageError if streamed output is unread.
     * @throws core::ConnectionError on transport failure or timeout.
     * @throws core::CommandError if the returned frame carries an error.
     */
    ResponseFrame send(const std::string& command,
                       const std::vector<std::string>& args = {});

    /**
     * @brief Send a command and queue all of its frames for drainStream().
     */
    void stream(const std::string& command,
                const std::vector<std::string>& args = {});

    /**
     * @brief Frames queued by the last request.
     *
     * Draining an empty queue yields nothing and changes nothing.
     */
    FrameStream drainStream();

    /**
     * @brief Drop the socket and any unread frames, then connect again to
     *        the same path with the same timeout.
     */
    void reconnect();

    /**
     * @brief Close the socket. The connection cannot be used afterwards.
     * @throws core::ConnectionError if the socket fails to close.
     */
    void close();

    ConnectionState state() const;

    /// True while a request's frames are queued or still on the socket
    bool streamingOutstanding() const;

    /// Number of frames received but not yet drained
    size_t pendingFrames() const;

    const std::string& path() const;
    std::chrono::milliseconds timeout() const;

    /// Log incomplete-parse attempts at DEBUG instead of TRACE
    void setDebug(bool debug);

    /**
     * @brief Compact wire encoding of a request.
     */
    static std::string encodeRequest(const std::string& command,
                                     const std::vector<std::string>& args);

private:
    std::unique_ptr<ConnectionImpl> impl_;
};

}  // namespace client
}  // namespace mmbind
