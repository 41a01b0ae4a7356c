/**
 * @file connection.cpp
 * @brief Connection implementation: request encoding, incremental framing
 *        and the stream drain discipline.
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#include "mmbind_client/connection.hpp"

#include <mmbind/core/errors.hpp>
#include <mmbind/net/platform.hpp>
#include <mmbind/net/unix_socket.hpp>
#include <mmbind/utils/logger.hpp>
#include <mmbind/utils/string_utils.hpp>

#include <json/json.h>

#include <cstring>
#include <deque>

namespace mmbind {
namespace client {

const char* connectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED:   return "DISCONNECTED";
        case ConnectionState::CONNECTED:      return "CONNECTED";
        case ConnectionState::AWAITING_DRAIN: return "AWAITING_DRAIN";
        case ConnectionState::CLOSED:         return "CLOSED";
        default:                              return "UNKNOWN";
    }
}

// =============================================================================
// ConnectionImpl
// =============================================================================

class ConnectionImpl {
public:
    ConnectionImpl() {
        Json::CharReaderBuilder builder;
        builder["strictRoot"] = true;
        builder["failIfExtra"] = false;
        reader_.reset(builder.newCharReader());
    }

    ~ConnectionImpl() {
        if (socket_.isValid() && !socket_.close()) {
            LOG_WARN("Connection", "Failed to close socket {}: {}", path_,
                     std::strerror(socket_.getLastError()));
        }
    }

    void connect(const std::string& path, std::chrono::milliseconds timeout) {
        if (state_ == ConnectionState::CLOSED) {
            throw core::ConnectionError("connection is closed");
        }
        if (state_ != ConnectionState::DISCONNECTED) {
            throw core::ProtocolUsageError("already connected to " + path_);
        }

        path_ = path;
        timeout_ = timeout;

        net::UnixSocket socket;
        if (!socket.isValid()) {
            throw core::ConnectionError("failed to create socket: " +
                                        std::string(std::strerror(socket.getLastError())));
        }
        if (!socket.setTimeout(timeout)) {
            throw core::ConnectionError("failed to set socket timeout: " +
                                        std::string(std::strerror(socket.getLastError())));
        }
        if (!socket.connect(path)) {
            throw core::ConnectionError("failed to connect to " + path + ": " +
                                        std::strerror(socket.getLastError()));
        }

        socket_ = std::move(socket);
        buffer_.clear();
        state_ = ConnectionState::CONNECTED;
        LOG_DEBUG("Connection", "Connected to {}", path);
    }

    std::optional<ResponseFrame> send(const std::string& command,
                                      const std::vector<std::string>& args,
                                      bool streaming) {
        requireConnected();
        if (!queue_.empty() || continuation_) {
            throw core::ProtocolUsageError("unread streamed output");
        }
        if (!utils::trim(buffer_).empty()) {
            LOG_WARN("Connection", "Discarding {} stray bytes before '{}'",
                     buffer_.size(), command);
        }
        buffer_.clear();

        const std::string request = Connection::encodeRequest(command, args);
        LOG_DEBUG("Connection", "-> {}", request);

        const ssize_t sent = socket_.send(request.data(), request.size());
        if (sent < 0 || static_cast<size_t>(sent) != request.size()) {
            transportFailure("failed to write message");
        }

        std::vector<ResponseFrame> frames;
        bool more = readFrames(frames);
        while (frames.empty() && more && !streaming) {
            more = readFrames(frames);
        }
        continuation_ = more;

        std::optional<ResponseFrame> first;
        auto it = frames.begin();
        if (!streaming) {
            first = it == frames.end() ? ResponseFrame{} : std::move(*it++);
        }
        for (; it != frames.end(); ++it) {
            queue_.push_back(std::move(*it));
        }
        updateState();

        if (state_ == ConnectionState::AWAITING_DRAIN) {
            LOG_DEBUG("Connection", "'{}' left {} frames queued (more: {})",
                      command, queue_.size(), continuation_);
        }
        if (first && first->hasError()) {
            throw core::CommandError(command, first->error);
        }
        return first;
    }

    std::optional<ResponseFrame> nextFrame() {
        while (queue_.empty() && continuation_) {
            requireConnected();
            std::vector<ResponseFrame> frames;
            continuation_ = readFrames(frames);
            for (auto& frame : frames) {
                queue_.push_back(std::move(frame));
            }
        }

        if (queue_.empty()) {
            updateState();
            return std::nullopt;
        }

        ResponseFrame frame = std::move(queue_.front());
        queue_.pop_front();
        updateState();
        return frame;
    }

    void reconnect() {
        if (state_ == ConnectionState::CLOSED) {
            throw core::ConnectionError("connection is closed");
        }
        if (path_.empty()) {
            throw core::ConnectionError("no socket path to reconnect to");
        }

        if (!queue_.empty() || continuation_) {
            LOG_WARN("Connection", "Reconnect discards {} unread frames{}", queue_.size(),
                     continuation_ ? " and a pending continuation" : "");
        }
        queue_.clear();
        continuation_ = false;
        buffer_.clear();

        if (socket_.isValid() && !socket_.close()) {
            LOG_DEBUG("Connection", "Ignoring close error on {}: {}", path_,
                      std::strerror(socket_.getLastError()));
        }
        state_ = ConnectionState::DISCONNECTED;

        connect(path_, timeout_);
    }

    void close() {
        if (state_ == ConnectionState::CLOSED) {
            return;
        }

        const bool hadSocket = socket_.isValid();
        const bool closed = !hadSocket || socket_.close();
        const int error = socket_.getLastError();

        queue_.clear();
        continuation_ = false;
        buffer_.clear();
        state_ = ConnectionState::CLOSED;

        if (!closed) {
            throw core::ConnectionError("failed to close socket: " +
                                        std::string(std::strerror(error)));
        }
        LOG_DEBUG("Connection", "Closed connection to {}", path_);
    }

    ConnectionState state() const { return state_; }
    bool streamingOutstanding() const { return !queue_.empty() || continuation_; }
    size_t pendingFrames() const { return queue_.size(); }
    const std::string& path() const { return path_; }
    std::chrono::milliseconds timeout() const { return timeout_; }
    void setDebug(bool debug) { debug_ = debug; }

private:
    void requireConnected() const {
        if (state_ == ConnectionState::CLOSED) {
            throw core::ConnectionError("connection is closed");
        }
        if (state_ == ConnectionState::DISCONNECTED) {
            throw core::ConnectionError("not connected");
        }
    }

    void updateState() {
        if (state_ == ConnectionState::CONNECTED || state_ == ConnectionState::AWAITING_DRAIN) {
            state_ = streamingOutstanding() ? ConnectionState::AWAITING_DRAIN
                                            : ConnectionState::CONNECTED;
        }
    }

    /**
     * @brief Drop the socket after a transport error and throw.
     *
     * The stream position is unknown afterwards; only reconnect() recovers.
     */
    [[noreturn]] void transportFailure(const std::string& message) {
        LOG_ERROR("Connection", "{} ({})", message, path_);
        if (!socket_.close()) {
            LOG_DEBUG("Connection", "Ignoring close error on {}: {}", path_,
                      std::strerror(socket_.getLastError()));
        }
        continuation_ = false;
        buffer_.clear();
        state_ = ConnectionState::DISCONNECTED;
        throw core::ConnectionError(message);
    }

    /**
     * @brief Read one complete payload and decode its frames.
     * @return The payload's continuation flag
     */
    bool readFrames(std::vector<ResponseFrame>& frames) {
        const Json::Value payload = readPayload();

        const Json::Value* list = &payload;
        bool more = false;
        if (payload.isObject()) {
            if (!payload.isMember("Resp")) {
                throw core::ParseError("response object without 'Resp'");
            }
            list = &payload["Resp"];
            const Json::Value& flag = payload["More"];
            if (!flag.isNull() && !flag.isBool()) {
                throw core::ParseError("response field 'More' is not a boolean");
            }
            more = flag.asBool();
        }

        if (!list->isNull() && !list->isArray()) {
            throw core::ParseError("response frames are not a JSON array");
        }
        for (const auto& value : *list) {
            frames.push_back(ResponseFrame::fromJson(value));
        }
        return more;
    }

    Json::Value readPayload() {
        char chunk[MSG_BLOCK_SIZE];

        for (;;) {
            Json::Value root;
            if (tryParse(root)) {
                return root;
            }

            const ssize_t received = socket_.receive(chunk, sizeof(chunk));
            if (received == 0) {
                transportFailure("socket closed");
            }
            if (received < 0) {
                const int error = socket_.getLastError();
                if (net::isTimeoutError(error)) {
                    transportFailure("timed out waiting for response");
                }
                transportFailure("failed to read response: " +
                                 std::string(std::strerror(error)));
            }
            buffer_.append(chunk, static_cast<size_t>(received));
        }
    }

    /**
     * @brief Parse the buffer as one document. On success the consumed
     *        bytes leave the buffer; anything after them stays for the next
     *        payload.
     */
    bool tryParse(Json::Value& root) {
        if (utils::trim(buffer_).empty()) {
            return false;
        }

        std::string errors;
        const char* begin = buffer_.data();
        if (!reader_->parse(begin, begin + buffer_.size(), &root, &errors)) {
            if (debug_) {
                LOG_DEBUG("Connection", "Incomplete response ({} bytes): {}",
                          buffer_.size(), utils::trim(errors));
            } else {
                LOG_TRACE("Connection", "Incomplete response ({} bytes): {}",
                          buffer_.size(), utils::trim(errors));
            }
            return false;
        }

        const auto consumed = static_cast<size_t>(root.getOffsetLimit());
        buffer_.erase(0, consumed < buffer_.size() ? consumed : buffer_.size());
        LOG_TRACE("Connection", "Parsed response, {} bytes left over", buffer_.size());
        return true;
    }

    net::UnixSocket socket_{net::INVALID_SOCKET_HANDLE};
    std::unique_ptr<Json::CharReader> reader_;
    std::string path_;
    std::chrono::milliseconds timeout_{DEFAULT_TIMEOUT};
    ConnectionState state_ = ConnectionState::DISCONNECTED;

    std::string buffer_;              // raw bytes, decoded only by the parser
    std::deque<ResponseFrame> queue_;
    bool continuation_ = false;
    bool debug_ = false;
};

// =============================================================================
// FrameStream
// =============================================================================

std::optional<ResponseFrame> FrameStream::next() {
    if (done_ || !impl_) {
        return std::nullopt;
    }
    auto frame = impl_->nextFrame();
    if (!frame) {
        done_ = true;
    }
    return frame;
}

std::vector<ResponseFrame> FrameStream::collect() {
    std::vector<ResponseFrame> frames;
    while (auto frame = next()) {
        frames.push_back(std::move(*frame));
    }
    return frames;
}

// =============================================================================
// Connection
// =============================================================================

Connection::Connection()
    : impl_(std::make_unique<ConnectionImpl>())
{}

Connection::Connection(const std::string& path, std::chrono::milliseconds timeout)
    : impl_(std::make_unique<ConnectionImpl>())
{
    impl_->connect(path, timeout);
}

Connection::Connection(const ConnectionOptions& options)
    : Connection(options.path, options.timeout)
{}

Connection::~Connection() = default;

Connection::Connection(Connection&&) noexcept = default;
Connection& Connection::operator=(Connection&&) noexcept = default;

void Connection::connect(const std::string& path, std::chrono::milliseconds timeout) {
    impl_->connect(path, timeout);
}

ResponseFrame Connection::send(const std::string& command,
                               const std::vector<std::string>& args) {
    return *impl_->send(command, args, false);
}

void Connection::stream(const std::string& command, const std::vector<std::string>& args) {
    impl_->send(command, args, true);
}

FrameStream Connection::drainStream() {
    return FrameStream(impl_.get());
}

void Connection::reconnect() {
    impl_->reconnect();
}

void Connection::close() {
    impl_->close();
}

ConnectionState Connection::state() const {
    return impl_->state();
}

bool Connection::streamingOutstanding() const {
    return impl_->streamingOutstanding();
}

size_t Connection::pendingFrames() const {
    return impl_->pendingFrames();
}

const std::string& Connection::path() const {
    return impl_->path();
}

std::chrono::milliseconds Connection::timeout() const {
    return impl_->timeout();
}

void Connection::setDebug(bool debug) {
    impl_->setDebug(debug);
}

std::string Connection::encodeRequest(const std::string& command,
                                      const std::vector<std::string>& args) {
    Json::Value request(Json::objectValue);
    request["Command"] = command;
    request["Args"] = Json::Value(Json::arrayValue);
    for (const auto& arg : args) {
        request["Args"].append(arg);
    }

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    writer["emitUTF8"] = true;
    return Json::writeString(writer, request);
}

}  // namespace client
}  // namespace mmbind
