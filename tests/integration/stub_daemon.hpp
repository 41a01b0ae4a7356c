/**
 * @file stub_daemon.hpp
 * @brief In-process stand-in for the daemon's command socket
 *
 * Listens on a temporary Unix socket path and hands every accepted
 * connection to a test-supplied handler on a background thread.
 */

#pragma once

#include <mmbind/net/unix_socket.hpp>
#include <mmbind/utils/logger.hpp>
#include <mmbind/utils/string_utils.hpp>

#include <json/json.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mmbind {
namespace stub {

/**
 * @brief A decoded client request.
 */
struct StubRequest {
    std::string command;
    std::vector<std::string> args;

    /// "command arg1 arg2"
    std::string line() const {
        std::vector<std::string> parts{command};
        parts.insert(parts.end(), args.begin(), args.end());
        return utils::join(parts);
    }
};

/**
 * @brief Build one response frame object.
 */
inline Json::Value frame(const std::string& host, const std::string& response,
                         const std::string& error = "") {
    Json::Value value(Json::objectValue);
    value["Host"] = host;
    value["Response"] = response;
    value["Header"] = Json::Value(Json::nullValue);
    value["Tabular"] = Json::Value(Json::nullValue);
    value["Error"] = error;
    return value;
}

inline std::string compact(const Json::Value& value) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    writer["emitUTF8"] = true;
    return Json::writeString(writer, value);
}

/**
 * @brief Plain reply: a JSON array of frames.
 */
inline std::string reply(const std::vector<Json::Value>& frames) {
    Json::Value list(Json::arrayValue);
    for (const auto& f : frames) {
        list.append(f);
    }
    return compact(list);
}

/**
 * @brief Continuation envelope: {"Resp":[...],"More":more}.
 */
inline std::string envelope(const std::vector<Json::Value>& frames, bool more) {
    Json::Value list(Json::arrayValue);
    for (const auto& f : frames) {
        list.append(f);
    }
    Json::Value value(Json::objectValue);
    value["Resp"] = list;
    value["More"] = more;
    return compact(value);
}

/**
 * @class StubSession
 * @brief Server side of one accepted connection.
 */
class StubSession {
public:
    using Recorder = std::function<void(const StubRequest&)>;

    StubSession(net::UnixSocket socket, Recorder recorder)
        : socket_(std::move(socket))
        , recorder_(std::move(recorder))
    {
        Json::CharReaderBuilder builder;
        builder["strictRoot"] = true;
        reader_.reset(builder.newCharReader());
        socket_.setTimeout(std::chrono::seconds(5));
    }

    /**
     * @brief Read the next request.
     * @return nullopt once the client hangs up (or the read times out)
     */
    std::optional<StubRequest> readRequest() {
        char chunk[1024];
        for (;;) {
            if (!utils::trim(buffer_).empty()) {
                Json::Value root;
                std::string errors;
                if (reader_->parse(buffer_.data(), buffer_.data() + buffer_.size(),
                                   &root, &errors)) {
                    buffer_.clear();
                    StubRequest request;
                    request.command = root["Command"].asString();
                    for (const auto& arg : root["Args"]) {
                        request.args.push_back(arg.asString());
                    }
                    if (recorder_) {
                        recorder_(request);
                    }
                    return request;
                }
            }

            const ssize_t received = socket_.receive(chunk, sizeof(chunk));
            if (received <= 0) {
                return std::nullopt;
            }
            buffer_.append(chunk, static_cast<size_t>(received));
        }
    }

    bool write(const std::string& data) {
        return socket_.send(data.data(), data.size()) == static_cast<ssize_t>(data.size());
    }

    /**
     * @brief Write @p data in pieces of @p size bytes with a pause between
     *        them, so the client sees partial documents.
     */
    bool writeChunks(const std::string& data, size_t size,
                     std::chrono::milliseconds pause = std::chrono::milliseconds(20)) {
        for (size_t offset = 0; offset < data.size(); offset += size) {
            if (!write(data.substr(offset, size))) {
                return false;
            }
            std::this_thread::sleep_for(pause);
        }
        return true;
    }

    void close() { socket_.close(); }

private:
    net::UnixSocket socket_;
    Recorder recorder_;
    std::unique_ptr<Json::CharReader> reader_;
    std::string buffer_;
};

/**
 * @class StubDaemon
 * @brief Accept loop serving connections one at a time.
 *
 * Connections are served in order: the next accept happens once the
 * handler for the previous connection returns.
 */
class StubDaemon {
public:
    using Handler = std::function<void(StubSession&)>;

    explicit StubDaemon(Handler handler)
        : handler_(std::move(handler))
    {
        static std::atomic<int> counter{0};
        path_ = "/tmp/mmbind-test-" + std::to_string(::getpid()) + "-" +
                std::to_string(counter++) + ".sock";

        listener_.setTimeout(std::chrono::milliseconds(200));
        if (!listener_.bind(path_) || !listener_.listen(4)) {
            LOG_ERROR("StubDaemon", "Failed to listen on {}", path_);
            return;
        }
        listening_ = true;

        running_ = true;
        thread_ = std::thread([this]() { acceptLoop(); });
    }

    ~StubDaemon() {
        running_ = false;
        if (thread_.joinable()) {
            thread_.join();
        }
        listener_.close();
        ::unlink(path_.c_str());
    }

    StubDaemon(const StubDaemon&) = delete;
    StubDaemon& operator=(const StubDaemon&) = delete;

    bool listening() const { return listening_; }
    const std::string& path() const { return path_; }
    int connections() const { return connections_.load(); }

    /// Every request seen so far, across connections
    std::vector<StubRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    void acceptLoop() {
        while (running_) {
            net::UnixSocket peer = listener_.accept();
            if (!peer.isValid()) {
                continue;  // timeout; re-check running_
            }
            ++connections_;

            StubSession session(std::move(peer), [this](const StubRequest& request) {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(request);
            });
            handler_(session);
        }
    }

    Handler handler_;
    std::string path_;
    net::UnixSocket listener_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    bool listening_ = false;
    std::atomic<int> connections_{0};

    mutable std::mutex mutex_;
    std::vector<StubRequest> requests_;
};

/**
 * @brief Handler answering every request with one frame whose response
 *        is the request line.
 */
inline void echoRequests(StubSession& session) {
    while (auto request = session.readRequest()) {
        session.write(reply({frame("stub", request->line())}));
    }
}

}  // namespace stub
}  // namespace mmbind
