/**
 * @file test_connection.cpp
 * @brief Integration tests: Connection against a stub daemon socket
 */

#include "stub_daemon.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <mmbind/core/errors.hpp>
#include <mmbind_client/connection.hpp>

#include <atomic>
#include <chrono>
#include <sstream>
#include <string>
#include <vector>

using namespace mmbind::client;
using namespace mmbind::stub;
using mmbind::core::CommandError;
using mmbind::core::ConnectionError;
using mmbind::core::ParseError;
using mmbind::core::ProtocolUsageError;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

class ConnectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        mmbind::utils::Logger::instance().setLevel(mmbind::utils::LogLevel::WARN);
    }

    static std::vector<std::string> responses(const std::vector<ResponseFrame>& frames) {
        std::vector<std::string> result;
        for (const auto& frame : frames) {
            result.push_back(frame.responseText());
        }
        return result;
    }

    /// Handler answering every request with @p payload
    static StubDaemon::Handler always(std::string payload) {
        return [payload](StubSession& session) {
            while (session.readRequest()) {
                session.write(payload);
            }
        };
    }
};

// =============================================================================
// Request and reply
// =============================================================================

TEST_F(ConnectionTest, EchoRoundTrip) {
    StubDaemon daemon([](StubSession& session) {
        while (auto request = session.readRequest()) {
            session.write(reply({frame("node1", mmbind::utils::join(request->args))}));
        }
    });
    ASSERT_TRUE(daemon.listening());

    Connection conn(daemon.path());
    EXPECT_EQ(conn.state(), ConnectionState::CONNECTED);

    ResponseFrame result = conn.send("echo", {"hello", "there"});
    EXPECT_EQ(result.responseText(), "hello there");
    EXPECT_EQ(result.host, "node1");
    EXPECT_FALSE(result.hasError());
    EXPECT_FALSE(conn.streamingOutstanding());
    EXPECT_EQ(conn.state(), ConnectionState::CONNECTED);

    auto requests = daemon.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].command, "echo");
    EXPECT_THAT(requests[0].args, ElementsAre("hello", "there"));
}

TEST_F(ConnectionTest, SequentialRequests) {
    StubDaemon daemon(echoRequests);
    Connection conn(daemon.path());

    EXPECT_EQ(conn.send("vm info").responseText(), "vm info");
    EXPECT_EQ(conn.send("vm info", {"summary"}).responseText(), "vm info summary");
    EXPECT_EQ(conn.send("mesh degree", {"3"}).responseText(), "mesh degree 3");
    EXPECT_EQ(daemon.requests().size(), 3u);
}

TEST_F(ConnectionTest, ReplyAcrossChunks) {
    const std::string payload = reply({frame("node1", "split into pieces")});

    StubDaemon daemon([payload](StubSession& session) {
        while (session.readRequest()) {
            // Three fragments, none of them a complete document
            session.writeChunks(payload, (payload.size() + 2) / 3);
        }
    });

    Connection conn(daemon.path());
    EXPECT_EQ(conn.send("echo", {"split"}).responseText(), "split into pieces");
}

TEST_F(ConnectionTest, MultiByteCharacterSplitAcrossChunks) {
    const std::string text = "h\xC3\xA9llo w\xC3\xB6rld";
    const std::string payload = reply({frame("node1", text)});
    const size_t split = payload.find('\xC3') + 1;

    StubDaemon daemon([payload, split](StubSession& session) {
        while (session.readRequest()) {
            session.write(payload.substr(0, split));
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            session.write(payload.substr(split));
        }
    });

    Connection conn(daemon.path());
    EXPECT_EQ(conn.send("echo", {text}).responseText(), text);
}

TEST_F(ConnectionTest, LargeReplySpansManyReads) {
    const std::string big(5 * MSG_BLOCK_SIZE + 17, 'x');
    StubDaemon daemon(always(reply({frame("node1", big)})));

    Connection conn(daemon.path());
    EXPECT_EQ(conn.send("file get", {"big"}).responseText(), big);
}

// =============================================================================
// Streamed output
// =============================================================================

TEST_F(ConnectionTest, ExtraFramesMustBeDrained) {
    StubDaemon daemon([](StubSession& session) {
        while (auto request = session.readRequest()) {
            if (request->command == "file get") {
                session.write(reply({frame("n", "part1"), frame("n", "part2"), frame("n", "part3")}));
            } else {
                session.write(reply({frame("n", request->line())}));
            }
        }
    });

    Connection conn(daemon.path());

    ResponseFrame first = conn.send("file get", {"big.img"});
    EXPECT_EQ(first.responseText(), "part1");
    EXPECT_TRUE(conn.streamingOutstanding());
    EXPECT_EQ(conn.pendingFrames(), 2u);
    EXPECT_EQ(conn.state(), ConnectionState::AWAITING_DRAIN);

    EXPECT_THROW(conn.send("vm info"), ProtocolUsageError);
    // The rejected request never reached the daemon
    EXPECT_EQ(daemon.requests().size(), 1u);

    EXPECT_THAT(responses(conn.drainStream().collect()), ElementsAre("part2", "part3"));
    EXPECT_FALSE(conn.streamingOutstanding());
    EXPECT_EQ(conn.state(), ConnectionState::CONNECTED);

    // Draining again yields nothing and changes nothing
    EXPECT_TRUE(conn.drainStream().collect().empty());
    EXPECT_TRUE(conn.drainStream().collect().empty());
    EXPECT_EQ(conn.state(), ConnectionState::CONNECTED);

    EXPECT_EQ(conn.send("vm info").responseText(), "vm info");
}

TEST_F(ConnectionTest, StreamQueuesEveryFrame) {
    StubDaemon daemon(always(reply({frame("a", "1"), frame("b", "2")})));
    Connection conn(daemon.path());

    conn.stream("vm info");
    EXPECT_EQ(conn.pendingFrames(), 2u);
    EXPECT_EQ(conn.state(), ConnectionState::AWAITING_DRAIN);

    std::vector<std::string> hosts;
    for (const auto& f : conn.drainStream()) {
        hosts.push_back(f.host);
    }
    EXPECT_THAT(hosts, ElementsAre("a", "b"));
    EXPECT_EQ(conn.state(), ConnectionState::CONNECTED);
}

TEST_F(ConnectionTest, StreamIsLazy) {
    StubDaemon daemon(always(reply({frame("a", "1"), frame("b", "2"), frame("c", "3")})));
    Connection conn(daemon.path());

    conn.stream("vm info");
    FrameStream stream = conn.drainStream();

    auto one = stream.next();
    ASSERT_TRUE(one.has_value());
    EXPECT_EQ(one->responseText(), "1");
    EXPECT_EQ(conn.pendingFrames(), 2u);
    EXPECT_TRUE(conn.streamingOutstanding());

    EXPECT_THAT(responses(stream.collect()), ElementsAre("2", "3"));
    EXPECT_FALSE(stream.next().has_value());
}

TEST_F(ConnectionTest, ContinuationPayloads) {
    StubDaemon daemon([](StubSession& session) {
        while (session.readRequest()) {
            session.write(envelope({frame("n", "first")}, true));
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            session.write(envelope({frame("n", "second")}, true));
            session.write(envelope({frame("n", "third"), frame("n", "fourth")}, false));
        }
    });

    Connection conn(daemon.path());

    ResponseFrame first = conn.send("file get", {"big.img"});
    EXPECT_EQ(first.responseText(), "first");
    // Nothing queued yet, but the daemon announced more
    EXPECT_EQ(conn.pendingFrames(), 0u);
    EXPECT_TRUE(conn.streamingOutstanding());
    EXPECT_THROW(conn.send("vm info"), ProtocolUsageError);

    EXPECT_THAT(responses(conn.drainStream().collect()),
                ElementsAre("second", "third", "fourth"));
    EXPECT_FALSE(conn.streamingOutstanding());
}

TEST_F(ConnectionTest, EnvelopeWithoutMoreIsComplete) {
    StubDaemon daemon(always(envelope({frame("n", "only")}, false)));
    Connection conn(daemon.path());

    EXPECT_EQ(conn.send("vm info").responseText(), "only");
    EXPECT_FALSE(conn.streamingOutstanding());
}

TEST_F(ConnectionTest, EmptyReply) {
    StubDaemon daemon(always("[]"));
    Connection conn(daemon.path());

    ResponseFrame result = conn.send("clear capture");
    EXPECT_EQ(result.responseText(), "");
    EXPECT_FALSE(result.hasError());
    EXPECT_FALSE(conn.streamingOutstanding());
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(ConnectionTest, DaemonErrorRaisesCommandError) {
    StubDaemon daemon(always(reply({frame("n", "", "vm not found")})));
    Connection conn(daemon.path());

    try {
        conn.send("vm kill", {"foo"});
        FAIL() << "expected CommandError";
    } catch (const CommandError& e) {
        EXPECT_STREQ(e.what(), "vm not found");
        EXPECT_EQ(e.command(), "vm kill");
    }
    // A command error leaves the connection usable
    EXPECT_EQ(conn.state(), ConnectionState::CONNECTED);
}

TEST_F(ConnectionTest, CommandErrorKeepsFollowingFramesQueued) {
    StubDaemon daemon(always(reply({frame("n1", "", "failed here"), frame("n2", "ok there")})));
    Connection conn(daemon.path());

    EXPECT_THROW(conn.send("mesh send", {"all", "vm", "info"}), CommandError);
    EXPECT_EQ(conn.pendingFrames(), 1u);

    auto rest = conn.drainStream().collect();
    ASSERT_EQ(rest.size(), 1u);
    EXPECT_EQ(rest[0].host, "n2");
}

TEST_F(ConnectionTest, MalformedEnvelopeIsParseError) {
    StubDaemon daemon(always(R"({"Unexpected": true})"));
    Connection conn(daemon.path());

    EXPECT_THROW(conn.send("vm info"), ParseError);
}

TEST_F(ConnectionTest, PeerCloseMidReply) {
    std::atomic<int> sessions{0};
    StubDaemon daemon([&sessions](StubSession& session) {
        if (sessions++ == 0) {
            session.readRequest();
            session.write(R"([{"Response": "trunc)");
            session.close();
            return;
        }
        echoRequests(session);
    });

    Connection conn(daemon.path());
    try {
        conn.send("vm info");
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_THAT(e.what(), HasSubstr("socket closed"));
    }
    EXPECT_EQ(conn.state(), ConnectionState::DISCONNECTED);
    EXPECT_THROW(conn.send("vm info"), ConnectionError);

    conn.reconnect();
    EXPECT_EQ(conn.state(), ConnectionState::CONNECTED);
    EXPECT_EQ(conn.send("vm info").responseText(), "vm info");
    EXPECT_EQ(daemon.connections(), 2);
}

TEST_F(ConnectionTest, ReadTimeout) {
    StubDaemon daemon([](StubSession& session) {
        // Never answer; wait for the client to give up
        while (session.readRequest()) {
        }
    });

    Connection conn(daemon.path(), std::chrono::milliseconds(100));
    EXPECT_EQ(conn.timeout(), std::chrono::milliseconds(100));

    try {
        conn.send("vm info");
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_THAT(e.what(), HasSubstr("timed out"));
    }
    EXPECT_EQ(conn.state(), ConnectionState::DISCONNECTED);
}

TEST_F(ConnectionTest, ConnectFailure) {
    EXPECT_THROW(Connection("/tmp/mmbind-no-such-daemon.sock"), ConnectionError);

    Connection conn;
    EXPECT_EQ(conn.state(), ConnectionState::DISCONNECTED);
    EXPECT_THROW(conn.send("vm info"), ConnectionError);
    EXPECT_THROW(conn.connect("/tmp/mmbind-no-such-daemon.sock"), ConnectionError);
    EXPECT_EQ(conn.state(), ConnectionState::DISCONNECTED);
}

TEST_F(ConnectionTest, ConnectTwiceIsUsageError) {
    StubDaemon daemon(echoRequests);
    Connection conn(daemon.path());
    EXPECT_THROW(conn.connect(daemon.path()), ProtocolUsageError);
}

// =============================================================================
// Lifecycle
// =============================================================================

TEST_F(ConnectionTest, ReconnectDiscardsUnreadFrames) {
    StubDaemon daemon([](StubSession& session) {
        while (auto request = session.readRequest()) {
            if (request->command == "vm info") {
                session.write(reply({frame("a", "1"), frame("b", "2"), frame("c", "3")}));
            } else {
                session.write(reply({frame("n", request->line())}));
            }
        }
    });

    Connection conn(daemon.path());
    conn.send("vm info");
    ASSERT_EQ(conn.pendingFrames(), 2u);

    conn.reconnect();
    EXPECT_EQ(conn.pendingFrames(), 0u);
    EXPECT_FALSE(conn.streamingOutstanding());
    EXPECT_EQ(conn.state(), ConnectionState::CONNECTED);
    EXPECT_TRUE(conn.drainStream().collect().empty());

    EXPECT_EQ(conn.send("echo", {"again"}).responseText(), "echo again");
}

TEST_F(ConnectionTest, CloseIsTerminal) {
    StubDaemon daemon(echoRequests);
    Connection conn(daemon.path());

    conn.close();
    EXPECT_EQ(conn.state(), ConnectionState::CLOSED);
    EXPECT_THROW(conn.send("vm info"), ConnectionError);
    EXPECT_THROW(conn.reconnect(), ConnectionError);
    EXPECT_THROW(conn.connect(daemon.path()), ConnectionError);

    // Closing again is a no-op
    EXPECT_NO_THROW(conn.close());
}

TEST_F(ConnectionTest, OptionsAndMove) {
    StubDaemon daemon(echoRequests);

    ConnectionOptions options;
    options.path = daemon.path();
    options.timeout = std::chrono::seconds(5);

    Connection original(options);
    EXPECT_EQ(original.path(), daemon.path());

    Connection moved(std::move(original));
    EXPECT_EQ(moved.send("echo", {"moved"}).responseText(), "echo moved");
}

TEST_F(ConnectionTest, DebugParsingStillWorks) {
    const std::string payload = reply({frame("node1", "slow")});
    StubDaemon daemon([payload](StubSession& session) {
        while (session.readRequest()) {
            session.writeChunks(payload, 4, std::chrono::milliseconds(1));
        }
    });

    Connection conn(daemon.path());
    conn.setDebug(true);
    EXPECT_EQ(conn.send("echo").responseText(), "slow");
}

TEST_F(ConnectionTest, RoutineTrafficIsQuietAtInfo) {
    StubDaemon daemon(echoRequests);
    ASSERT_TRUE(daemon.listening());

    std::ostringstream captured;
    auto& logger = mmbind::utils::Logger::instance();
    logger.setSink(&captured);
    logger.setLevel(mmbind::utils::LogLevel::INFO);

    {
        Connection conn(daemon.path());
        EXPECT_EQ(conn.send("echo", {"quiet"}).responseText(), "echo quiet");
        conn.close();
    }

    logger.setSink(nullptr);
    logger.setLevel(mmbind::utils::LogLevel::WARN);
    EXPECT_EQ(captured.str(), "");
}
