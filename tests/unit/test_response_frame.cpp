/**
 * @file test_response_frame.cpp
 * @brief Unit tests for response frame decoding and request encoding
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <mmbind/core/errors.hpp>
#include <mmbind_client/connection.hpp>
#include <mmbind_client/response_frame.hpp>

#include <json/json.h>

#include <memory>
#include <string>

using namespace mmbind::client;
using mmbind::core::ParseError;
using ::testing::ElementsAre;

class ResponseFrameTest : public ::testing::Test {
protected:
    static Json::Value parse(const std::string& text) {
        Json::CharReaderBuilder builder;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        Json::Value value;
        std::string errors;
        EXPECT_TRUE(reader->parse(text.data(), text.data() + text.size(), &value, &errors))
            << errors;
        return value;
    }
};

// =============================================================================
// Decoding
// =============================================================================

TEST_F(ResponseFrameTest, DecodesAllFields) {
    auto frame = ResponseFrame::fromJson(parse(R"({
        "Host": "node1",
        "Response": "hello there",
        "Header": ["name", "state"],
        "Tabular": [["vm0", "RUNNING"], ["vm1", "PAUSED"]],
        "Error": ""
    })"));

    EXPECT_EQ(frame.host, "node1");
    EXPECT_EQ(frame.responseText(), "hello there");
    EXPECT_THAT(frame.header, ElementsAre("name", "state"));
    ASSERT_EQ(frame.tabular.size(), 2u);
    EXPECT_THAT(frame.tabular[1], ElementsAre("vm1", "PAUSED"));
    EXPECT_FALSE(frame.hasError());
}

TEST_F(ResponseFrameTest, MissingFieldsDefault) {
    auto frame = ResponseFrame::fromJson(parse(R"({"Host": "node1"})"));

    EXPECT_EQ(frame.host, "node1");
    EXPECT_EQ(frame.responseText(), "");
    EXPECT_TRUE(frame.header.empty());
    EXPECT_TRUE(frame.tabular.empty());
    EXPECT_FALSE(frame.hasError());
}

TEST_F(ResponseFrameTest, NullFieldsDefault) {
    auto frame = ResponseFrame::fromJson(parse(
        R"({"Host": null, "Response": null, "Header": null, "Tabular": null, "Error": null})"));

    EXPECT_TRUE(frame.host.empty());
    EXPECT_EQ(frame.responseText(), "");
    EXPECT_FALSE(frame.hasError());
}

TEST_F(ResponseFrameTest, ErrorField) {
    auto frame = ResponseFrame::fromJson(parse(R"({"Host": "node1", "Error": "vm not found"})"));
    EXPECT_TRUE(frame.hasError());
    EXPECT_EQ(frame.error, "vm not found");
}

TEST_F(ResponseFrameTest, StructuredResponseAsCompactJson) {
    auto frame = ResponseFrame::fromJson(parse(R"({"Response": {"a": [1, 2]}})"));
    EXPECT_EQ(frame.responseText(), R"({"a":[1,2]})");
}

TEST_F(ResponseFrameTest, NonStringCellsAsCompactText) {
    auto frame = ResponseFrame::fromJson(parse(R"({
        "Header": ["id", 2],
        "Tabular": [[42, true, null, "vm0", [1, 2]], [-3, 1.5, false, "", {"k": "v"}]]
    })"));

    EXPECT_THAT(frame.header, ElementsAre("id", "2"));
    ASSERT_EQ(frame.tabular.size(), 2u);
    EXPECT_THAT(frame.tabular[0], ElementsAre("42", "true", "", "vm0", "[1,2]"));
    EXPECT_THAT(frame.tabular[1], ElementsAre("-3", "1.5", "false", "", R"({"k":"v"})"));
}

TEST_F(ResponseFrameTest, WrongShapesThrow) {
    EXPECT_THROW(ResponseFrame::fromJson(parse("[]")), ParseError);
    EXPECT_THROW(ResponseFrame::fromJson(parse(R"("text")")), ParseError);
    EXPECT_THROW(ResponseFrame::fromJson(parse(R"({"Host": 7})")), ParseError);
    EXPECT_THROW(ResponseFrame::fromJson(parse(R"({"Header": "name"})")), ParseError);
    EXPECT_THROW(ResponseFrame::fromJson(parse(R"({"Tabular": ["row"]})")), ParseError);
}

// =============================================================================
// Request encoding
// =============================================================================

TEST_F(ResponseFrameTest, EncodeRequest) {
    const std::string request = Connection::encodeRequest("vm info", {"summary"});

    // Compact: one line, no indentation
    EXPECT_EQ(request.find('\n'), std::string::npos);

    Json::Value value = parse(request);
    ASSERT_TRUE(value.isObject());
    EXPECT_EQ(value["Command"].asString(), "vm info");
    ASSERT_TRUE(value["Args"].isArray());
    ASSERT_EQ(value["Args"].size(), 1u);
    EXPECT_EQ(value["Args"][0].asString(), "summary");
}

TEST_F(ResponseFrameTest, EncodeRequestWithoutArgs) {
    Json::Value value = parse(Connection::encodeRequest("vm config", {}));
    ASSERT_TRUE(value["Args"].isArray());
    EXPECT_EQ(value["Args"].size(), 0u);
}

TEST_F(ResponseFrameTest, EncodeRequestKeepsUtf8) {
    const std::string request = Connection::encodeRequest("echo", {"h\xC3\xA9llo"});

    // Written as raw UTF-8 rather than \u escapes
    EXPECT_NE(request.find("h\xC3\xA9llo"), std::string::npos);
    EXPECT_EQ(parse(request)["Args"][0].asString(), "h\xC3\xA9llo");
}

TEST_F(ResponseFrameTest, EncodeRequestEscapesQuotes) {
    const std::string request = Connection::encodeRequest("echo", {"say \"hi\""});
    EXPECT_EQ(parse(request)["Args"][0].asString(), "say \"hi\"");
}

TEST_F(ResponseFrameTest, StateNames) {
    EXPECT_STREQ(connectionStateName(ConnectionState::DISCONNECTED), "DISCONNECTED");
    EXPECT_STREQ(connectionStateName(ConnectionState::CONNECTED), "CONNECTED");
    EXPECT_STREQ(connectionStateName(ConnectionState::AWAITING_DRAIN), "AWAITING_DRAIN");
    EXPECT_STREQ(connectionStateName(ConnectionState::CLOSED), "CLOSED");
}
