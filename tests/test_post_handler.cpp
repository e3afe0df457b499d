#include "post_handler.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

namespace {

Request postRequest(const std::string& path, const HeaderMap& headers, const std::string& body) {
    return Request("POST", path, headers, body);
}

}

TEST(PostHandler, EchoesJson) {
    RecordingLogSink log;
    Response resp = handlePost(postRequest("/submit", {{"Content-Type", "application/json"}}, "{\"a\":1}"),
                               "/submit", log);

    EXPECT_EQ(resp.statusCode, 200);
    EXPECT_EQ(resp.contentType, "text/plain");
    EXPECT_EQ(resp.body, "Received JSON: {\"a\":1}");
}

TEST(PostHandler, EchoesFormDataWithoutDecoding) {
    RecordingLogSink log;
    Response resp = handlePost(
        postRequest("/submit", {{"Content-Type", "application/x-www-form-urlencoded"}}, "name=a%20b&x=1"),
        "/submit", log);

    EXPECT_EQ(resp.statusCode, 200);
    EXPECT_EQ(resp.body, "Received form data: name=a%20b&x=1");
}

TEST(PostHandler, InvalidJsonIsStillEchoed) {
    RecordingLogSink log;
    Response resp = handlePost(postRequest("/submit", {{"Content-Type", "application/json"}}, "{not json"),
                               "/submit", log);

    EXPECT_EQ(resp.statusCode, 200);
    EXPECT_NE(resp.body.find("{not json"), std::string::npos);
}

TEST(PostHandler, MissingContentTypeIs415) {
    RecordingLogSink log;
    Response resp = handlePost(postRequest("/submit", {}, "{\"a\":1}"), "/submit", log);

    EXPECT_EQ(resp.statusCode, 415);
    EXPECT_EQ(resp.statusText, "Unsupported Media Type");
    EXPECT_EQ(resp.body, "Unsupported Content-Type");
    EXPECT_EQ(log.count("warn"), 1u);
}

TEST(PostHandler, OtherContentTypeIs415) {
    RecordingLogSink log;
    EXPECT_EQ(handlePost(postRequest("/submit", {{"Content-Type", "text/plain"}}, "x"), "/submit", log).statusCode, 415);
    // Parameters make it a different value.
    EXPECT_EQ(handlePost(postRequest("/submit", {{"Content-Type", "application/json; charset=utf-8"}}, "{}"),
                         "/submit", log).statusCode, 415);
}

// Real HTTP treats header names case-insensitively; this server does not.
TEST(PostHandler, HeaderNameLookupIsCaseSensitive) {
    RecordingLogSink log;
    Response resp = handlePost(postRequest("/submit", {{"content-type", "application/json"}}, "{}"), "/submit", log);

    EXPECT_EQ(resp.statusCode, 415);
}

TEST(PostHandler, OtherPathIs404) {
    RecordingLogSink log;
    Response resp = handlePost(postRequest("/upload", {{"Content-Type", "application/json"}}, "{}"), "/submit", log);

    EXPECT_EQ(resp.statusCode, 404);
    EXPECT_EQ(resp.body, "404 Not Found");
}

TEST(PostHandler, HonoursConfiguredSubmitPath) {
    RecordingLogSink log;
    Request req = postRequest("/api/echo", {{"Content-Type", "application/json"}}, "[]");

    EXPECT_EQ(handlePost(req, "/api/echo", log).statusCode, 200);
    EXPECT_EQ(handlePost(req, "/submit", log).statusCode, 404);
}
