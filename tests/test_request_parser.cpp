#include "request_parser.hpp"

#include <gtest/gtest.h>
#include <random>

TEST(RequestParser, ParsesSimpleGet) {
    Request req = parseHTTPRequest("GET /index.html HTTP/1.1\r\nHost: example.com\r\nAccept: */*\r\n\r\n");

    EXPECT_EQ(req.method(), "GET");
    EXPECT_EQ(req.path(), "/index.html");
    ASSERT_EQ(req.headers().size(), 2u);
    EXPECT_EQ(req.headers().at("Host"), "example.com");
    EXPECT_EQ(req.headers().at("Accept"), "*/*");
    EXPECT_EQ(req.body(), "");
}

TEST(RequestParser, EmptyInputGivesEmptyRequest) {
    Request req = parseHTTPRequest("");

    EXPECT_EQ(req.method(), "");
    EXPECT_EQ(req.path(), "");
    EXPECT_TRUE(req.headers().empty());
    EXPECT_EQ(req.body(), "");
}

TEST(RequestParser, MissingRequestLineTokensAreEmpty) {
    Request only_method = parseHTTPRequest("GET\r\n\r\n");
    EXPECT_EQ(only_method.method(), "GET");
    EXPECT_EQ(only_method.path(), "");

    Request blank = parseHTTPRequest("   \r\nHost: x\r\n\r\n");
    EXPECT_EQ(blank.method(), "");
    EXPECT_EQ(blank.path(), "");
    EXPECT_EQ(blank.headers().at("Host"), "x");
}

TEST(RequestParser, ExtraRequestLineTokensAreIgnored) {
    Request req = parseHTTPRequest("POST  /submit   HTTP/1.1 trailing\r\n\r\n");
    EXPECT_EQ(req.method(), "POST");
    EXPECT_EQ(req.path(), "/submit");
}

TEST(RequestParser, BodyIsEverythingAfterBlankLine) {
    Request req = parseHTTPRequest(
        "POST /submit HTTP/1.1\r\nContent-Type: text/plain\r\n\r\nline one\r\nline two\r\n\r\nline four");

    EXPECT_EQ(req.body(), "line one\nline two\n\nline four");
}

TEST(RequestParser, BodyIgnoresContentLength) {
    Request req = parseHTTPRequest("POST /submit HTTP/1.1\r\nContent-Length: 2\r\n\r\n{\"a\":1}");
    EXPECT_EQ(req.body(), "{\"a\":1}");
}

TEST(RequestParser, AcceptsBareLineFeeds) {
    Request req = parseHTTPRequest("POST /submit HTTP/1.1\nContent-Type: application/json\n\n{}");

    EXPECT_EQ(req.headers().at("Content-Type"), "application/json");
    EXPECT_EQ(req.body(), "{}");
}

TEST(RequestParser, DropsMalformedHeaderLines) {
    Request req = parseHTTPRequest("GET / HTTP/1.1\r\nNoSeparator\r\nTight:value\r\nGood: yes\r\n\r\n");

    ASSERT_EQ(req.headers().size(), 1u);
    EXPECT_EQ(req.headers().at("Good"), "yes");
}

TEST(RequestParser, SplitsHeaderOnFirstSeparatorOnly) {
    Request req = parseHTTPRequest("GET / HTTP/1.1\r\nX-Note: a: b\r\n\r\n");
    EXPECT_EQ(req.headers().at("X-Note"), "a: b");
}

TEST(RequestParser, DuplicateHeaderLastWins) {
    Request req = parseHTTPRequest("GET / HTTP/1.1\r\nX-Id: 1\r\nX-Id: 2\r\n\r\n");
    EXPECT_EQ(req.headers().at("X-Id"), "2");
}

TEST(RequestParser, HeaderKeysKeepTheirCase) {
    Request req = parseHTTPRequest("GET / HTTP/1.1\r\ncontent-type: application/json\r\n\r\n");

    EXPECT_EQ(req.header("Content-Type"), nullptr);
    ASSERT_NE(req.header("content-type"), nullptr);
    EXPECT_EQ(*req.header("content-type"), "application/json");
}

TEST(RequestParser, WithoutBlankLineTrailingLinesAreHeadersAndBodyStaysEmpty) {
    Request req = parseHTTPRequest("POST /submit HTTP/1.1\r\nContent-Type: application/json\r\n{\"a\":1}");

    EXPECT_EQ(req.headers().size(), 1u);
    EXPECT_EQ(req.body(), "");
}

TEST(RequestParser, TrailingNewlineAfterBodyIsNotKept) {
    Request req = parseHTTPRequest("POST /submit HTTP/1.1\r\n\r\nhello\r\n");
    EXPECT_EQ(req.body(), "hello");
}

TEST(RequestParser, ParsingIsTotalOverArbitraryBytes) {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> byte(0, 255);
    std::uniform_int_distribution<int> length(0, 300);

    const std::string alphabet = "GET /\r\n: ";
    for (int round = 0; round < 500; ++round) {
        std::string raw;
        int n = length(rng);
        for (int i = 0; i < n; ++i) {
            int b = byte(rng);
            raw += (b % 3 == 0) ? alphabet[b % alphabet.size()] : static_cast<char>(b);
        }
        EXPECT_NO_THROW(parseHTTPRequest(raw));
    }
}
