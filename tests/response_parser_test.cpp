#include <retrieve/error.hpp>
#include <retrieve/pushback_stream.hpp>
#include <retrieve/response.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace retrieve;
using retrieve::testing::socket_pair;

namespace {

// Parses a complete response that the server sends before closing
response parse(const std::string& wire, bool expect_body = true) {
    socket_pair pair;
    pair.send(wire);
    pair.finish();
    pushback_stream s{std::move(pair.client)};
    response r;
    response_parser parser{s, r, expect_body};
    parser.run();
    return r;
}

}  // namespace

// ---------------------------------------------------------------------------
// Status line and headers
// ---------------------------------------------------------------------------
TEST(ResponseParserTest, ContentLengthBody) {
    auto r = parse("HTTP/1.1 200 OK\r\nContent-Length: 17\r\n\r\nExample response.\r\n\r\n");
    EXPECT_EQ(r.http_version, "1.1");
    EXPECT_EQ(r.status, "200");
    EXPECT_EQ(r.reason, "OK");
    EXPECT_EQ(r.body, "Example response.");
    EXPECT_EQ(r.headers.get("content-length").value(), "17");
}

TEST(ResponseParserTest, ContentLengthLeavesFollowingBytesUnread) {
    socket_pair pair;
    pair.send("HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nokHTTP/1.1 204 No Content\r\n\r\n");
    pushback_stream s{std::move(pair.client)};
    response first;
    response_parser{s, first}.run();
    EXPECT_EQ(first.body, "ok");
    response second;
    response_parser{s, second}.run();
    EXPECT_EQ(second.status, "204");
    EXPECT_EQ(second.reason, "No Content");
    EXPECT_TRUE(second.body.empty());
}

TEST(ResponseParserTest, ManyHeadersAnyCasing) {
    auto r = parse("HTTP/1.1 200 OK\r\n"
                   "Content-Length: 17\r\n"
                   "Content-type: text/plain\r\n"
                   "CoNneCtIoN: close\r\n"
                   "Cache-Control: private\r\n"
                   "P3p: CP='ALL IND DSP COR'\r\n"
                   "X-powered-by: C++\r\n"
                   "ETag: 42\r\n"
                   "date: Sat, 17 Oct 2026 10:00:00 GMT\r\n"
                   "\r\n"
                   "Example response.");
    EXPECT_EQ(r.headers.get("Content-Type").value(), "text/plain");
    EXPECT_EQ(r.headers.get("connection").value(), "close");
    EXPECT_EQ(r.headers.get("cache-control").value(), "private");
    EXPECT_EQ(r.headers.get("p3P").value(), "CP='ALL IND DSP COR'");
    EXPECT_EQ(r.headers.get("x-Powered-By").value(), "C++");
    EXPECT_EQ(r.headers.get("ETAG").value(), "42");
    EXPECT_TRUE(r.headers.has("Date"));
    EXPECT_EQ(r.headers.items()[1].first, "Content-type");
}

TEST(ResponseParserTest, RepeatedHeadersAreKept) {
    auto r = parse("HTTP/1.1 200 OK\r\nSet-Cookie: a=1\r\nSet-Cookie: b=2\r\nContent-Length: 0\r\n\r\n");
    EXPECT_EQ(r.headers.get_all("set-cookie"), (std::vector<std::string>{"a=1", "b=2"}));
}

TEST(ResponseParserTest, NoHeadersNoBody) {
    auto r = parse("HTTP/1.1 200 OK\r\n\r\n");
    EXPECT_TRUE(r.headers.empty());
    EXPECT_EQ(r.body, "");
}

TEST(ResponseParserTest, BogusStartLine) {
    EXPECT_THROW(parse("This is not HTTP.\r\n"), parse_error);
    EXPECT_THROW(parse("This is not HTTP.\n"), parse_error);
}

TEST(ResponseParserTest, StartLineInTheWrongPlace) {
    try {
        parse("\r\n\r\nHTTP/1.1 200 OK\r\n");
        FAIL() << "expected a parse error";
    } catch (const parse_error& err) {
        EXPECT_STREQ(err.what(), "HTTP start line was invalid.");
    }
}

TEST(ResponseParserTest, StartLineAfterBlankLineDeliveredSeparately) {
    socket_pair pair;
    pushback_stream s{std::move(pair.client)};
    response r;
    response_parser parser{s, r};

    pair.send("\r\n");
    EXPECT_EQ(parser.step(), parse_result::need_more);
    pair.send("HTTP/1.1 200 OK\r\n\r\n");
    EXPECT_EQ(parser.step(), parse_result::error);
    EXPECT_EQ(parser.error(), "HTTP start line was invalid.");
}

TEST(ResponseParserTest, EmptyReasonPhrase) {
    auto r = parse("HTTP/1.1 200 \r\nContent-Length: 0\r\n\r\n");
    EXPECT_EQ(r.status, "200");
    EXPECT_EQ(r.reason, "");
}

TEST(ResponseParserTest, LongHeaderLineWithinLimit) {
    std::string value(8000, 'a');
    auto r = parse("HTTP/1.1 200 OK\r\nX-Big: " + value + "\r\nContent-Length: 2\r\n\r\nok");
    EXPECT_EQ(r.headers.get("x-big").value(), value);
    EXPECT_EQ(r.body, "ok");
}

TEST(ResponseParserTest, OverlongHeaderLineIsAParseError) {
    EXPECT_THROW(parse("HTTP/1.1 200 OK\r\nX-Big: " + std::string(30000, 'a') +
                       "\r\nContent-Length: 2\r\n\r\nok"),
                 parse_error);
    EXPECT_THROW(parse("HTTP/1.1 200 OK\r\nX-Big: " + std::string(60000, 'a')), parse_error);
}

TEST(ResponseParserTest, OverlongReasonPhraseIsAParseError) {
    EXPECT_THROW(parse("HTTP/1.1 200 " + std::string(30000, 'K') + "\r\n\r\n"), parse_error);
}

TEST(ResponseParserTest, HeaderInTheWrongPlace) {
    EXPECT_THROW(parse("HTTP/1.1 200 OK\r\nSomething here.\r\nContent-Length: 17\r\n\r\nExample response.\r\n\r\n"),
                 parse_error);
}

TEST(ResponseParserTest, EmptyResponseIsPrematureClose) {
    EXPECT_THROW(parse(""), premature_close);
}

TEST(ResponseParserTest, TruncatedContentLengthBody) {
    EXPECT_THROW(parse("HTTP/1.1 200 OK\r\nContent-Length: 50\r\n\r\nshort"), premature_close);
}

TEST(ResponseParserTest, InvalidContentLength) {
    EXPECT_THROW(parse("HTTP/1.1 200 OK\r\nContent-Length: lots\r\n\r\nbody"), parse_error);
}

// ---------------------------------------------------------------------------
// Body framing
// ---------------------------------------------------------------------------
TEST(ResponseParserTest, MissingContentLengthReadsUntilClose) {
    auto r = parse("HTTP/1.1 200 OK\r\n\r\nExample response.\r\n\r\n");
    EXPECT_EQ(r.body, "Example response.\r\n\r\n");
}

TEST(ResponseParserTest, ChunkedBody) {
    auto r = parse("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                   "A  \r\nThis is a \r\n11\r\nchunked response.\r\n0    \r\n\r\n");
    EXPECT_EQ(r.body, "This is a chunked response.");
}

TEST(ResponseParserTest, ChunkedWinsOverContentLength) {
    auto r = parse("HTTP/1.1 200 OK\r\nContent-Length: 3\r\nTransfer-Encoding: Chunked\r\n\r\n"
                   "5\r\nhello\r\n0\r\n\r\n");
    EXPECT_EQ(r.body, "hello");
}

TEST(ResponseParserTest, UnparsableChunkSize) {
    EXPECT_THROW(parse("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                       "This is a bogus chunked response.\r\n\r\n"),
                 parse_error);
}

TEST(ResponseParserTest, MissingChunkTerminator) {
    try {
        parse("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
              "A  \r\nThis is a bogus chunked response.\r\n0    \r\n\r\n");
        FAIL() << "expected a parse error";
    } catch (const parse_error& err) {
        EXPECT_NE(std::string{err.what()}.find("Expected CRLF after chunk"), std::string::npos);
    }
}

TEST(ResponseParserTest, NoBodyForHeadOrNoContent) {
    auto head = parse("HTTP/1.1 200 OK\r\nContent-Length: 17\r\n\r\n", false);
    EXPECT_EQ(head.body, "");
    auto not_modified = parse("HTTP/1.1 304 Not Modified\r\nETag: 1\r\n\r\n");
    EXPECT_EQ(not_modified.body, "");
}

// ---------------------------------------------------------------------------
// Incremental stepping
// ---------------------------------------------------------------------------
TEST(ResponseParserTest, StepsAcrossSplitDelivery) {
    socket_pair pair;
    pushback_stream s{std::move(pair.client)};
    response r;
    response_parser parser{s, r};

    pair.send("HTTP/1.1 20");
    EXPECT_EQ(parser.step(), parse_result::need_more);
    EXPECT_EQ(parser.current_state(), response_parser::state::status_line);

    pair.send("0 OK\r\nContent-Le");
    EXPECT_EQ(parser.step(), parse_result::done);
    EXPECT_EQ(parser.current_state(), response_parser::state::headers);
    EXPECT_EQ(parser.step(), parse_result::need_more);

    pair.send("ngth: 4\r\n\r\nbody");
    while(parser.current_state() != response_parser::state::complete) {
        ASSERT_NE(parser.step(), parse_result::error) << parser.error();
    }
    EXPECT_EQ(r.status, "200");
    EXPECT_EQ(r.body, "body");
}

TEST(ResponseParserTest, StepReportsErrorsWithoutThrowing) {
    socket_pair pair;
    pair.send("garbage\r\n");
    pushback_stream s{std::move(pair.client)};
    response r;
    response_parser parser{s, r};
    EXPECT_EQ(parser.step(), parse_result::error);
    EXPECT_EQ(parser.error(), "Response missing HTTP start line.");
}
