#include <gtest/gtest.h>
#include "mip/network/http_parser.hpp"
#include <string>

using namespace mip::network;

namespace {

mip::Result<bool> feed(HttpParser& parser, const std::string& data) {
    return parser.parse(data.data(), data.size());
}

} // namespace

TEST(HttpParser, ParsesRequestWithBody) {
    HttpParser parser;
    auto result = feed(parser,
                       "POST /api/records/3/approve HTTP/1.1\r\n"
                       "Host: localhost\r\n"
                       "Content-Type: application/json\r\n"
                       "Content-Length: 23\r\n"
                       "\r\n"
                       "{\"delete_source\": true}");
    ASSERT_TRUE(result.is_ok()) << result.error();
    EXPECT_TRUE(result.value());
    EXPECT_TRUE(parser.is_complete());

    const auto& request = parser.get_request();
    EXPECT_EQ(request.method, HttpMethod::POST);
    EXPECT_EQ(request.url, "/api/records/3/approve");
    EXPECT_EQ(request.version, HttpVersion::HTTP_1_1);
    EXPECT_EQ(request.get_header("content-type"), "application/json");
    EXPECT_EQ(request.body_as_string(), "{\"delete_source\": true}");
}

TEST(HttpParser, WaitsForMoreBytes) {
    HttpParser parser;
    auto partial = feed(parser, "GET /api/health HTTP/1.1\r\nHost: x\r\n");
    ASSERT_TRUE(partial.is_ok());
    EXPECT_FALSE(partial.value());

    auto rest = feed(parser, "\r\n");
    ASSERT_TRUE(rest.is_ok());
    EXPECT_TRUE(rest.value());
    EXPECT_TRUE(parser.get_request().body.empty());
}

TEST(HttpParser, BodySplitAcrossReads) {
    HttpParser parser;
    ASSERT_FALSE(feed(parser, "POST /x HTTP/1.0\r\nContent-Length: 6\r\n\r\nabc").value());
    auto done = feed(parser, "def");
    ASSERT_TRUE(done.is_ok());
    EXPECT_TRUE(done.value());
    EXPECT_EQ(parser.get_request().body_as_string(), "abcdef");
    EXPECT_EQ(parser.get_request().version, HttpVersion::HTTP_1_0);
}

TEST(HttpParser, RejectsMalformedInput) {
    HttpParser bad_line;
    EXPECT_TRUE(feed(bad_line, "GARBAGE\r\n\r\n").is_error());

    HttpParser bad_method;
    EXPECT_TRUE(feed(bad_method, "BREW /pot HTTP/1.1\r\n\r\n").is_error());

    HttpParser bad_version;
    EXPECT_TRUE(feed(bad_version, "GET / HTTP/2\r\n\r\n").is_error());

    HttpParser bad_header;
    EXPECT_TRUE(feed(bad_header, "GET / HTTP/1.1\r\nno colon here\r\n\r\n").is_error());

    HttpParser bad_length;
    EXPECT_TRUE(feed(bad_length, "POST / HTTP/1.1\r\nContent-Length: -5\r\n\r\n").is_error());
}

TEST(HttpParser, EnforcesSizeLimits) {
    HttpParser huge_body;
    const std::string head = "POST / HTTP/1.1\r\nContent-Length: " +
                             std::to_string(HttpParser::kMaxBodyBytes + 1) + "\r\n\r\n";
    EXPECT_TRUE(feed(huge_body, head).is_error());

    HttpParser huge_headers;
    const std::string endless = "GET / HTTP/1.1\r\nX-Fill: " + std::string(HttpParser::kMaxHeaderBytes, 'a');
    EXPECT_TRUE(feed(huge_headers, endless).is_error());
}

TEST(HttpParser, ResetAllowsReuse) {
    HttpParser parser;
    ASSERT_TRUE(feed(parser, "GET /a HTTP/1.1\r\n\r\n").value());
    parser.reset();
    EXPECT_FALSE(parser.is_complete());
    ASSERT_TRUE(feed(parser, "GET /b HTTP/1.1\r\n\r\n").value());
    EXPECT_EQ(parser.get_request().url, "/b");
}
