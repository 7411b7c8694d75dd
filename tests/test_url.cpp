#include <gtest/gtest.h>

#include "net/http_client.hpp"
#include "net/url.hpp"

using namespace mcp_remote::net;

TEST(UrlTest, EncodeKeepsUnreserved) {
  EXPECT_EQ(url_encode("abc-_.~XYZ09"), "abc-_.~XYZ09");
  EXPECT_EQ(url_encode("a b&c=d/e"), "a%20b%26c%3Dd%2Fe");
  EXPECT_EQ(url_encode("http://localhost:8080/callback"), "http%3A%2F%2Flocalhost%3A8080%2Fcallback");
}

TEST(UrlTest, Decode) {
  EXPECT_EQ(url_decode("a%20b%26c"), "a b&c");
  EXPECT_EQ(url_decode("a+b"), "a b");
  EXPECT_EQ(url_decode("100%"), "100%");
  EXPECT_EQ(url_decode("%zz"), "%zz");
}

TEST(UrlTest, ParseQuery) {
  auto params = parse_query("code=abc%2F123&state=xyz&flag");
  EXPECT_EQ(params["code"], "abc/123");
  EXPECT_EQ(params["state"], "xyz");
  EXPECT_EQ(params["flag"], "");
  EXPECT_TRUE(parse_query("").empty());
}

TEST(UrlTest, AppendQuery) {
  EXPECT_EQ(append_query("https://a.example/authorize", {{"x", "1"}, {"y", "2 3"}}), "https://a.example/authorize?x=1&y=2%203");
  EXPECT_EQ(append_query("https://a.example/authorize?tenant=t", {{"x", "1"}}), "https://a.example/authorize?tenant=t&x=1");
  EXPECT_EQ(append_query("https://a.example/authorize?", {{"x", "1"}}), "https://a.example/authorize?x=1");
  EXPECT_EQ(append_query("https://a.example/p#frag", {{"x", "1"}}), "https://a.example/p?x=1#frag");
  EXPECT_EQ(append_query("https://a.example/p", {}), "https://a.example/p");
}

TEST(UrlTest, BuildFormBody) {
  EXPECT_EQ(build_form_body({{"grant_type", "authorization_code"}, {"code", "a b"}}), "code=a%20b&grant_type=authorization_code");
}

TEST(UrlTest, TrimTrailingSlashes) {
  EXPECT_EQ(trim_trailing_slashes("https://a.example/"), "https://a.example");
  EXPECT_EQ(trim_trailing_slashes("https://a.example//"), "https://a.example");
  EXPECT_EQ(trim_trailing_slashes("https://a.example"), "https://a.example");
}

// --- ParsedUrlTest ---

TEST(ParsedUrlTest, Parse) {
  auto url = ParsedUrl::parse("https://auth.example.com:8443/oauth/token?x=1");
  ASSERT_TRUE(url.has_value());
  EXPECT_EQ(url->scheme, "https");
  EXPECT_EQ(url->host, "auth.example.com");
  EXPECT_EQ(url->port, "8443");
  EXPECT_EQ(url->path, "/oauth/token");
  EXPECT_EQ(url->query, "?x=1");
  EXPECT_TRUE(url->is_https());
}

TEST(ParsedUrlTest, Defaults) {
  auto url = ParsedUrl::parse("http://localhost");
  ASSERT_TRUE(url.has_value());
  EXPECT_EQ(url->path, "/");
  EXPECT_EQ(url->port_or_default(), "80");
  EXPECT_EQ(ParsedUrl::parse("https://example.com/")->port_or_default(), "443");
}

TEST(ParsedUrlTest, Invalid) {
  EXPECT_FALSE(ParsedUrl::parse("ftp://example.com").has_value());
  EXPECT_FALSE(ParsedUrl::parse("not a url").has_value());
}

// --- ChunkedTest ---

TEST(ChunkedTest, Decode) {
  auto body = decode_chunked_body("4\r\nWiki\r\n5;ext=1\r\npedia\r\n0\r\n\r\n");
  ASSERT_TRUE(body.has_value());
  EXPECT_EQ(*body, "Wikipedia");
}

TEST(ChunkedTest, Malformed) {
  EXPECT_FALSE(decode_chunked_body("zz\r\nabc\r\n").has_value());
  EXPECT_FALSE(decode_chunked_body("10\r\nshort\r\n").has_value());
  EXPECT_FALSE(decode_chunked_body("4\r\nWiki\r\n").has_value());
}

TEST(FramedBodyTest, ContentLength) {
  HttpResponse response;
  response.headers["Content-Length"] = "5";
  response.body = "hell";
  EXPECT_FALSE(framed_body_complete(response));
  response.body = "hello";
  EXPECT_TRUE(framed_body_complete(response));

  response.headers["Content-Length"] = "five";
  EXPECT_FALSE(framed_body_complete(response));
}

TEST(FramedBodyTest, Chunked) {
  HttpResponse response;
  response.headers["Transfer-Encoding"] = "chunked";
  response.body = "4\r\nWiki\r\n";
  EXPECT_FALSE(framed_body_complete(response));
  response.body += "0\r\n\r\n";
  EXPECT_TRUE(framed_body_complete(response));
}

TEST(FramedBodyTest, CloseDelimitedIsNeverComplete) {
  HttpResponse response;
  response.body = "anything";
  EXPECT_FALSE(framed_body_complete(response));
}
