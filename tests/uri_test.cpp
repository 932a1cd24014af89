#include <retrieve/error.hpp>
#include <retrieve/uri.hpp>

#include <gtest/gtest.h>

using retrieve::uri;

TEST(UriTest, ParsesComponents) {
    auto u = uri::parse("http://user@Example.COM:8080/a/b?x=1#top");
    EXPECT_EQ(u.scheme, "http");
    EXPECT_TRUE(u.has_authority);
    EXPECT_EQ(u.userinfo, "user");
    EXPECT_EQ(u.host, "Example.COM");
    ASSERT_TRUE(u.port.has_value());
    EXPECT_EQ(*u.port, 8080);
    EXPECT_EQ(u.path, "/a/b");
    EXPECT_EQ(u.query.value(), "x=1");
    EXPECT_EQ(u.fragment.value(), "top");
    EXPECT_EQ(u.str(), "http://user@Example.COM:8080/a/b?x=1#top");
}

TEST(UriTest, KeepsPercentEncodingAsWritten) {
    auto u = uri::parse("http://example.com/a%20b?q=%2F#x%41");
    EXPECT_EQ(u.path, "/a%20b");
    EXPECT_EQ(u.query.value(), "q=%2F");
    EXPECT_EQ(u.fragment.value(), "x%41");
    EXPECT_EQ(u.request_target(), "/a%20b?q=%2F");
}

TEST(UriTest, AuthorityForms) {
    auto u = uri::parse("http://Example.com:80/");
    EXPECT_EQ(u.authority(), "Example.com:80");
    EXPECT_EQ(u.normalized_authority(), "example.com");
    EXPECT_EQ(u.inferred_port(), 80);
    EXPECT_EQ(uri::parse("http://[::1]:81/").host, "[::1]");
    EXPECT_EQ(uri::parse("http://[::1]:81/").inferred_port(), 81);
    EXPECT_EQ(uri::parse("https://example.com").inferred_port(), 443);
}

TEST(UriTest, RequestTargetDropsSchemeAuthorityAndFragment) {
    EXPECT_EQ(uri::parse("http://example.com/path?q=1#frag").request_target(), "/path?q=1");
    EXPECT_EQ(uri::parse("http://example.com").request_target(), "/");
}

TEST(UriTest, MissingAuthority) {
    auto u = uri::parse("http:/");
    EXPECT_FALSE(u.has_authority);
    EXPECT_EQ(u.path, "/");
    auto f = uri::parse("file:///tmp/x");
    EXPECT_TRUE(f.has_authority);
    EXPECT_EQ(f.authority(), "");
    EXPECT_EQ(f.path, "/tmp/x");
}

TEST(UriTest, RejectsNonUriInput) {
    EXPECT_THROW(uri::parse("not a uri"), retrieve::invalid_uri);
    EXPECT_THROW(uri::parse("http://example.com:99999/"), retrieve::invalid_uri);
    EXPECT_THROW(uri::parse("http://example.com:8o/"), retrieve::invalid_uri);
    EXPECT_THROW(uri::parse("1http://example.com/"), retrieve::invalid_uri);
    EXPECT_THROW(uri::parse("http://[::1/"), retrieve::invalid_uri);
}

TEST(UriTest, ResolvesReferences) {
    auto base = uri::parse("http://a/b/c/d;p?q");
    EXPECT_EQ(base.resolve("g").str(), "http://a/b/c/g");
    EXPECT_EQ(base.resolve("./g").str(), "http://a/b/c/g");
    EXPECT_EQ(base.resolve("g/").str(), "http://a/b/c/g/");
    EXPECT_EQ(base.resolve("/g").str(), "http://a/g");
    EXPECT_EQ(base.resolve("//g").str(), "http://g");
    EXPECT_EQ(base.resolve("?y").str(), "http://a/b/c/d;p?y");
    EXPECT_EQ(base.resolve("#s").str(), "http://a/b/c/d;p?q#s");
    EXPECT_EQ(base.resolve("").str(), "http://a/b/c/d;p?q");
    EXPECT_EQ(base.resolve("..").str(), "http://a/b/");
    EXPECT_EQ(base.resolve("../g").str(), "http://a/b/g");
    EXPECT_EQ(base.resolve("../../../g").str(), "http://a/g");
    EXPECT_EQ(base.resolve("https://other.example/x").str(), "https://other.example/x");
}
