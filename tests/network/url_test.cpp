#include <gtest/gtest.h>
#include "labsync/network/url.hpp"

using namespace labsync;
using namespace labsync::network;

TEST(Url, ParsesSchemeHostPortAndTarget) {
    auto url = Url::parse("http://repo.example.org:8080/mytardis/api?x=1");
    ASSERT_TRUE(url.is_ok());
    EXPECT_EQ(url.value().scheme, "http");
    EXPECT_EQ(url.value().host, "repo.example.org");
    EXPECT_EQ(url.value().port, "8080");
    EXPECT_EQ(url.value().target, "/mytardis/api?x=1");
    EXPECT_FALSE(url.value().is_tls());
}

TEST(Url, DefaultsPortAndTarget) {
    auto plain = Url::parse("http://repo.example.org");
    ASSERT_TRUE(plain.is_ok());
    EXPECT_EQ(plain.value().port, "80");
    EXPECT_EQ(plain.value().target, "/");

    auto tls = Url::parse("HTTPS://repo.example.org");
    ASSERT_TRUE(tls.is_ok());
    EXPECT_EQ(tls.value().scheme, "https");
    EXPECT_EQ(tls.value().port, "443");
    EXPECT_TRUE(tls.value().is_tls());
}

TEST(Url, QueryWithoutPathGetsLeadingSlash) {
    auto url = Url::parse("http://host?a=b");
    ASSERT_TRUE(url.is_ok());
    EXPECT_EQ(url.value().target, "/?a=b");
}

TEST(Url, DropsUserInfoAndBracketsIpv6) {
    auto url = Url::parse("http://user:secret@[::1]:9000/");
    ASSERT_TRUE(url.is_ok());
    EXPECT_EQ(url.value().host, "::1");
    EXPECT_EQ(url.value().port, "9000");
    EXPECT_EQ(url.value().authority(), "[::1]:9000");
}

TEST(Url, RejectsMalformedInput) {
    EXPECT_TRUE(Url::parse("repo.example.org").error().is(ErrorKind::Configuration));
    EXPECT_TRUE(Url::parse("ftp://repo.example.org").is_error());
    EXPECT_TRUE(Url::parse("http://repo.example.org:abc/").is_error());
    EXPECT_TRUE(Url::parse("http://:8080/").is_error());
}

TEST(Url, AuthorityOmitsDefaultPort) {
    EXPECT_EQ(Url::parse("http://host:80/").value().authority(), "host");
    EXPECT_EQ(Url::parse("https://host:443/").value().authority(), "host");
    EXPECT_EQ(Url::parse("https://host:8443/").value().authority(), "host:8443");
}

TEST(Url, WithTargetKeepsOrigin) {
    auto base = Url::parse("https://host:8443/ignored").value();
    auto next = base.with_target("/api/v1/user/?format=json");
    EXPECT_EQ(next.host, "host");
    EXPECT_EQ(next.port, "8443");
    EXPECT_EQ(next.target, "/api/v1/user/?format=json");
    EXPECT_EQ(base.target, "/ignored");
}

TEST(UrlEncode, EscapesReservedCharacters) {
    EXPECT_EQ(url_encode("Alice Smith"), "Alice%20Smith");
    EXPECT_EQ(url_encode("a.b-c_d~e"), "a.b-c_d~e");
    EXPECT_EQ(url_encode("x@y.org"), "x%40y.org");
    EXPECT_EQ(url_encode("a/b&c=d"), "a%2Fb%26c%3Dd");
}

TEST(UrlEncode, BuildsOrderedQuery) {
    EXPECT_EQ(build_query({}), "");
    EXPECT_EQ(build_query({{"format", "json"}, {"title", "Microscope 1 - Alice"}}),
              "format=json&title=Microscope%201%20-%20Alice");
}
